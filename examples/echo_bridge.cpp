// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file echo_bridge.cpp
/// @brief Local agent bridge that greets, echoes questions and serves a sample card
///
/// Speaks the bridge protocol on stdin/stdout, so chat_console can run without
/// a remote agent:
///
///   CHATCONSOLE_BRIDGE_PATH=./echo_bridge ./chat_console
///
/// Asking "card" returns an adaptive card; answering it (a JSON object) is
/// acknowledged with the received values.

#include <chatconsole/chatconsole.hpp>
#include <iostream>
#include <string>

namespace
{

using chatconsole::json;

constexpr const char* kConversationId = "echo-conversation";

struct EchoAgent
{
    chatconsole::JsonRpcClient& rpc;
    bool verbose = false;
    int next_activity = 1;

    json activity(const std::string& type, const std::string& text = {})
    {
        chatconsole::Activity a;
        a.type = type;
        a.id = "echo-" + std::to_string(next_activity++);
        if (!text.empty())
            a.text = text;
        a.from = chatconsole::ChannelAccount{"echo-agent", std::string("Echo"), std::string("bot")};
        a.conversation = chatconsole::ConversationAccount{kConversationId, std::nullopt, std::nullopt};
        return a;
    }

    void send(const std::string& stream_id, const json& turn)
    {
        rpc.notify("conversation.activity", json{{"streamId", stream_id}, {"activity", turn}});
    }

    static json sample_card()
    {
        return json{
            {"type", "AdaptiveCard"},
            {"version", "1.5"},
            {"body",
             json::array({
                 {{"type", "TextBlock"}, {"text", "Tell us about yourself"}},
                 {{"type", "Input.Text"}, {"id", "name"}, {"label", "Your name"}},
                 {{"type", "Input.ChoiceSet"},
                  {"id", "color"},
                  {"label", "Favourite color"},
                  {"choices",
                   json::array({
                       {{"title", "Red"}, {"value", "red"}},
                       {{"title", "Green"}, {"value", "green"}},
                       {{"title", "Blue"}, {"value", "blue"}},
                   })}},
                 {{"type", "Input.Toggle"}, {"id", "subscribe"}, {"label", "Subscribe"}},
             })},
        };
    }

    json handle(const std::string& method, const json& params)
    {
        if (verbose)
            std::cerr << "echo_bridge: " << method << " " << params.dump() << std::endl;

        if (method == "initialize")
            return json{{"protocolVersion", chatconsole::kBridgeProtocolVersion}, {"bridge", "echo"}};

        std::string stream_id = params.value("streamId", "");
        if (method == "conversation.start")
        {
            if (params.value("emitStartConversationEvent", false))
                send(stream_id, activity(chatconsole::activity_types::kMessage, "Hello! I am the echo agent."));
            return json{{"conversationId", kConversationId}};
        }

        if (method == "conversation.ask")
        {
            std::string text = params.value("text", "");
            send(stream_id, activity(chatconsole::activity_types::kTyping));

            if (text == "card")
            {
                json turn = activity(chatconsole::activity_types::kMessage, "Please fill in the form.");
                turn["attachments"] = json::array(
                    {{{"contentType", chatconsole::kAdaptiveCardContentType}, {"content", sample_card()}}}
                );
                send(stream_id, turn);
            }
            else
            {
                json answers = json::parse(text, nullptr, false);
                if (!answers.is_discarded() && answers.is_object())
                    send(stream_id, activity(chatconsole::activity_types::kMessage, "Thanks, received: " + answers.dump()));
                else
                    send(stream_id, activity(chatconsole::activity_types::kMessage, "You said: " + text));
            }
            return json{{"conversationId", kConversationId}};
        }

        throw chatconsole::JsonRpcError(chatconsole::JsonRpcErrorCode::MethodNotFound, "Unknown method: " + method);
    }
};

} // namespace

int main(int argc, char* argv[])
{
    bool verbose = false;
    for (int i = 1; i + 1 < argc; ++i)
        if (std::string(argv[i]) == "--log-level")
            verbose = chatconsole::parse_log_level(argv[i + 1]) == chatconsole::LogLevel::Debug;

    try
    {
        chatconsole::JsonRpcClient rpc(std::make_unique<chatconsole::FdTransport>(0, 1, false));
        EchoAgent agent{rpc, verbose};
        rpc.set_request_handler([&agent](const std::string& method, const json& params)
                                { return agent.handle(method, params); });
        rpc.run();
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "echo_bridge: " << e.what() << std::endl;
        return 1;
    }
}
