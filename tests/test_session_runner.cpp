// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "fake_agent_client.hpp"

#include <chatconsole/session_runner.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace chatconsole;

namespace
{

/// Interactive session over scripted operator lines
struct InteractiveHarness
{
    FakeAgentClient client;
    std::istringstream in;
    ConsoleInput input;
    std::ostringstream out;
    SessionRunner runner{client, input, out};

    explicit InteractiveHarness(const std::string& typed) : in(typed), input(in) {}
};

} // namespace

TEST(InteractiveTest, GreetingThenQuestions)
{
    InteractiveHarness h("What are your hours?\nThanks\n");
    h.client.greeting = {message("Hello!")};
    h.client.replies.push_back({turn({{"type", "typing"}}), message("9 to 5")});
    h.client.replies.push_back({message("You're welcome")});

    h.runner.run_interactive(CancellationToken{});

    EXPECT_EQ(
        h.out.str(),
        "\nAgent> Hello!\n"
        "\nUser> \nAgent>\n.9 to 5\n"
        "\nUser> \nAgent>\nYou're welcome\n"
        "\nUser> "
    );
    EXPECT_EQ(h.client.start_calls, std::vector<bool>{true});
    EXPECT_EQ(h.client.questions, (std::vector<std::string>{"What are your hours?", "Thanks"}));
}

TEST(InteractiveTest, GreetingWithSeveralTurns)
{
    InteractiveHarness h("");
    h.client.greeting = {message("Hello!"), turn({{"type", "event"}, {"name", "startConversation"}})};

    h.runner.run_interactive(CancellationToken{});

    EXPECT_EQ(h.out.str(), "\nAgent> Hello!\n\nAgent> \n\nUser> ");
    EXPECT_TRUE(h.client.questions.empty());
}

TEST(InteractiveTest, NullGreetingTurnIsFatal)
{
    InteractiveHarness h("never asked\n");
    h.client.greeting = {message("Hello!"), nullptr};

    EXPECT_THROW(h.runner.run_interactive(CancellationToken{}), std::logic_error);
    EXPECT_TRUE(h.client.questions.empty());
}

TEST(InteractiveTest, EmptyLinesAreStillSent)
{
    InteractiveHarness h("\n");

    h.runner.run_interactive(CancellationToken{});

    EXPECT_EQ(h.client.questions, std::vector<std::string>{""});
}

TEST(InteractiveTest, CancellationStopsTheLoop)
{
    InteractiveHarness h("first\nsecond\nthird\n");
    CancellationSource source;
    h.client.on_ask = [&source](const std::string&) { source.cancel(); };
    h.client.replies.push_back({message("not printed")});

    h.runner.run_interactive(source.token());

    EXPECT_EQ(h.client.questions, std::vector<std::string>{"first"});
    EXPECT_EQ(h.out.str().find("not printed"), std::string::npos);
}

TEST(InteractiveTest, CardAnswersFollowUp)
{
    InteractiveHarness h("sign me up\nAda\n");
    h.client.replies.push_back({turn(json::parse(R"({
        "type": "message",
        "text": "Who are you?",
        "attachments": [{
            "contentType": "application/vnd.microsoft.card.adaptive",
            "content": {"type": "AdaptiveCard", "body": [{"type": "Input.Text", "id": "name", "label": "Name"}]}
        }]
    })"))});
    h.client.replies.push_back({message("Welcome, Ada")});

    h.runner.run_interactive(CancellationToken{});

    EXPECT_EQ(h.client.questions, (std::vector<std::string>{"sign me up", R"({"name":"Ada"})"}));
    EXPECT_NE(h.out.str().find("Name: \nSending your inputs to the agent...\n\nWelcome, Ada\n"), std::string::npos);
}

TEST(InteractiveTest, RunPrintsBanner)
{
    InteractiveHarness h("");

    h.runner.run(RunMode::Interactive, BatchOptions{}, CancellationToken{});

    EXPECT_EQ(h.out.str(), "\nRunning interactive mode...\n\nUser> ");
}
