// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "loopback_transport.hpp"

#include <chatconsole/jsonrpc.hpp>
#include <chrono>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace chatconsole;

// =============================================================================
// Message Type Tests
// =============================================================================

TEST(JsonRpcMessageTest, RequestToJson)
{
    JsonRpcRequest req{"conversation.ask", json{{"streamId", "s1"}, {"text", "hi"}}, JsonRpcId{int64_t{4}}};
    json j = req.to_json();

    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "conversation.ask");
    EXPECT_EQ(j["params"]["text"], "hi");
    EXPECT_EQ(j["id"], 4);
}

TEST(JsonRpcMessageTest, NotificationHasNoId)
{
    JsonRpcRequest note{"conversation.activity", json{{"streamId", "s1"}, {"activity", nullptr}}, std::nullopt};
    json j = note.to_json();

    EXPECT_TRUE(note.is_notification());
    EXPECT_FALSE(j.contains("id"));
    EXPECT_TRUE(j["params"]["activity"].is_null());
}

TEST(JsonRpcMessageTest, RequestWithoutParamsOmitsThem)
{
    JsonRpcRequest req{"initialize", nullptr, JsonRpcId{std::string("init")}};
    json j = req.to_json();

    EXPECT_FALSE(j.contains("params"));
    EXPECT_EQ(j["id"], "init");
}

TEST(JsonRpcMessageTest, RequestFromJson)
{
    auto req = JsonRpcRequest::from_json(
        json::parse(R"({"jsonrpc":"2.0","id":"abc","method":"conversation.start","params":{"streamId":"s"}})")
    );

    EXPECT_EQ(req.method, "conversation.start");
    ASSERT_TRUE(req.id.has_value());
    EXPECT_EQ(std::get<std::string>(*req.id), "abc");
    EXPECT_EQ(req.params["streamId"], "s");
}

TEST(JsonRpcMessageTest, NullIdIsANotification)
{
    auto req = JsonRpcRequest::from_json(json::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"));
    EXPECT_TRUE(req.is_notification());
}

TEST(JsonRpcMessageTest, ErrorResponseRoundTrip)
{
    JsonRpcResponse resp{JsonRpcId{int64_t{9}}, std::nullopt, JsonRpcErrorObject{-32601, "Method not found", nullptr}};
    json j = resp.to_json();

    EXPECT_FALSE(j.contains("result"));
    EXPECT_EQ(j["error"]["code"], -32601);

    auto parsed = JsonRpcResponse::from_json(j);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error->message, "Method not found");
}

TEST(JsonRpcMessageTest, NullResultIsStillAResult)
{
    JsonRpcResponse resp{JsonRpcId{int64_t{1}}, std::nullopt, std::nullopt};
    json j = resp.to_json();

    ASSERT_TRUE(j.contains("result"));
    EXPECT_TRUE(j["result"].is_null());
}

TEST(JsonRpcMessageTest, InvalidIdTypeIsRejected)
{
    EXPECT_THROW(id_from_json(json::array()), JsonRpcError);
    EXPECT_THROW(id_from_json(1.5), JsonRpcError);
}

// =============================================================================
// Peer Tests
// =============================================================================

namespace
{

/// Two connected peers; `client` plays the console, `bridge` the agent side
struct PeerPair
{
    std::unique_ptr<JsonRpcClient> client;
    std::unique_ptr<JsonRpcClient> bridge;

    PeerPair()
    {
        auto [a, b] = LoopbackTransport::create_pair();
        client = std::make_unique<JsonRpcClient>(std::move(a));
        bridge = std::make_unique<JsonRpcClient>(std::move(b));
    }

    void start()
    {
        client->start();
        bridge->start();
    }
};

} // namespace

TEST(JsonRpcClientTest, RequestAndResponse)
{
    PeerPair peers;
    peers.bridge->set_request_handler(
        [](const std::string& method, const json& params) -> json
        {
            if (method == "initialize")
                return json{{"protocolVersion", params.at("protocolVersion")}};
            throw JsonRpcError(JsonRpcErrorCode::MethodNotFound, "Unknown method: " + method);
        }
    );
    peers.start();

    json result = peers.client->invoke_sync("initialize", json{{"protocolVersion", 1}});
    EXPECT_EQ(result["protocolVersion"], 1);
}

TEST(JsonRpcClientTest, ErrorResponseBecomesJsonRpcError)
{
    PeerPair peers;
    peers.bridge->set_request_handler(
        [](const std::string& method, const json&) -> json
        { throw JsonRpcError(JsonRpcErrorCode::MethodNotFound, "Unknown method: " + method); }
    );
    peers.start();

    try
    {
        peers.client->invoke_sync("conversation.rename");
        FAIL() << "Expected JsonRpcError";
    }
    catch (const JsonRpcError& e)
    {
        EXPECT_EQ(e.code(), JsonRpcErrorCode::MethodNotFound);
        EXPECT_STREQ(e.what(), "Unknown method: conversation.rename");
    }
}

TEST(JsonRpcClientTest, HandlerExceptionBecomesInternalError)
{
    PeerPair peers;
    peers.bridge->set_request_handler(
        [](const std::string&, const json&) -> json { throw std::runtime_error("agent unavailable"); }
    );
    peers.start();

    try
    {
        peers.client->invoke_sync("conversation.start");
        FAIL() << "Expected JsonRpcError";
    }
    catch (const JsonRpcError& e)
    {
        EXPECT_EQ(e.code(), JsonRpcErrorCode::InternalError);
        EXPECT_STREQ(e.what(), "agent unavailable");
    }
}

TEST(JsonRpcClientTest, MissingRequestHandlerAnswersMethodNotFound)
{
    PeerPair peers;
    peers.start();

    try
    {
        peers.client->invoke_sync("initialize");
        FAIL() << "Expected JsonRpcError";
    }
    catch (const JsonRpcError& e)
    {
        EXPECT_EQ(e.code(), JsonRpcErrorCode::MethodNotFound);
    }
}

TEST(JsonRpcClientTest, NotificationReachesHandler)
{
    PeerPair peers;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> received;
    peers.client->set_notification_handler(
        [&](const std::string& method, const json& params)
        {
            std::lock_guard<std::mutex> lock(mutex);
            received.push_back(method + ":" + params.value("streamId", ""));
            cv.notify_all();
        }
    );
    peers.start();

    peers.bridge->notify("conversation.activity", json{{"streamId", "s1"}, {"activity", nullptr}});

    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return !received.empty(); }));
    EXPECT_EQ(received[0], "conversation.activity:s1");
}

TEST(JsonRpcClientTest, NotificationsSentBeforeResponseArriveFirst)
{
    PeerPair peers;

    std::mutex mutex;
    std::vector<std::string> events;
    peers.client->set_notification_handler(
        [&](const std::string&, const json& params)
        {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(params.at("activity").at("text").get<std::string>());
        }
    );

    JsonRpcClient* bridge = peers.bridge.get();
    peers.bridge->set_request_handler(
        [bridge](const std::string&, const json& params) -> json
        {
            std::string stream = params.at("streamId");
            for (const char* text : {"one", "two", "three"})
                bridge->notify("conversation.activity", json{{"streamId", stream}, {"activity", {{"text", text}}}});
            return json{{"conversationId", "c-1"}};
        }
    );
    peers.start();

    json result = peers.client->invoke_sync("conversation.ask", json{{"streamId", "s1"}, {"text", "count"}});

    // Notification handlers ran on the reader thread before the response callback
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(result["conversationId"], "c-1");
    EXPECT_EQ(events, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(JsonRpcClientTest, ConcurrentRequestsGetTheirOwnResults)
{
    PeerPair peers;
    peers.bridge->set_request_handler(
        [](const std::string&, const json& params) -> json { return params.at("n").get<int>() * 2; }
    );
    peers.start();

    std::vector<std::future<json>> futures;
    for (int i = 0; i < 20; ++i)
        futures.push_back(peers.client->invoke("double", json{{"n", i}}));

    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(futures[static_cast<size_t>(i)].get(), i * 2);
}

TEST(JsonRpcClientTest, RunServesOnCallingThread)
{
    auto [a, b] = LoopbackTransport::create_pair();
    JsonRpcClient client(std::move(a));
    JsonRpcClient bridge(std::move(b));
    bridge.set_request_handler([](const std::string& method, const json&) -> json { return method; });

    std::thread server([&bridge] { bridge.run(); });
    client.start();

    EXPECT_EQ(client.invoke_sync("initialize"), "initialize");

    // Closing our side ends the bridge's run()
    client.stop();
    server.join();
    EXPECT_FALSE(bridge.is_running());
}

TEST(JsonRpcClientTest, RunTwiceIsAnError)
{
    auto [a, b] = LoopbackTransport::create_pair();
    JsonRpcClient client(std::move(a));
    client.start();
    EXPECT_THROW(client.run(), std::logic_error);
}

TEST(JsonRpcClientTest, InvokeSyncTimesOut)
{
    PeerPair peers;
    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    peers.bridge->set_request_handler(
        [&](const std::string&, const json&) -> json
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] { return release; });
            return nullptr;
        }
    );
    peers.start();

    try
    {
        peers.client->invoke_sync("conversation.ask", nullptr, std::chrono::milliseconds(100));
        FAIL() << "Expected JsonRpcError";
    }
    catch (const JsonRpcError& e)
    {
        EXPECT_EQ(e.code(), JsonRpcErrorCode::Timeout);
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
}

TEST(JsonRpcClientTest, StopFailsPendingRequests)
{
    // Nobody serves the other end, so the request stays pending
    auto [a, b] = LoopbackTransport::create_pair();
    JsonRpcClient client(std::move(a));
    client.start();

    auto future = client.invoke("conversation.start", json::object());
    client.stop();

    try
    {
        future.get();
        FAIL() << "Expected JsonRpcError";
    }
    catch (const JsonRpcError& e)
    {
        EXPECT_EQ(e.code(), JsonRpcErrorCode::ConnectionClosed);
    }
}

TEST(JsonRpcClientTest, PeerHangupFailsPendingRequests)
{
    auto [a, b] = LoopbackTransport::create_pair();
    JsonRpcClient client(std::move(a));
    client.start();

    auto future = client.invoke("conversation.ask", json::object());
    b->close();

    try
    {
        future.get();
        FAIL() << "Expected JsonRpcError";
    }
    catch (const JsonRpcError& e)
    {
        EXPECT_EQ(e.code(), JsonRpcErrorCode::ConnectionClosed);
    }
}

TEST(JsonRpcClientTest, SendAfterStopThrows)
{
    PeerPair peers;
    peers.start();
    peers.client->stop();

    EXPECT_THROW(peers.client->notify("conversation.activity"), TransportError);
}

TEST(JsonRpcClientTest, LargeActivityPayload)
{
    PeerPair peers;
    peers.bridge->set_request_handler(
        [](const std::string&, const json& params) -> json { return json{{"echo", params.at("text")}}; }
    );
    peers.start();

    std::string text(512 * 1024, 'q');
    json result = peers.client->invoke_sync("conversation.ask", json{{"text", text}});
    EXPECT_EQ(result["echo"].get<std::string>().size(), text.size());
}

TEST(JsonRpcClientTest, MalformedMessageIsDropped)
{
    auto [a, b] = LoopbackTransport::create_pair();
    LoopbackTransport* raw_bridge = b.get();
    JsonRpcClient client(std::move(a));

    std::mutex mutex;
    std::condition_variable cv;
    int notifications = 0;
    client.set_notification_handler(
        [&](const std::string&, const json&)
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++notifications;
            cv.notify_all();
        }
    );
    client.start();

    MessageFramer framer(*raw_bridge);
    framer.write_message("{not json");
    framer.write_message(R"({"jsonrpc":"2.0","id":[1],"method":"x"})");
    framer.write_message(R"({"jsonrpc":"2.0","method":"conversation.activity","params":{}})");

    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return notifications == 1; }));
    EXPECT_TRUE(client.is_running());
}

TEST(JsonRpcClientTest, ResponseForUnknownIdIsIgnored)
{
    auto [a, b] = LoopbackTransport::create_pair();
    LoopbackTransport* raw_bridge = b.get();
    JsonRpcClient client(std::move(a));
    JsonRpcClient bridge(std::move(b));
    bridge.set_request_handler([](const std::string&, const json&) -> json { return "ok"; });
    client.start();

    MessageFramer framer(*raw_bridge);
    framer.write_message(R"({"jsonrpc":"2.0","id":999,"result":"stale"})");

    bridge.start();
    EXPECT_EQ(client.invoke_sync("initialize"), "ok");
}
