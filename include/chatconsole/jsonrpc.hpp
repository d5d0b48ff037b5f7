// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file jsonrpc.hpp
/// @brief JSON-RPC 2.0 peer used to talk to the agent bridge

#include <atomic>
#include <chatconsole/activity.hpp>
#include <chatconsole/transport.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

namespace chatconsole
{

// =============================================================================
// JSON-RPC 2.0 Exceptions
// =============================================================================

/// JSON-RPC error codes (standard and custom)
enum class JsonRpcErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    // Server errors (-32000 to -32099)
    ServerError = -32000,

    // Local conditions
    ConnectionClosed = -32801,
    Timeout = -32802,
};

/// Error reported by the peer, or a local failure of a pending request
class JsonRpcError : public std::runtime_error
{
  public:
    JsonRpcError(JsonRpcErrorCode code, const std::string& message, const json& data = nullptr)
        : std::runtime_error(message), code_(code), data_(data)
    {
    }

    JsonRpcErrorCode code() const
    {
        return code_;
    }

    const json& data() const
    {
        return data_;
    }

  private:
    JsonRpcErrorCode code_;
    json data_;
};

// =============================================================================
// JSON-RPC 2.0 Message Types
// =============================================================================

/// Request ID (string or integer)
using JsonRpcId = std::variant<std::string, int64_t>;

json id_to_json(const JsonRpcId& id);
JsonRpcId id_from_json(const json& j);

/// Request or notification (a notification has no id)
struct JsonRpcRequest
{
    std::string method;
    json params;
    std::optional<JsonRpcId> id;

    json to_json() const;
    static JsonRpcRequest from_json(const json& j);

    bool is_notification() const
    {
        return !id.has_value();
    }
};

/// Error member of a response
struct JsonRpcErrorObject
{
    int code = 0;
    std::string message;
    json data;

    json to_json() const;
    static JsonRpcErrorObject from_json(const json& j);
};

/// Response to a request
struct JsonRpcResponse
{
    JsonRpcId id;
    std::optional<json> result;
    std::optional<JsonRpcErrorObject> error;

    json to_json() const;
    static JsonRpcResponse from_json(const json& j);

    bool is_error() const
    {
        return error.has_value();
    }
};

// =============================================================================
// JSON-RPC Peer
// =============================================================================

/// Handler for incoming notifications
using NotificationHandler = std::function<void(const std::string& method, const json& params)>;

/// Handler for incoming requests (returns the result or throws)
using RequestHandler = std::function<json(const std::string& method, const json& params)>;

/// Completion callback for an outgoing request; exactly one of result/error is meaningful
using ResponseCallback = std::function<void(const json& result, std::exception_ptr error)>;

/// Bidirectional JSON-RPC 2.0 peer over a framed transport
///
/// Messages are read on one thread (a background thread after `start()`, or the
/// caller's thread inside `run()`) and dispatched in arrival order: notification
/// and request handlers and response callbacks all run on that thread. A handler
/// may send notifications before returning its result, so a peer that answers a
/// request can stream progress ahead of the response.
class JsonRpcClient
{
  public:
    /// @param transport The underlying transport (takes ownership)
    explicit JsonRpcClient(std::unique_ptr<ITransport> transport);
    ~JsonRpcClient();

    JsonRpcClient(const JsonRpcClient&) = delete;
    JsonRpcClient& operator=(const JsonRpcClient&) = delete;

    /// Start the background read loop
    void start();

    /// Run the read loop on the calling thread until the connection closes
    void run();

    /// Close the transport, join the reader and fail all pending requests
    void stop();

    bool is_running() const
    {
        return running_;
    }

    void set_notification_handler(NotificationHandler handler);
    void set_request_handler(RequestHandler handler);

    /// Send a request; `on_response` runs on the reader thread when the answer arrives
    /// @return The request id
    int64_t invoke_async(const std::string& method, const json& params, ResponseCallback on_response);

    /// Send a request and get a future for its result
    std::future<json> invoke(const std::string& method, const json& params = nullptr);

    /// Send a request and block for the result
    /// @param timeout 0 = wait forever
    /// @throws JsonRpcError on error responses, timeouts and connection loss
    json invoke_sync(
        const std::string& method,
        const json& params = nullptr,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{30000}
    );

    /// Send a notification (no response expected)
    void notify(const std::string& method, const json& params = nullptr);

  private:
    void read_loop();
    void dispatch_message(const json& message);
    void handle_response(const json& message);
    void handle_notification(const JsonRpcRequest& request);
    void handle_request(const JsonRpcRequest& request);
    void send_message(const json& message);
    void send_error_response(const JsonRpcId& id, int code, const std::string& message, const json& data = nullptr);
    std::optional<ResponseCallback> take_pending(int64_t id);
    void fail_all_pending(JsonRpcErrorCode code, const std::string& message);

    std::unique_ptr<ITransport> transport_;
    MessageFramer framer_;
    std::atomic<int64_t> next_id_{1};
    std::atomic<bool> running_{false};

    std::thread read_thread_;
    std::mutex write_mutex_;

    std::mutex pending_mutex_;
    std::map<int64_t, ResponseCallback> pending_;

    std::mutex handlers_mutex_;
    NotificationHandler notification_handler_;
    RequestHandler request_handler_;
};

} // namespace chatconsole
