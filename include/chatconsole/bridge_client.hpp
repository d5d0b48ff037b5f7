// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file bridge_client.hpp
/// @brief IAgentClient backed by an agent bridge process speaking JSON-RPC over stdio

#include <atomic>
#include <chatconsole/agent_client.hpp>
#include <chatconsole/jsonrpc.hpp>
#include <chatconsole/process.hpp>
#include <chatconsole/transport.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chatconsole
{

/// Bridge protocol version - must match the bridge's `initialize` answer
inline constexpr int kBridgeProtocolVersion = 1;

// =============================================================================
// Options
// =============================================================================

/// Connection state of the client
enum class ConnectionState
{
    Disconnected,
    Connecting,
    Connected,
    Error
};

/// Which agent to talk to; forwarded to the bridge, which owns authentication
struct ConnectionSettings
{
    std::string environment_id;
    std::string schema_name;
    std::string tenant_id;
    std::string app_client_id;
    std::string direct_connect_url;
    std::string cloud = "Prod";
};

void to_json(json& j, const ConnectionSettings& s);
void from_json(const json& j, ConnectionSettings& s);

/// How to launch and reach the agent bridge
struct BridgeOptions
{
    /// Bridge executable or Node.js script (.js/.mjs scripts run through `node`)
    std::optional<std::string> command;
    std::vector<std::string> args;
    std::optional<std::string> cwd;
    std::map<std::string, std::string> environment;

    /// Forwarded to the bridge as `--log-level <level>`
    std::string log_level = "info";

    /// Deadline for the `initialize` handshake
    std::chrono::milliseconds startup_timeout{30000};

    ConnectionSettings connection;
};

// =============================================================================
// BridgeClient
// =============================================================================

/// Agent client that delegates the conversation to a bridge process
///
/// Each start/ask call opens a stream: the bridge sends the turns as
/// `conversation.activity` notifications tagged with the stream id and then
/// answers the request, which ends the stream.
///
/// Example usage:
/// @code
/// BridgeOptions opts;
/// opts.command = "agent-bridge";
///
/// BridgeClient client(opts);
/// client.start();
/// auto stream = client.ask_question("Hello", std::nullopt, CancellationToken::none());
/// while (stream.next()) { ... }
/// client.stop();
/// @endcode
class BridgeClient : public IAgentClient
{
  public:
    /// Spawn the bridge described by `options` on start()
    /// @throws std::invalid_argument if no command is configured
    explicit BridgeClient(BridgeOptions options);

    /// Talk to an already running bridge over `transport`
    BridgeClient(BridgeOptions options, std::unique_ptr<ITransport> transport);

    ~BridgeClient() override;

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    /// Launch the bridge (if needed) and perform the `initialize` handshake
    /// @throws ProcessError if the bridge cannot be launched
    /// @throws JsonRpcError on handshake failure or protocol version mismatch
    void start();

    /// Shut the bridge down; outstanding streams end with a connection error
    void stop();

    ConnectionState state() const
    {
        return state_;
    }

    /// Conversation the client asks in when no id is passed
    std::optional<std::string> conversation_id() const;

    ActivityStream start_conversation(bool emit_start_event, CancellationToken token) override;

    ActivityStream ask_question(
        const std::string& text,
        const std::optional<std::string>& conversation_id,
        CancellationToken token
    ) override;

    /// Build the executable and argument list used to launch the bridge
    static std::pair<std::string, std::vector<std::string>> resolve_command(const BridgeOptions& options);

  private:
    struct StreamState;
    struct StreamRegistry;
    class Source;

    ActivityStream open_stream(const std::string& method, json params, CancellationToken token);
    void handle_notification(const std::string& method, const json& params);
    void remember_conversation(const std::string& id, bool overwrite);
    void spawn_bridge();
    void verify_protocol_version();

    BridgeOptions options_;
    std::unique_ptr<ITransport> pending_transport_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::mutex lifecycle_mutex_;

    std::unique_ptr<Process> process_;
    std::thread stderr_thread_;
    std::unique_ptr<JsonRpcClient> rpc_;
    std::shared_ptr<StreamRegistry> streams_;
    std::atomic<int64_t> next_stream_{1};

    mutable std::mutex conversation_mutex_;
    std::optional<std::string> conversation_id_;
};

} // namespace chatconsole
