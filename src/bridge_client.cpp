// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chatconsole/bridge_client.hpp>
#include <chatconsole/logging.hpp>
#include <condition_variable>
#include <deque>
#include <stdexcept>

namespace chatconsole
{

namespace
{

constexpr auto kPullSlice = std::chrono::milliseconds(100);
constexpr auto kShutdownGrace = std::chrono::milliseconds(2000);

} // namespace

// =============================================================================
// ConnectionSettings
// =============================================================================

void to_json(json& j, const ConnectionSettings& s)
{
    j = json{
        {"environmentId", s.environment_id},
        {"schemaName", s.schema_name},
        {"tenantId", s.tenant_id},
        {"appClientId", s.app_client_id},
        {"directConnectUrl", s.direct_connect_url},
        {"cloud", s.cloud},
    };
}

void from_json(const json& j, ConnectionSettings& s)
{
    auto read = [&j](const char* key, std::string& target)
    {
        if (j.contains(key) && j.at(key).is_string())
            j.at(key).get_to(target);
    };
    read("environmentId", s.environment_id);
    read("schemaName", s.schema_name);
    read("tenantId", s.tenant_id);
    read("appClientId", s.app_client_id);
    read("directConnectUrl", s.direct_connect_url);
    read("cloud", s.cloud);
}

// =============================================================================
// Streams
// =============================================================================

/// Turns delivered for one start/ask call
struct BridgeClient::StreamState
{
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::shared_ptr<const Activity>> turns;
    bool completed = false;
    std::exception_ptr error;

    void push(std::shared_ptr<const Activity> turn)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            turns.push_back(std::move(turn));
        }
        cv.notify_all();
    }

    void finish(std::exception_ptr failure)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            completed = true;
            if (failure && !error)
                error = failure;
        }
        cv.notify_all();
    }
};

/// Open streams by id; shared with stream sources so they may outlive the client
struct BridgeClient::StreamRegistry
{
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<StreamState>> open;

    std::shared_ptr<StreamState> find(const std::string& id)
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = open.find(id);
        return it == open.end() ? nullptr : it->second;
    }

    void erase(const std::string& id)
    {
        std::lock_guard<std::mutex> lock(mutex);
        open.erase(id);
    }
};

class BridgeClient::Source : public IActivitySource
{
  public:
    Source(std::string id, std::shared_ptr<StreamState> state, std::weak_ptr<StreamRegistry> registry)
        : id_(std::move(id)), state_(std::move(state)), registry_(std::move(registry))
    {
    }

    ~Source() override
    {
        // Turns the bridge still sends for this id are dropped from now on
        if (auto registry = registry_.lock())
            registry->erase(id_);
    }

    bool pull(std::shared_ptr<const Activity>& out, const CancellationToken& token) override
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        while (true)
        {
            if (!state_->turns.empty())
            {
                out = std::move(state_->turns.front());
                state_->turns.pop_front();
                return true;
            }
            if (state_->error)
                std::rethrow_exception(state_->error);
            if (state_->completed || token.is_cancellation_requested())
                return false;
            state_->cv.wait_for(lock, kPullSlice);
        }
    }

  private:
    std::string id_;
    std::shared_ptr<StreamState> state_;
    std::weak_ptr<StreamRegistry> registry_;
};

// =============================================================================
// Construction
// =============================================================================

BridgeClient::BridgeClient(BridgeOptions options)
    : options_(std::move(options)), streams_(std::make_shared<StreamRegistry>())
{
    if (!options_.command || options_.command->empty())
        throw std::invalid_argument(
            "No agent bridge configured (set bridge.command or CHATCONSOLE_BRIDGE_PATH)"
        );
}

BridgeClient::BridgeClient(BridgeOptions options, std::unique_ptr<ITransport> transport)
    : options_(std::move(options)), pending_transport_(std::move(transport)),
      streams_(std::make_shared<StreamRegistry>())
{
    if (!pending_transport_)
        throw std::invalid_argument("BridgeClient requires a transport");
}

BridgeClient::~BridgeClient()
{
    stop();
}

std::pair<std::string, std::vector<std::string>>
BridgeClient::resolve_command(const BridgeOptions& options)
{
    if (!options.command || options.command->empty())
        throw std::invalid_argument("No agent bridge command configured");

    std::string executable = *options.command;
    std::vector<std::string> args;

    if (is_node_script(executable))
    {
        auto node = find_node();
        if (!node)
            throw ProcessError("Node.js is required to run bridge script: " + executable);
        args.push_back(executable);
        executable = *node;
    }

    args.insert(args.end(), options.args.begin(), options.args.end());
    args.push_back("--log-level");
    args.push_back(options.log_level);
    return {executable, args};
}

// =============================================================================
// Lifecycle
// =============================================================================

void BridgeClient::spawn_bridge()
{
    auto [executable, args] = resolve_command(options_);

    LaunchOptions proc_opts;
    proc_opts.capture_stderr = true;
    proc_opts.environment = options_.environment;
    if (options_.cwd)
        proc_opts.working_directory = *options_.cwd;

    CHATCONSOLE_LOG_DEBUG("Launching agent bridge: " + executable);
    process_ = std::make_unique<Process>();
    process_->spawn(executable, args, proc_opts);

    // The bridge's stderr is its log; forward it so the pipe never fills up
    stderr_thread_ = std::thread(
        [pipe = &process_->stderr_pipe()]()
        {
            try
            {
                while (auto line = pipe->read_line())
                    CHATCONSOLE_LOG_DEBUG("[bridge] " + *line);
            }
            catch (const ProcessError& e)
            {
                CHATCONSOLE_LOG_DEBUG(std::string("[bridge] stderr closed: ") + e.what());
            }
        }
    );
}

void BridgeClient::start()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_ == ConnectionState::Connected)
        return;

    state_ = ConnectionState::Connecting;
    try
    {
        std::unique_ptr<ITransport> transport = std::move(pending_transport_);
        if (!transport)
        {
            spawn_bridge();
            transport =
                std::make_unique<PipeTransport>(process_->stdin_pipe(), process_->stdout_pipe());
        }

        rpc_ = std::make_unique<JsonRpcClient>(std::move(transport));
        rpc_->set_notification_handler(
            [this](const std::string& method, const json& params)
            { handle_notification(method, params); }
        );
        rpc_->start();

        verify_protocol_version();
        state_ = ConnectionState::Connected;
    }
    catch (...)
    {
        state_ = ConnectionState::Error;
        throw;
    }
}

void BridgeClient::verify_protocol_version()
{
    json params = {
        {"protocolVersion", kBridgeProtocolVersion},
        {"clientName", "chatconsole"},
        {"connection", options_.connection},
    };
    json result = rpc_->invoke_sync("initialize", params, options_.startup_timeout);

    if (!result.is_object() || !result.contains("protocolVersion") ||
        !result.at("protocolVersion").is_number_integer())
        throw JsonRpcError(JsonRpcErrorCode::InvalidRequest, "Bridge did not report a protocol version");

    int server_version = result.at("protocolVersion").get<int>();
    if (server_version != kBridgeProtocolVersion)
        throw JsonRpcError(
            JsonRpcErrorCode::InvalidRequest,
            "Bridge protocol version mismatch: expected " + std::to_string(kBridgeProtocolVersion) +
                ", got " + std::to_string(server_version)
        );
}

void BridgeClient::stop()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (process_)
    {
        // EOF on stdin asks the bridge to exit; its stdout closing ends the read loop
        try
        {
            process_->stdin_pipe().close();
        }
        catch (const ProcessError&)
        {
            // stdin already closed
        }
        int exit_code = process_->wait_or_kill(kShutdownGrace);
        CHATCONSOLE_LOG_DEBUG("Agent bridge exited with code " + std::to_string(exit_code));
    }

    if (rpc_)
        rpc_->stop();
    if (stderr_thread_.joinable())
        stderr_thread_.join();

    rpc_.reset();
    process_.reset();
    if (state_ != ConnectionState::Error)
        state_ = ConnectionState::Disconnected;
}

// =============================================================================
// Conversation
// =============================================================================

std::optional<std::string> BridgeClient::conversation_id() const
{
    std::lock_guard<std::mutex> lock(conversation_mutex_);
    return conversation_id_;
}

void BridgeClient::remember_conversation(const std::string& id, bool overwrite)
{
    if (id.empty())
        return;
    std::lock_guard<std::mutex> lock(conversation_mutex_);
    if (overwrite || !conversation_id_)
        conversation_id_ = id;
}

ActivityStream BridgeClient::start_conversation(bool emit_start_event, CancellationToken token)
{
    return open_stream(
        "conversation.start", json{{"emitStartConversationEvent", emit_start_event}}, std::move(token)
    );
}

ActivityStream BridgeClient::ask_question(
    const std::string& text,
    const std::optional<std::string>& conversation_id,
    CancellationToken token
)
{
    json params = {{"text", text}};
    if (auto id = conversation_id ? conversation_id : this->conversation_id())
        params["conversationId"] = *id;
    return open_stream("conversation.ask", std::move(params), std::move(token));
}

ActivityStream BridgeClient::open_stream(const std::string& method, json params, CancellationToken token)
{
    if (state_ != ConnectionState::Connected || !rpc_)
        throw std::logic_error("BridgeClient is not started");

    std::string stream_id = "stream-" + std::to_string(next_stream_++);
    auto state = std::make_shared<StreamState>();
    {
        std::lock_guard<std::mutex> lock(streams_->mutex);
        streams_->open[stream_id] = state;
    }
    auto source = std::make_unique<Source>(stream_id, state, streams_);

    params["streamId"] = stream_id;
    rpc_->invoke_async(
        method,
        params,
        [this, state](const json& result, std::exception_ptr error)
        {
            if (!error && result.is_object() && result.contains("conversationId") &&
                result.at("conversationId").is_string())
                remember_conversation(result.at("conversationId").get<std::string>(), true);
            state->finish(error);
        }
    );

    CHATCONSOLE_LOG_DEBUG("Opened " + method + " as " + stream_id);
    return ActivityStream(std::move(source), std::move(token));
}

void BridgeClient::handle_notification(const std::string& method, const json& params)
{
    if (method != "conversation.activity")
    {
        CHATCONSOLE_LOG_DEBUG("Ignoring bridge notification " + method);
        return;
    }
    if (!params.is_object() || !params.contains("streamId") || !params.at("streamId").is_string())
    {
        CHATCONSOLE_LOG_WARN("conversation.activity without a streamId");
        return;
    }

    auto state = streams_->find(params.at("streamId").get<std::string>());
    if (!state)
        return;

    const json activity_json = params.value("activity", json(nullptr));
    if (activity_json.is_null())
    {
        state->push(nullptr);
        return;
    }

    try
    {
        auto activity = std::make_shared<Activity>(activity_json.get<Activity>());
        remember_conversation(activity->conversation_id(), false);
        state->push(std::move(activity));
    }
    catch (const std::exception& e)
    {
        state->finish(std::make_exception_ptr(
            JsonRpcError(JsonRpcErrorCode::InvalidParams, std::string("Malformed activity: ") + e.what())
        ));
    }
}

} // namespace chatconsole
