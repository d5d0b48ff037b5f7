// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chatconsole/jsonrpc.hpp>
#include <chatconsole/logging.hpp>
#include <vector>

namespace chatconsole
{

// =============================================================================
// Message types
// =============================================================================

json id_to_json(const JsonRpcId& id)
{
    return std::visit([](const auto& v) -> json { return v; }, id);
}

JsonRpcId id_from_json(const json& j)
{
    if (j.is_string())
        return j.get<std::string>();
    if (j.is_number_integer())
        return j.get<int64_t>();
    throw JsonRpcError(JsonRpcErrorCode::InvalidRequest, "Invalid JSON-RPC id type");
}

json JsonRpcRequest::to_json() const
{
    json j = {{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.is_null())
        j["params"] = params;
    if (id)
        j["id"] = id_to_json(*id);
    return j;
}

JsonRpcRequest JsonRpcRequest::from_json(const json& j)
{
    JsonRpcRequest req;
    req.method = j.at("method").get<std::string>();
    if (j.contains("params"))
        req.params = j.at("params");
    if (j.contains("id") && !j.at("id").is_null())
        req.id = id_from_json(j.at("id"));
    return req;
}

json JsonRpcErrorObject::to_json() const
{
    json j = {{"code", code}, {"message", message}};
    if (!data.is_null())
        j["data"] = data;
    return j;
}

JsonRpcErrorObject JsonRpcErrorObject::from_json(const json& j)
{
    JsonRpcErrorObject err;
    err.code = j.at("code").get<int>();
    err.message = j.at("message").get<std::string>();
    if (j.contains("data"))
        err.data = j.at("data");
    return err;
}

json JsonRpcResponse::to_json() const
{
    json j = {{"jsonrpc", "2.0"}, {"id", id_to_json(id)}};
    if (error)
        j["error"] = error->to_json();
    else
        j["result"] = result.value_or(nullptr);
    return j;
}

JsonRpcResponse JsonRpcResponse::from_json(const json& j)
{
    JsonRpcResponse resp;
    if (j.contains("id") && !j.at("id").is_null())
        resp.id = id_from_json(j.at("id"));
    if (j.contains("result"))
        resp.result = j.at("result");
    if (j.contains("error"))
        resp.error = JsonRpcErrorObject::from_json(j.at("error"));
    return resp;
}

// =============================================================================
// JsonRpcClient
// =============================================================================

JsonRpcClient::JsonRpcClient(std::unique_ptr<ITransport> transport)
    : transport_(std::move(transport)), framer_(*transport_)
{
}

JsonRpcClient::~JsonRpcClient()
{
    stop();
}

void JsonRpcClient::start()
{
    if (running_.exchange(true))
        return;
    read_thread_ = std::thread([this] { read_loop(); });
}

void JsonRpcClient::run()
{
    if (running_.exchange(true))
        throw std::logic_error("JsonRpcClient is already running");
    read_loop();
}

void JsonRpcClient::stop()
{
    running_ = false;

    // Closing the transport unblocks a pending read
    if (transport_)
        transport_->close();

    if (read_thread_.joinable() && read_thread_.get_id() != std::this_thread::get_id())
        read_thread_.join();

    fail_all_pending(JsonRpcErrorCode::ConnectionClosed, "Connection closed");
}

void JsonRpcClient::set_notification_handler(NotificationHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    notification_handler_ = std::move(handler);
}

void JsonRpcClient::set_request_handler(RequestHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    request_handler_ = std::move(handler);
}

int64_t JsonRpcClient::invoke_async(
    const std::string& method, const json& params, ResponseCallback on_response
)
{
    int64_t id = next_id_++;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_[id] = std::move(on_response);
    }

    try
    {
        send_message(JsonRpcRequest{method, params, JsonRpcId{id}}.to_json());
    }
    catch (...)
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
        throw;
    }
    return id;
}

std::future<json> JsonRpcClient::invoke(const std::string& method, const json& params)
{
    auto promise = std::make_shared<std::promise<json>>();
    auto future = promise->get_future();
    invoke_async(
        method,
        params,
        [promise](const json& result, std::exception_ptr error)
        {
            if (error)
                promise->set_exception(error);
            else
                promise->set_value(result);
        }
    );
    return future;
}

json JsonRpcClient::invoke_sync(
    const std::string& method, const json& params, std::chrono::milliseconds timeout
)
{
    auto promise = std::make_shared<std::promise<json>>();
    auto future = promise->get_future();
    int64_t id = invoke_async(
        method,
        params,
        [promise](const json& result, std::exception_ptr error)
        {
            if (error)
                promise->set_exception(error);
            else
                promise->set_value(result);
        }
    );

    if (timeout.count() > 0 && future.wait_for(timeout) == std::future_status::timeout)
    {
        take_pending(id);
        throw JsonRpcError(JsonRpcErrorCode::Timeout, "Request timed out: " + method);
    }
    return future.get();
}

void JsonRpcClient::notify(const std::string& method, const json& params)
{
    send_message(JsonRpcRequest{method, params, std::nullopt}.to_json());
}

void JsonRpcClient::send_message(const json& message)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    framer_.write_message(message.dump());
}

void JsonRpcClient::send_error_response(
    const JsonRpcId& id, int code, const std::string& message, const json& data
)
{
    JsonRpcResponse response{id, std::nullopt, JsonRpcErrorObject{code, message, data}};
    send_message(response.to_json());
}

void JsonRpcClient::read_loop()
{
    while (running_)
    {
        try
        {
            auto message = json::parse(framer_.read_message());
            dispatch_message(message);
        }
        catch (const ConnectionClosedError&)
        {
            break;
        }
        catch (const json::exception& e)
        {
            CHATCONSOLE_LOG_WARN(std::string("Dropping malformed JSON-RPC message: ") + e.what());
        }
        catch (const JsonRpcError& e)
        {
            CHATCONSOLE_LOG_WARN(std::string("Dropping invalid JSON-RPC message: ") + e.what());
        }
        catch (const TransportError& e)
        {
            if (running_)
                CHATCONSOLE_LOG_ERROR(std::string("JSON-RPC transport failed: ") + e.what());
            break;
        }
    }

    running_ = false;
    fail_all_pending(JsonRpcErrorCode::ConnectionClosed, "Connection closed");
}

void JsonRpcClient::dispatch_message(const json& message)
{
    if (!message.is_object())
        return;

    if (message.contains("method"))
    {
        auto request = JsonRpcRequest::from_json(message);
        if (request.is_notification())
            handle_notification(request);
        else
            handle_request(request);
        return;
    }

    if (message.contains("id") && (message.contains("result") || message.contains("error")))
        handle_response(message);
}

std::optional<ResponseCallback> JsonRpcClient::take_pending(int64_t id)
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end())
        return std::nullopt;
    auto callback = std::move(it->second);
    pending_.erase(it);
    return callback;
}

void JsonRpcClient::handle_response(const json& message)
{
    auto response = JsonRpcResponse::from_json(message);

    // Outgoing ids are always integers
    auto* int_id = std::get_if<int64_t>(&response.id);
    if (!int_id)
        return;

    auto callback = take_pending(*int_id);
    if (!callback || !*callback)
        return;

    if (response.is_error())
    {
        const auto& err = *response.error;
        (*callback)(
            nullptr,
            std::make_exception_ptr(
                JsonRpcError(static_cast<JsonRpcErrorCode>(err.code), err.message, err.data)
            )
        );
    }
    else
    {
        (*callback)(response.result.value_or(nullptr), nullptr);
    }
}

void JsonRpcClient::handle_notification(const JsonRpcRequest& request)
{
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = notification_handler_;
    }
    if (!handler)
        return;

    try
    {
        handler(request.method, request.params);
    }
    catch (const std::exception& e)
    {
        CHATCONSOLE_LOG_WARN("Notification handler for " + request.method + " failed: " + e.what());
    }
}

void JsonRpcClient::handle_request(const JsonRpcRequest& request)
{
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = request_handler_;
    }

    if (!handler)
    {
        send_error_response(
            *request.id,
            static_cast<int>(JsonRpcErrorCode::MethodNotFound),
            "Method not found: " + request.method
        );
        return;
    }

    try
    {
        json result = handler(request.method, request.params);
        send_message(JsonRpcResponse{*request.id, std::move(result), std::nullopt}.to_json());
    }
    catch (const JsonRpcError& e)
    {
        send_error_response(*request.id, static_cast<int>(e.code()), e.what(), e.data());
    }
    catch (const TransportError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        send_error_response(*request.id, static_cast<int>(JsonRpcErrorCode::InternalError), e.what());
    }
}

void JsonRpcClient::fail_all_pending(JsonRpcErrorCode code, const std::string& message)
{
    std::map<int64_t, ResponseCallback> to_fail;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        to_fail.swap(pending_);
    }
    for (auto& [id, callback] : to_fail)
        if (callback)
            callback(nullptr, std::make_exception_ptr(JsonRpcError(code, message)));
}

} // namespace chatconsole
