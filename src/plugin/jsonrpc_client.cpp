/**
 * @file jsonrpc_client.cpp
 * @brief Implementation of the multiplexing JSON-RPC 2.0 client
 */

#include <relicta/plugin/jsonrpc_client.hpp>
#include <relicta/plugin/wire.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace relicta::plugin {

namespace {

// Granularity for noticing stop requests while a call is in flight
constexpr std::chrono::milliseconds kPollSlice{25};

Error remoteError(const json& error) {
    if (!error.is_object()) {
        return Error{ErrorCode::RemoteError, "malformed error response: " + error.dump()};
    }
    int code = wire::kErrInternal;
    if (auto it = error.find("code"); it != error.end() && it->is_number_integer()) {
        code = it->get<int>();
    }
    std::string message = "unknown error";
    if (auto it = error.find("message"); it != error.end() && it->is_string()) {
        message = it->get<std::string>();
    }
    if (code == wire::kErrRequestCancelled) {
        return Error{ErrorCode::OperationCancelled, message};
    }
    return Error{ErrorCode::RemoteError, message + " (code " + std::to_string(code) + ")"};
}

} // namespace

JsonRpcClient::JsonRpcClient(std::shared_ptr<IStreamingTransport> transport)
    : transport_(std::move(transport)) {
    reader_ = std::jthread([this](std::stop_token stop) { readerLoop(stop); });
}

JsonRpcClient::~JsonRpcClient() {
    close();
}

void JsonRpcClient::setNotificationHandler(NotificationHandler handler) {
    std::lock_guard lk(handlerMutex_);
    notificationHandler_ = std::move(handler);
}

void JsonRpcClient::close() {
    reader_.request_stop();
    if (transport_) {
        transport_->close();
    }
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
}

Result<json> JsonRpcClient::call(std::string_view method, json params,
                                 std::chrono::milliseconds timeout) {
    return call(method, std::move(params), CallContext::withTimeout(timeout));
}

Result<json> JsonRpcClient::call(std::string_view method, json params, const CallContext& ctx) {
    if (!connected_.load()) {
        spdlog::warn("JsonRpcClient: Not connected, cannot call method '{}'", method);
        return Error{ErrorCode::NetworkError, "plugin connection is closed"};
    }

    int64_t id = next_id();
    std::future<Result<json>> future;
    {
        std::lock_guard lk(pendingMutex_);
        future = pending_[id].get_future();
    }

    spdlog::debug("JsonRpcClient: Sending request id={} method='{}'", id, method);
    if (auto sent = transport_->send(build_request(id, method, std::move(params))); !sent) {
        std::lock_guard lk(pendingMutex_);
        pending_.erase(id);
        spdlog::error("JsonRpcClient: Failed to send '{}': {}", method, sent.error().message);
        return sent.error();
    }

    return await(id, method, std::move(future), ctx);
}

Result<json> JsonRpcClient::await(int64_t id, std::string_view method,
                                  std::future<Result<json>> future, const CallContext& ctx) {
    bool cancelSent = false;
    while (true) {
        auto slice = kPollSlice;
        if (ctx.deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *ctx.deadline - std::chrono::steady_clock::now());
            slice = std::clamp(remaining, std::chrono::milliseconds{0}, kPollSlice);
        }

        if (future.wait_for(slice) == std::future_status::ready) {
            spdlog::debug("JsonRpcClient: Got response for id={} method='{}'", id, method);
            return future.get();
        }

        if (!cancelSent && ctx.stop.stop_requested()) {
            spdlog::debug("JsonRpcClient: Cancelling id={} method='{}'", id, method);
            notify(wire::kNotifyCancelled, json{{"requestId", id}});
            cancelSent = true;
        }

        if (ctx.deadline && std::chrono::steady_clock::now() >= *ctx.deadline) {
            {
                std::lock_guard lk(pendingMutex_);
                pending_.erase(id);
            }
            if (!cancelSent) {
                notify(wire::kNotifyCancelled, json{{"requestId", id}});
            }
            spdlog::warn("JsonRpcClient: Deadline exceeded waiting for response to '{}' (id={})",
                         method, id);
            return Error{ErrorCode::Timeout,
                         "deadline exceeded waiting for " + std::string(method)};
        }
    }
}

void JsonRpcClient::notify(std::string_view method, json params) {
    if (!connected_.load()) {
        spdlog::debug("JsonRpcClient: Not connected, dropping notification '{}'", method);
        return;
    }
    transport_->sendAsync(build_notification(method, std::move(params)));
}

void JsonRpcClient::readerLoop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto message = transport_->receive();
        if (!message) {
            if (message.error().code == ErrorCode::InvalidData && transport_->isConnected()) {
                spdlog::warn("JsonRpcClient: Skipping malformed frame: {}", message.error().message);
                continue;
            }
            if (!stop.stop_requested()) {
                spdlog::debug("JsonRpcClient: Reader stopping: {}", message.error().message);
            }
            break;
        }

        try {
            handleMessage(message.value());
        } catch (const std::exception& e) {
            spdlog::warn("JsonRpcClient: Dropping message that could not be handled: {}",
                         e.what());
        }
    }

    connected_.store(false);
    failPending(Error{ErrorCode::NetworkError, "plugin connection lost"});
}

void JsonRpcClient::handleMessage(const json& msg) {
    if (!wire::isJsonRpc2(msg)) {
        spdlog::error("JsonRpcClient: Invalid JSON-RPC version in message");
        return;
    }

    bool hasMethod = msg.contains("method");
    bool hasId = msg.contains("id") && !msg["id"].is_null();
    if (hasMethod && !msg["method"].is_string()) {
        spdlog::warn("JsonRpcClient: Ignoring message with non-string method {}",
                     msg["method"].dump());
        return;
    }
    if (hasMethod && !hasId) {
        auto method = msg["method"].get<std::string>();
        json params = msg.contains("params") ? msg["params"] : json::object();
        NotificationHandler handler;
        {
            std::lock_guard lk(handlerMutex_);
            handler = notificationHandler_;
        }
        if (!handler) {
            return;
        }
        try {
            handler(method, params);
        } catch (const std::exception& e) {
            spdlog::warn("JsonRpcClient: Notification handler for '{}' threw: {}", method,
                         e.what());
        }
    } else if (hasMethod) {
        // Plugins have no business calling the host
        json reply = {{"jsonrpc", wire::kJsonRpcVersion},
                      {"id", msg["id"]},
                      {"error",
                       {{"code", wire::kErrMethodNotFound},
                        {"message", "host does not serve " + msg["method"].get<std::string>()}}}};
        transport_->sendAsync(std::move(reply));
    } else if (hasId) {
        dispatchResponse(msg);
    }
}

void JsonRpcClient::dispatchResponse(const json& message) {
    if (!message["id"].is_number_integer()) {
        spdlog::debug("JsonRpcClient: Discarding response with foreign id {}",
                      message["id"].dump());
        return;
    }
    auto id = message["id"].get<int64_t>();

    std::promise<Result<json>> promise;
    {
        std::lock_guard lk(pendingMutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            // Late answer to a call that already timed out
            spdlog::debug("JsonRpcClient: Discarding response for stale id={}", id);
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }

    if (message.contains("error")) {
        auto error = remoteError(message["error"]);
        spdlog::debug("JsonRpcClient: RPC error for id={}: {}", id, error.message);
        promise.set_value(std::move(error));
    } else if (!message.contains("result")) {
        promise.set_value(Error{ErrorCode::InvalidData, "response missing 'result' field"});
    } else {
        promise.set_value(Result<json>(message["result"]));
    }
}

void JsonRpcClient::failPending(const Error& error) {
    std::unordered_map<int64_t, std::promise<Result<json>>> pending;
    {
        std::lock_guard lk(pendingMutex_);
        pending.swap(pending_);
    }
    for (auto& [id, promise] : pending) {
        promise.set_value(error);
    }
}

json JsonRpcClient::build_request(int64_t id, std::string_view method, json params) {
    json request = {{"jsonrpc", wire::kJsonRpcVersion}, {"id", id}, {"method", method}};

    if (!params.is_null()) {
        request["params"] = std::move(params);
    }

    return request;
}

json JsonRpcClient::build_notification(std::string_view method, json params) {
    json notification = {{"jsonrpc", wire::kJsonRpcVersion}, {"method", method}};

    if (!params.is_null()) {
        notification["params"] = std::move(params);
    }

    return notification;
}

} // namespace relicta::plugin
