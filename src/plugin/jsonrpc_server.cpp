#include <relicta/plugin/jsonrpc_server.hpp>
#include <relicta/plugin/wire.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace relicta::plugin {

namespace {

int errorCodeFor(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidData:
            return wire::kErrInvalidParams;
        case ErrorCode::OperationCancelled:
            return wire::kErrRequestCancelled;
        case ErrorCode::NotFound:
        case ErrorCode::NotSupported:
            return wire::kErrMethodNotFound;
        default:
            return wire::kErrInternal;
    }
}

} // namespace

JsonRpcServer::JsonRpcServer(std::shared_ptr<IStreamingTransport> transport)
    : transport_(std::move(transport)) {}

JsonRpcServer::~JsonRpcServer() {
    stop();
    drain();
}

void JsonRpcServer::registerMethod(std::string name, MethodHandler handler) {
    std::lock_guard lk(handlersMutex_);
    methods_[std::move(name)] = std::move(handler);
}

void JsonRpcServer::registerNotification(std::string name, NotificationHandler handler) {
    std::lock_guard lk(handlersMutex_);
    notifications_[std::move(name)] = std::move(handler);
}

void JsonRpcServer::setShutdownHandler(std::function<void()> handler) {
    std::lock_guard lk(handlersMutex_);
    shutdownHandler_ = std::move(handler);
}

std::size_t JsonRpcServer::inFlight() const {
    std::lock_guard lk(inFlightMutex_);
    return inFlight_.size();
}

std::string JsonRpcServer::idKey(const json& id) {
    return id.is_string() ? id.get<std::string>() : id.dump();
}

void JsonRpcServer::run() {
    if (running_.exchange(true)) {
        spdlog::warn("JsonRpcServer: run() called while already running");
        return;
    }
    spdlog::debug("JsonRpcServer: Serving connection");

    while (running_.load()) {
        auto message = transport_->receive();
        if (!message) {
            if (message.error().code == ErrorCode::InvalidData && transport_->isConnected()) {
                spdlog::warn("JsonRpcServer: {}", message.error().message);
                sendError(nullptr, wire::kErrParse, message.error().message);
                continue;
            }
            spdlog::debug("JsonRpcServer: Connection ended: {}", message.error().message);
            break;
        }
        try {
            handleMessage(message.value());
        } catch (const std::exception& e) {
            spdlog::warn("JsonRpcServer: Dropping message that could not be handled: {}",
                         e.what());
        }
    }

    running_.store(false);
    drain();
    transport_->close();
    spdlog::debug("JsonRpcServer: Stopped");
}

void JsonRpcServer::stop() {
    running_.store(false);
    shutdownSource_.request_stop();
    transport_->close();
}

void JsonRpcServer::handleMessage(const json& message) {
    if (!wire::isJsonRpc2(message) || !message.contains("method") ||
        !message["method"].is_string()) {
        json id = message.is_object() && message.contains("id") ? message["id"] : json(nullptr);
        sendError(id, wire::kErrInvalidRequest, "invalid JSON-RPC request");
        return;
    }

    auto method = message["method"].get<std::string>();
    json params = message.contains("params") ? message["params"] : json::object();

    if (!message.contains("id") || message["id"].is_null()) {
        if (method == wire::kNotifyCancelled) {
            if (params.contains("requestId")) {
                cancelRequest(params["requestId"]);
            } else if (params.contains("id")) {
                cancelRequest(params["id"]);
            } else {
                spdlog::warn("JsonRpcServer: cancel notification without requestId");
            }
            return;
        }
        if (method == wire::kNotifyShutdown) {
            spdlog::info("JsonRpcServer: Shutdown requested by host");
            std::function<void()> onShutdown;
            {
                std::lock_guard lk(handlersMutex_);
                onShutdown = shutdownHandler_;
            }
            running_.store(false);
            shutdownSource_.request_stop();
            if (onShutdown) {
                onShutdown();
            }
            return;
        }

        NotificationHandler handler;
        {
            std::lock_guard lk(handlersMutex_);
            if (auto it = notifications_.find(method); it != notifications_.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            spdlog::debug("JsonRpcServer: Ignoring notification '{}'", method);
            return;
        }
        try {
            handler(params);
        } catch (const std::exception& e) {
            spdlog::warn("JsonRpcServer: Notification '{}' handler threw: {}", method, e.what());
        }
        return;
    }

    dispatchRequest(message["id"], std::move(method), std::move(params));
}

void JsonRpcServer::dispatchRequest(json id, std::string method, json params) {
    MethodHandler handler;
    {
        std::lock_guard lk(handlersMutex_);
        if (auto it = methods_.find(method); it != methods_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        sendError(id, wire::kErrMethodNotFound, "method not found: " + method);
        return;
    }

    std::stop_source source;
    {
        std::lock_guard lk(inFlightMutex_);
        inFlight_[idKey(id)] = source;
    }

    auto task = [this, id = std::move(id), method = std::move(method), params = std::move(params),
                 handler = std::move(handler), source]() mutable {
        // Server shutdown also stops the request
        std::stop_callback onShutdown(shutdownSource_.get_token(),
                                      [&source] { source.request_stop(); });

        RequestContext ctx{id, source.get_token()};
        json response;
        try {
            auto result = handler(params, ctx);
            if (result) {
                response = {{"jsonrpc", wire::kJsonRpcVersion}, {"id", id}, {"result", result.value()}};
            } else {
                response = {{"jsonrpc", wire::kJsonRpcVersion},
                            {"id", id},
                            {"error",
                             {{"code", errorCodeFor(result.error())},
                              {"message", result.error().message}}}};
            }
        } catch (const std::exception& e) {
            spdlog::error("JsonRpcServer: Handler for '{}' threw: {}", method, e.what());
            response = {{"jsonrpc", wire::kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", wire::kErrInternal}, {"message", e.what()}}}};
        }

        {
            std::lock_guard lk(inFlightMutex_);
            inFlight_.erase(idKey(id));
        }
        if (auto sent = transport_->send(response); !sent) {
            spdlog::warn("JsonRpcServer: Failed to send response for '{}': {}", method,
                         sent.error().message);
        }
    };

    std::lock_guard lk(requestFuturesMutex_);
    prune_completed_futures();
    requestFutures_.push_back(std::async(std::launch::async, std::move(task)));
}

void JsonRpcServer::cancelRequest(const json& id) {
    std::lock_guard lk(inFlightMutex_);
    auto it = inFlight_.find(idKey(id));
    if (it == inFlight_.end()) {
        spdlog::debug("JsonRpcServer: Cancel for unknown request {}", idKey(id));
        return;
    }
    it->second.request_stop();
    spdlog::info("JsonRpcServer: Cancel requested for request {}", idKey(id));
}

void JsonRpcServer::sendError(const json& id, int code, const std::string& message) {
    json response = {{"jsonrpc", wire::kJsonRpcVersion},
                     {"id", id},
                     {"error", {{"code", code}, {"message", message}}}};
    if (auto sent = transport_->send(response); !sent) {
        spdlog::debug("JsonRpcServer: Failed to send error response: {}", sent.error().message);
    }
}

void JsonRpcServer::prune_completed_futures() {
    // Caller must hold requestFuturesMutex_
    requestFutures_.erase(std::remove_if(requestFutures_.begin(), requestFutures_.end(),
                                         [](std::future<void>& f) {
                                             return f.wait_for(std::chrono::seconds(0)) ==
                                                    std::future_status::ready;
                                         }),
                          requestFutures_.end());
}

void JsonRpcServer::drain() {
    shutdownSource_.request_stop();
    std::vector<std::future<void>> futures;
    {
        std::lock_guard lk(requestFuturesMutex_);
        futures = std::move(requestFutures_);
        requestFutures_.clear();
    }
    if (!futures.empty()) {
        spdlog::debug("JsonRpcServer: Waiting for {} in-flight requests", futures.size());
    }
    for (auto& fut : futures) {
        fut.wait();
    }
}

} // namespace relicta::plugin
