/**
 * @file jsonrpc_server.hpp
 * @brief JSON-RPC 2.0 dispatcher serving one transport
 */

#pragma once

#include <relicta/core/types.h>
#include <relicta/plugin/transport.h>

#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace relicta::plugin {

using json = nlohmann::json;

/**
 * @brief Per-request view handed to method handlers
 */
struct RequestContext {
    json id;
    /// Fires on notifications/cancelled for this id or on server shutdown
    std::stop_token stop;
};

/**
 * @brief Reads requests from a transport and dispatches them to handlers
 *
 * Each request runs on its own task so a long Execute does not hold up a
 * cancellation notification or a concurrent GetInfo. A handler returning an
 * error becomes a JSON-RPC error response; a handler throwing becomes an
 * internal error response. notifications/cancelled and $/shutdown are handled
 * by the server itself.
 */
class JsonRpcServer {
public:
    using MethodHandler = std::function<Result<json>(const json& params, const RequestContext& ctx)>;
    using NotificationHandler = std::function<void(const json& params)>;

    explicit JsonRpcServer(std::shared_ptr<IStreamingTransport> transport);
    ~JsonRpcServer();

    JsonRpcServer(const JsonRpcServer&) = delete;
    JsonRpcServer& operator=(const JsonRpcServer&) = delete;

    void registerMethod(std::string name, MethodHandler handler);
    void registerNotification(std::string name, NotificationHandler handler);

    /// Invoked once after the peer sent $/shutdown
    void setShutdownHandler(std::function<void()> handler);

    /**
     * @brief Serve until the transport closes or stop() is called
     *
     * On return every in-flight request has been asked to stop and has
     * finished.
     */
    void run();

    /// Close the transport; run() returns shortly after
    void stop();

    [[nodiscard]] const std::shared_ptr<IStreamingTransport>& transport() const noexcept {
        return transport_;
    }

    [[nodiscard]] std::size_t inFlight() const;

private:
    void handleMessage(const json& message);
    void dispatchRequest(json id, std::string method, json params);
    void cancelRequest(const json& id);
    void sendError(const json& id, int code, const std::string& message);
    void prune_completed_futures();
    void drain();

    static std::string idKey(const json& id);

    std::shared_ptr<IStreamingTransport> transport_;
    std::atomic<bool> running_{false};
    std::stop_source shutdownSource_;

    std::mutex handlersMutex_;
    std::unordered_map<std::string, MethodHandler> methods_;
    std::unordered_map<std::string, NotificationHandler> notifications_;
    std::function<void()> shutdownHandler_;

    mutable std::mutex inFlightMutex_;
    std::unordered_map<std::string, std::stop_source> inFlight_;

    std::mutex requestFuturesMutex_;
    std::vector<std::future<void>> requestFutures_;
};

} // namespace relicta::plugin
