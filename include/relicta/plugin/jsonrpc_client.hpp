/**
 * @file jsonrpc_client.hpp
 * @brief Multiplexing JSON-RPC 2.0 client for host -> plugin calls
 *
 * A single reader thread owns the inbound side of the transport. Responses are
 * routed by id to the waiting caller; notifications go to the notification
 * handler, so progress and log events arrive while a call is outstanding.
 */

#pragma once

#include <relicta/core/types.h>
#include <relicta/plugin/plugin.h>
#include <relicta/plugin/transport.h>

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace relicta::plugin {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 client
 *
 * Example:
 * @code
 * auto transport = SocketTransport::connect("/tmp/plugin.sock");
 * JsonRpcClient client{std::move(transport).value()};
 * auto info = client.call("Plugin.GetInfo", json::object(), std::chrono::seconds{5});
 * @endcode
 */
class JsonRpcClient {
public:
    using NotificationHandler = std::function<void(const std::string& method, const json& params)>;

    explicit JsonRpcClient(std::shared_ptr<IStreamingTransport> transport);
    ~JsonRpcClient();

    JsonRpcClient(const JsonRpcClient&) = delete;
    JsonRpcClient& operator=(const JsonRpcClient&) = delete;

    /**
     * @brief Install the handler for inbound notifications
     *
     * Runs on the reader thread; it must not block on a call made through this
     * client.
     */
    void setNotificationHandler(NotificationHandler handler);

    /**
     * @brief Call with a fixed timeout
     * @return result member of the response; Timeout, NetworkError or RemoteError otherwise
     */
    [[nodiscard]] Result<json> call(std::string_view method, json params,
                                    std::chrono::milliseconds timeout);

    /**
     * @brief Call bounded by the caller's context
     *
     * A stop request sends notifications/cancelled once and keeps waiting for
     * the peer's answer. Only the deadline (if any) aborts the wait.
     */
    [[nodiscard]] Result<json> call(std::string_view method, json params, const CallContext& ctx);

    /// Send a notification (no response expected)
    void notify(std::string_view method, json params = nullptr);

    [[nodiscard]] bool isConnected() const noexcept { return connected_.load(); }

    /// Close the transport and join the reader
    void close();

    [[nodiscard]] int64_t next_id() noexcept {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

private:
    void readerLoop(std::stop_token stop);
    void handleMessage(const json& msg);
    void dispatchResponse(const json& message);
    void failPending(const Error& error);

    Result<json> await(int64_t id, std::string_view method,
                       std::future<Result<json>> future, const CallContext& ctx);

    [[nodiscard]] static json build_request(int64_t id, std::string_view method, json params);
    [[nodiscard]] static json build_notification(std::string_view method, json params);

    std::shared_ptr<IStreamingTransport> transport_;
    std::atomic<int64_t> next_id_{1};
    std::atomic<bool> connected_{true};

    std::mutex pendingMutex_;
    std::unordered_map<int64_t, std::promise<Result<json>>> pending_;

    std::mutex handlerMutex_;
    NotificationHandler notificationHandler_;

    std::jthread reader_;
};

} // namespace relicta::plugin
