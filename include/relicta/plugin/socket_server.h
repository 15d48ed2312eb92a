#pragma once

#include <relicta/core/types.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace relicta::plugin {

class JsonRpcServer;
class PluginRpcServer;

/**
 * Unix socket listener serving the plugin service
 *
 * Every accepted connection gets its own JsonRpcServer bound to the shared
 * PluginRpcServer and runs on a dedicated thread until the host hangs up.
 */
class PluginSocketServer {
public:
    struct Config {
        std::filesystem::path socketPath;
        /// Stop accepting after this many connections; 0 means unlimited
        size_t maxConnections = 0;
    };

    PluginSocketServer(Config config, std::shared_ptr<PluginRpcServer> service);
    ~PluginSocketServer();

    PluginSocketServer(const PluginSocketServer&) = delete;
    PluginSocketServer& operator=(const PluginSocketServer&) = delete;

    // Lifecycle
    Result<void> start();
    Result<void> stop();
    bool isRunning() const { return running_.load(); }

    /**
     * Block until there is nothing left to serve: the host sent $/shutdown,
     * stop() was called, or the connection limit was reached and every
     * connection has closed.
     */
    void wait();

    /// wait() with a bound; true once there is nothing left to serve
    bool waitFor(std::chrono::milliseconds timeout);

    /// Path actually bound, absolute
    const std::filesystem::path& socketPath() const { return actualSocketPath_; }

    size_t activeConnections() const { return activeConnections_.load(); }
    uint64_t totalConnections() const { return totalConnections_.load(); }

private:
    boost::asio::awaitable<void> accept_loop();
    void handle_connection(boost::asio::local::stream_protocol::socket socket);
    void register_server(const std::shared_ptr<JsonRpcServer>& server);
    void prune_completed_futures();
    void markDone();

    Config config_;
    std::shared_ptr<PluginRpcServer> service_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> acceptor_;
    std::thread ioThread_;

    std::filesystem::path actualSocketPath_;

    std::atomic<size_t> activeConnections_{0};
    std::atomic<uint64_t> totalConnections_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::mutex activeServersMutex_;
    std::vector<std::weak_ptr<JsonRpcServer>> activeServers_;

    std::mutex connectionFuturesMutex_;
    std::vector<std::future<void>> connectionFutures_;

    std::mutex doneMutex_;
    std::condition_variable doneCv_;
    bool done_{false};
};

} // namespace relicta::plugin
