#include <relicta/plugin/jsonrpc_server.hpp>
#include <relicta/plugin/rpc_server.h>
#include <relicta/plugin/socket_server.h>
#include <relicta/plugin/transport.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <chrono>

#include <sys/un.h>

namespace relicta::plugin {

using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using local = boost::asio::local::stream_protocol;

PluginSocketServer::PluginSocketServer(Config config, std::shared_ptr<PluginRpcServer> service)
    : config_(std::move(config)), service_(std::move(service)) {}

PluginSocketServer::~PluginSocketServer() {
    if (running_.load()) {
        stop();
    }
}

Result<void> PluginSocketServer::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Plugin socket server already running"};
    }
    stopping_.store(false);
    {
        std::lock_guard lk(doneMutex_);
        done_ = false;
    }

    if (config_.socketPath.empty()) {
        running_ = false;
        return Error{ErrorCode::InvalidArgument, "Plugin socket path is empty"};
    }

    try {
        std::filesystem::path sockPath = config_.socketPath;
        if (!sockPath.is_absolute()) {
            sockPath = std::filesystem::absolute(sockPath);
        }

        std::string sp = sockPath.string();
        if (sp.size() >= sizeof(sockaddr_un::sun_path)) {
            running_ = false;
            return Error{ErrorCode::InvalidArgument,
                         "Socket path too long for AF_UNIX (" + std::to_string(sp.size()) + "/" +
                             std::to_string(sizeof(sockaddr_un::sun_path)) + ") : '" + sp + "'"};
        }

        std::error_code ec;
        std::filesystem::remove(sockPath, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            spdlog::warn("PluginSocketServer: Failed to remove existing socket: {}", ec.message());
        }
        auto parent = sockPath.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        io_context_.restart();
        work_guard_.emplace(io_context_.get_executor());

        acceptor_ = std::make_unique<local::acceptor>(io_context_);
        local::endpoint endpoint(sp);
        acceptor_->open(endpoint.protocol());
        acceptor_->bind(endpoint);
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);

        std::filesystem::permissions(sockPath, std::filesystem::perms::owner_read |
                                                   std::filesystem::perms::owner_write);
        actualSocketPath_ = sockPath;

        co_spawn(
            io_context_,
            [this]() -> awaitable<void> {
                co_await accept_loop();
                co_return;
            },
            detached);

        ioThread_ = std::thread([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                spdlog::error("PluginSocketServer: io thread exception: {}", e.what());
            }
        });

        spdlog::debug("PluginSocketServer: Listening on {}", sp);
        return {};
    } catch (const std::exception& e) {
        running_ = false;
        work_guard_.reset();
        if (acceptor_) {
            boost::system::error_code closeEc;
            acceptor_->close(closeEc);
        }
        spdlog::error("PluginSocketServer::start exception: {}", e.what());
        return Error{ErrorCode::NetworkError,
                     fmt::format("Failed to listen on {}: {}", config_.socketPath.string(),
                                 e.what())};
    }
}

Result<void> PluginSocketServer::stop() {
    if (!running_.exchange(false)) {
        return Error{ErrorCode::InvalidState, "Plugin socket server not running"};
    }
    spdlog::debug("PluginSocketServer: Stopping");
    stopping_.store(true);

    // The acceptor lives on the io thread
    boost::asio::post(io_context_, [this]() {
        if (acceptor_ && acceptor_->is_open()) {
            boost::system::error_code ec;
            acceptor_->close(ec);
        }
    });
    work_guard_.reset();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }

    std::vector<std::shared_ptr<JsonRpcServer>> servers;
    {
        std::lock_guard lk(activeServersMutex_);
        for (auto& weak : activeServers_) {
            if (auto server = weak.lock()) {
                servers.push_back(std::move(server));
            }
        }
        activeServers_.clear();
    }
    for (auto& server : servers) {
        server->stop();
    }
    servers.clear();

    std::vector<std::future<void>> futures;
    {
        std::lock_guard lk(connectionFuturesMutex_);
        futures = std::move(connectionFutures_);
        connectionFutures_.clear();
    }
    for (auto& fut : futures) {
        fut.wait();
    }

    if (!actualSocketPath_.empty()) {
        std::error_code ec;
        std::filesystem::remove(actualSocketPath_, ec);
    }

    spdlog::debug("PluginSocketServer: Stopped (total_conn={})", totalConnections_.load());
    markDone();
    return {};
}

void PluginSocketServer::wait() {
    std::unique_lock lk(doneMutex_);
    doneCv_.wait(lk, [this] { return done_; });
}

bool PluginSocketServer::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock lk(doneMutex_);
    return doneCv_.wait_for(lk, timeout, [this] { return done_; });
}

void PluginSocketServer::markDone() {
    {
        std::lock_guard lk(doneMutex_);
        done_ = true;
    }
    doneCv_.notify_all();
}

awaitable<void> PluginSocketServer::accept_loop() {
    spdlog::debug("PluginSocketServer: Accept loop started");

    while (running_ && !stopping_) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_->async_accept(redirect_error(use_awaitable, ec));

        if (ec) {
            if (!running_ || stopping_ || ec == boost::asio::error::operation_aborted) {
                break;
            }
            spdlog::warn("PluginSocketServer: Accept error: {} ({})", ec.message(), ec.value());
            boost::asio::steady_timer timer(io_context_);
            timer.expires_after(std::chrono::milliseconds(100));
            co_await timer.async_wait(redirect_error(use_awaitable, ec));
            continue;
        }

        auto current = activeConnections_.fetch_add(1) + 1;
        auto total = totalConnections_.fetch_add(1) + 1;
        spdlog::debug("PluginSocketServer: Accepted connection, active={} total={}", current,
                      total);

        {
            std::lock_guard lk(connectionFuturesMutex_);
            prune_completed_futures();
            connectionFutures_.push_back(
                std::async(std::launch::async, [this, s = std::move(socket)]() mutable {
                    handle_connection(std::move(s));
                }));
        }

        if (config_.maxConnections > 0 && total >= config_.maxConnections) {
            spdlog::debug("PluginSocketServer: Connection limit {} reached",
                          config_.maxConnections);
            boost::system::error_code closeEc;
            acceptor_->close(closeEc);
            break;
        }
    }

    spdlog::debug("PluginSocketServer: Accept loop ended");
}

void PluginSocketServer::handle_connection(local::socket socket) {
    struct CleanupGuard {
        PluginSocketServer* server;
        ~CleanupGuard() {
            auto current = server->activeConnections_.fetch_sub(1) - 1;
            spdlog::debug("PluginSocketServer: Connection closed, active: {}", current);
            auto limit = server->config_.maxConnections;
            if (current == 0 && limit > 0 && server->totalConnections_.load() >= limit) {
                server->markDone();
            }
        }
    } guard{this};

    try {
        auto transport = std::make_shared<SocketTransport>(std::move(socket));
        auto server = std::make_shared<JsonRpcServer>(transport);
        service_->bind(*server);
        server->setShutdownHandler([this]() { markDone(); });
        register_server(server);
        if (stopping_.load()) {
            server->stop();
        }
        server->run();
    } catch (const std::exception& e) {
        spdlog::error("PluginSocketServer::handle_connection error: {}", e.what());
    }
}

void PluginSocketServer::register_server(const std::shared_ptr<JsonRpcServer>& server) {
    std::lock_guard lk(activeServersMutex_);
    activeServers_.erase(std::remove_if(activeServers_.begin(), activeServers_.end(),
                                        [](const auto& weak) { return weak.expired(); }),
                         activeServers_.end());
    activeServers_.push_back(server);
}

void PluginSocketServer::prune_completed_futures() {
    // Caller must hold connectionFuturesMutex_
    connectionFutures_.erase(std::remove_if(connectionFutures_.begin(), connectionFutures_.end(),
                                            [](std::future<void>& f) {
                                                return f.wait_for(std::chrono::seconds(0)) ==
                                                       std::future_status::ready;
                                            }),
                             connectionFutures_.end());
}

} // namespace relicta::plugin
