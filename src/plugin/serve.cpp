#include <relicta/plugin/rpc_server.h>
#include <relicta/plugin/serve.h>
#include <relicta/plugin/socket_server.h>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>

#include <unistd.h>

namespace relicta::plugin {

namespace detail {

struct ServeTestState {
    std::promise<void> shutdown;
    std::once_flag closeOnce;
    std::thread worker;

    void close() {
        std::call_once(closeOnce, [this] { shutdown.set_value(); });
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }

    ~ServeTestState() { close(); }
};

} // namespace detail

namespace {

// stdout belongs to the handshake line
void configurePluginLogging(const std::string& name) {
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, stderr_sink);
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::info);
    if (const char* raw = std::getenv(kEnvLogLevel.data()); raw && *raw) {
        auto level = spdlog::level::from_str(raw);
        if (level == spdlog::level::off && std::string_view(raw) != "off") {
            spdlog::warn("Unknown {} '{}', keeping info", kEnvLogLevel, raw);
        } else {
            spdlog::set_level(level);
        }
    }
}

} // namespace

std::filesystem::path makeSocketPath() {
    static std::atomic<uint64_t> counter{0};
    std::filesystem::path dir;
    if (const char* raw = std::getenv(kEnvUnixSocketDir.data()); raw && *raw) {
        dir = raw;
    } else {
        std::error_code ec;
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            dir = "/tmp";
        }
    }
    return dir / fmt::format("relicta-plugin-{}-{}.sock", ::getpid(), counter.fetch_add(1));
}

ServeTestHandle::ServeTestHandle(ReattachConfig reattach,
                                 std::shared_ptr<detail::ServeTestState> state)
    : reattach_(std::move(reattach)), state_(std::move(state)) {}

void ServeTestHandle::close() const {
    if (state_) {
        state_->close();
    }
}

void serve(std::shared_ptr<IPlugin> impl, ServeConfig cfg) {
    configurePluginLogging(cfg.pluginName);
    std::signal(SIGPIPE, SIG_IGN);

    if (!isPlugin(cfg.handshake)) {
        std::fprintf(stderr,
                     "This binary is a plugin. These are not meant to be executed directly.\n"
                     "Please execute the program that consumes these plugins, which will\n"
                     "load any plugins automatically.\n");
        std::exit(1);
    }

    auto version = negotiateProtocolVersion(cfg.handshake);
    if (!version) {
        spdlog::critical("Plugin: {}", version.error().message);
        std::exit(1);
    }

    auto service = std::make_shared<PluginRpcServer>(std::move(impl), cfg.pluginName);
    // A launched plugin serves exactly the host that started it
    PluginSocketServer server({makeSocketPath(), 1}, service);
    if (auto started = server.start(); !started) {
        spdlog::critical("Plugin: failed to listen: {}", started.error().message);
        std::exit(1);
    }

    HandshakeLine line;
    line.appVersion = version.value();
    line.address = server.socketPath().string();
    std::cout << formatHandshakeLine(line) << std::endl;

    server.wait();
    server.stop();
    spdlog::debug("Plugin: Exiting");
}

Result<ServeTestHandle> serveTest(std::shared_ptr<IPlugin> impl, ServeTestConfig cfg) {
    auto state = std::make_shared<detail::ServeTestState>();
    std::promise<Result<ReattachConfig>> ready;
    auto readyFuture = ready.get_future();
    auto shutdownFuture = state->shutdown.get_future();

    auto socketPath = cfg.socketPath.empty() ? makeSocketPath() : cfg.socketPath;
    state->worker = std::thread([impl = std::move(impl), cfg = std::move(cfg), socketPath,
                                 ready = std::move(ready),
                                 shutdownFuture = std::move(shutdownFuture)]() mutable {
        auto service = std::make_shared<PluginRpcServer>(std::move(impl), cfg.pluginName);
        PluginSocketServer server({socketPath, 0}, service);
        if (auto started = server.start(); !started) {
            ready.set_value(started.error());
            return;
        }

        ReattachConfig reattach;
        reattach.protocolVersion = cfg.handshake.protocolVersion;
        reattach.address = server.socketPath().string();
        reattach.pid = static_cast<int>(::getpid());
        reattach.test = true;
        ready.set_value(std::move(reattach));

        shutdownFuture.wait();
        server.stop();
    });

    auto result = readyFuture.get();
    if (!result) {
        state->close();
        return result.error();
    }
    return ServeTestHandle(std::move(result).value(), std::move(state));
}

} // namespace relicta::plugin
