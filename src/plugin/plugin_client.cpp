#include <relicta/plugin/plugin_client.h>
#include <relicta/plugin/transport.h>
#include <relicta/plugin/wire.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>

namespace relicta::plugin {

namespace {

std::optional<std::chrono::milliseconds> envMillis(std::string_view name) {
    const char* raw = std::getenv(name.data());
    if (!raw || !*raw) {
        return std::nullopt;
    }
    std::string_view text(raw);
    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value <= 0) {
        spdlog::warn("PluginClient: Ignoring {}='{}' (expected milliseconds)", name, text);
        return std::nullopt;
    }
    return std::chrono::milliseconds(value);
}

} // namespace

void applyEnvironmentOverrides(PluginClientConfig& config) {
    if (auto ms = envMillis(kEnvStartTimeoutMs)) {
        config.startTimeout = *ms;
    }
    if (auto ms = envMillis(kEnvGetInfoTimeoutMs)) {
        config.getInfoTimeout = *ms;
    }
}

PluginClient::PluginClient(PluginClientConfig config) : config_(std::move(config)) {
    applyEnvironmentOverrides(config_);
    logName_ = !config_.name.empty() ? config_.name : config_.executable.filename().string();
    if (logName_.empty()) {
        logName_ = "plugin";
    }
}

PluginClient::~PluginClient() {
    kill();
}

Result<void> PluginClient::start() {
    std::lock_guard lk(mutex_);
    if (killed_) {
        return Error{ErrorCode::InvalidState, "plugin client was killed"};
    }
    if (rpc_) {
        return {};
    }

    if (config_.reattach) {
        const auto& reattach = *config_.reattach;
        if (reattach.network != kNetworkUnix || reattach.protocol != kProtocolJsonRpc) {
            return Error{ErrorCode::NotSupported,
                         fmt::format("unsupported reattach transport {}/{}", reattach.network,
                                     reattach.protocol)};
        }
        if (reattach.protocolVersion != config_.handshake.protocolVersion) {
            return Error{ErrorCode::ProtocolMismatch,
                         fmt::format("plugin speaks protocol {}, host speaks {}",
                                     reattach.protocolVersion, config_.handshake.protocolVersion)};
        }
        HandshakeLine line;
        line.appVersion = reattach.protocolVersion;
        line.address = reattach.address;
        handshake_ = line;
        spdlog::debug("PluginClient: Reattaching '{}' at {}", logName_, reattach.address);
        return connect(reattach.address);
    }

    return launch();
}

Result<void> PluginClient::launch() {
    PluginProcessConfig pc;
    pc.executable = config_.executable;
    pc.args = config_.args;
    pc.env = config_.env;
    pc.workdir = config_.workdir;
    pc.log_name = logName_;
    pc.with_env(config_.handshake.magicCookieKey, config_.handshake.magicCookieValue)
        .with_env(std::string(kEnvProtocolVersions),
                  std::to_string(config_.handshake.protocolVersion));

    try {
        process_ = std::make_unique<PluginProcess>(std::move(pc));
    } catch (const std::exception& e) {
        spdlog::error("PluginClient: Failed to start '{}': {}", logName_, e.what());
        return Error{ErrorCode::InternalError, e.what()};
    }
    spdlog::debug("PluginClient: Started '{}' pid={}", logName_, process_->pid());

    auto raw = awaitHandshake();
    if (!raw) {
        abortLaunch();
        return raw.error();
    }
    // Anything the plugin prints after the handshake is only worth a log line
    process_->forward_stdout();

    auto line = verifyHandshake(raw.value(), config_.handshake);
    if (!line) {
        spdlog::error("PluginClient: '{}' handshake rejected: {}", logName_,
                      line.error().message);
        abortLaunch();
        return line.error();
    }
    handshake_ = line.value();

    if (auto connected = connect(handshake_->address); !connected) {
        abortLaunch();
        return connected;
    }
    return {};
}

Result<std::string> PluginClient::awaitHandshake() {
    using namespace std::chrono_literals;
    const auto deadline = std::chrono::steady_clock::now() + config_.startTimeout;

    auto exitedEarly = [this]() -> Error {
        (void)process_->wait_for_exit(200ms);
        auto code = process_->exit_code();
        auto tail = process_->stderr_tail();
        return Error{ErrorCode::NetworkError,
                     fmt::format("plugin '{}' exited before completing the handshake{}{}",
                                 logName_,
                                 code ? fmt::format(" (exit code {})", *code) : std::string{},
                                 tail.empty() ? std::string{} : ": " + tail)};
    };

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return Error{ErrorCode::Timeout,
                         fmt::format("timed out after {}ms waiting for plugin '{}' handshake",
                                     config_.startTimeout.count(), logName_)};
        }
        auto slice = std::min<std::chrono::milliseconds>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now), 100ms);

        if (auto line = process_->read_line(slice)) {
            if (line->find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            return *line;
        }
        if (process_->stdout_eof()) {
            return exitedEarly();
        }
        if (!process_->is_alive()) {
            // The pump may still hold the last line
            if (auto line = process_->read_line(200ms)) {
                return *line;
            }
            return exitedEarly();
        }
    }
}

Result<void> PluginClient::connect(const std::string& address) {
    auto transport = SocketTransport::connect(address);
    if (!transport) {
        return transport.error();
    }
    std::shared_ptr<IStreamingTransport> shared = std::move(transport).value();
    rpc_ = std::make_shared<JsonRpcClient>(std::move(shared));
    rpc_->setNotificationHandler([this](const std::string& method, const json& params) {
        streaming_.handleNotification(method, params);
    });
    plugin_ = std::make_shared<PluginRpcClient>(rpc_, config_.getInfoTimeout);
    streaming_.attach(plugin_);
    spdlog::debug("PluginClient: Connected to '{}' at {}", logName_, address);
    return {};
}

void PluginClient::abortLaunch() {
    if (process_) {
        process_->terminate(std::chrono::seconds{1});
        process_.reset();
    }
}

Result<std::shared_ptr<IPlugin>> PluginClient::dispense() {
    std::lock_guard lk(mutex_);
    if (!plugin_) {
        return Error{ErrorCode::NotInitialized, "plugin client is not started"};
    }
    return std::shared_ptr<IPlugin>(plugin_);
}

std::optional<ReattachConfig> PluginClient::reattachConfig() const {
    std::lock_guard lk(mutex_);
    if (!handshake_ || !rpc_) {
        return std::nullopt;
    }
    ReattachConfig reattach;
    reattach.protocol = handshake_->protocol;
    reattach.protocolVersion = handshake_->appVersion;
    reattach.network = handshake_->network;
    reattach.address = handshake_->address;
    if (process_) {
        reattach.pid = static_cast<int>(process_->pid());
    } else if (config_.reattach) {
        reattach.pid = config_.reattach->pid;
        reattach.test = config_.reattach->test;
    }
    return reattach;
}

bool PluginClient::exited() const {
    std::lock_guard lk(mutex_);
    return process_ && !process_->is_alive();
}

void PluginClient::kill() {
    std::lock_guard lk(mutex_);
    if (killed_) {
        return;
    }
    killed_ = true;

    if (rpc_) {
        if (rpc_->isConnected()) {
            rpc_->notify(wire::kNotifyShutdown, json::object());
        }
        rpc_->close();
    }
    if (process_) {
        if (!process_->wait_for_exit(std::chrono::seconds{2})) {
            spdlog::warn("PluginClient: '{}' ignored shutdown, terminating", logName_);
            process_->terminate();
        }
        spdlog::debug("PluginClient: '{}' exited with {}", logName_,
                      process_->exit_code().value_or(-1));
    }
}

} // namespace relicta::plugin
