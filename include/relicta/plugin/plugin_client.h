#pragma once

#include <relicta/core/types.h>
#include <relicta/plugin/handshake.h>
#include <relicta/plugin/jsonrpc_client.hpp>
#include <relicta/plugin/plugin_process.hpp>
#include <relicta/plugin/rpc_client.h>
#include <relicta/plugin/serve.h>
#include <relicta/plugin/streaming.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relicta::plugin {

inline constexpr std::string_view kEnvStartTimeoutMs = "RELICTA_PLUGIN_START_TIMEOUT_MS";
inline constexpr std::string_view kEnvGetInfoTimeoutMs = "RELICTA_PLUGIN_GETINFO_TIMEOUT_MS";

struct PluginClientConfig {
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> env;
    std::optional<std::filesystem::path> workdir;
    HandshakeConfig handshake = defaultHandshake();
    /// Time allowed between spawn and the handshake line
    std::chrono::milliseconds startTimeout{30000};
    std::chrono::milliseconds getInfoTimeout{kGetInfoTimeout};
    /// Connect to this running service instead of spawning executable
    std::optional<ReattachConfig> reattach;
    /// Tag for log lines; defaults to the executable's file name
    std::string name;
};

/// RELICTA_PLUGIN_START_TIMEOUT_MS and RELICTA_PLUGIN_GETINFO_TIMEOUT_MS win over the struct
void applyEnvironmentOverrides(PluginClientConfig& config);

/**
 * @brief Host-side handle to one plugin
 *
 * start() spawns the executable with the magic cookie, waits for its
 * handshake line, checks it and connects; with reattach set it only connects.
 * The dispensed IPlugin and the streaming client share the one connection.
 */
class PluginClient {
public:
    explicit PluginClient(PluginClientConfig config);
    ~PluginClient();

    PluginClient(const PluginClient&) = delete;
    PluginClient& operator=(const PluginClient&) = delete;

    /**
     * Failure modes: the executable cannot be started (InternalError), exits
     * before the handshake (NetworkError), stays silent past startTimeout
     * (Timeout), speaks another version (ProtocolMismatch) or another
     * transport (NotSupported).
     */
    Result<void> start();

    /// The plugin proxy; NotInitialized before a successful start()
    Result<std::shared_ptr<IPlugin>> dispense();

    /// Progress/log routing for this connection
    StreamingClient& streaming() { return streaming_; }

    /// Descriptor another host could use to reach the same service
    [[nodiscard]] std::optional<ReattachConfig> reattachConfig() const;

    /// True when the child process is gone (always false when reattached)
    [[nodiscard]] bool exited() const;

    /**
     * @brief Ask the plugin to shut down, close the connection and reap the process
     *
     * Safe to call more than once.
     */
    void kill();

    const PluginClientConfig& config() const { return config_; }

private:
    Result<void> launch();
    Result<std::string> awaitHandshake();
    Result<void> connect(const std::string& address);
    void abortLaunch();

    PluginClientConfig config_;
    std::string logName_;

    mutable std::mutex mutex_;
    std::unique_ptr<PluginProcess> process_;
    std::shared_ptr<JsonRpcClient> rpc_;
    std::shared_ptr<PluginRpcClient> plugin_;
    StreamingClient streaming_;
    std::optional<HandshakeLine> handshake_;
    bool killed_{false};
};

} // namespace relicta::plugin
