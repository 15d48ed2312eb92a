#pragma once

#include <relicta/core/types.h>
#include <relicta/plugin/audit.h>
#include <relicta/plugin/plugin_client.h>
#include <relicta/plugin/plugin_discovery.h>
#include <relicta/plugin/streaming.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relicta::plugin {

inline constexpr std::size_t kMaxConcurrentPluginExecutions = 10;
inline constexpr std::chrono::milliseconds kDefaultPluginTimeout{30000};
inline constexpr std::chrono::milliseconds kMaxGlobalHookTimeout{120000};

/**
 * @brief One plugin to load
 */
struct PluginSpec {
    std::string name; ///< [A-Za-z0-9_-]{1,64}
    /// Empty: look up <pluginDir>/<name>. Either way it must resolve into a plugin dir
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> env;
    /// Sent with every Execute; validated at load unless null
    ConfigMap config;
    /// Per-execution timeout; 0 selects PluginHostConfig::defaultPluginTimeout
    std::chrono::milliseconds timeout{0};
    std::optional<ReattachConfig> reattach;
};

struct PluginHostConfig {
    std::size_t maxConcurrentExecutions = kMaxConcurrentPluginExecutions;
    std::chrono::milliseconds defaultPluginTimeout = kDefaultPluginTimeout;
    std::chrono::milliseconds globalHookTimeout = kMaxGlobalHookTimeout;
    std::chrono::milliseconds startTimeout{30000};

    /// Only binaries resolving into one of these are spawned
    std::vector<std::filesystem::path> pluginDirs = defaultPluginDirs();
    /// Receives load, unload and execution records; null logs them through spdlog's default
    std::shared_ptr<spdlog::logger> auditLogger;

    /// Progress of every execution, tagged with the plugin name
    std::function<void(const std::string& plugin, const ProgressEvent&)> onProgress;
    /// Log records of every execution, tagged with the plugin name
    std::function<void(const std::string& plugin, const LogNotification&)> onLog;
};

struct HookResult {
    std::string plugin;
    ExecuteResponse response;
};

/**
 * @brief Loads plugins and fans lifecycle hooks out to them
 *
 * A plugin that fails, hangs or dies only produces a failed HookResult; the
 * host itself keeps going.
 */
class PluginHost {
public:
    explicit PluginHost(PluginHostConfig config = {});
    ~PluginHost();

    PluginHost(const PluginHost&) = delete;
    PluginHost& operator=(const PluginHost&) = delete;

    /**
     * @brief Start a plugin, fetch its Info and validate its configuration
     *
     * The plugin is killed again on any failure. An invalid configuration is
     * a ValidationError listing "field: message" pairs.
     */
    Result<Info> load(const PluginSpec& spec);

    Result<void> unload(const std::string& name);

    /// Info of every loaded plugin, in load order
    [[nodiscard]] std::vector<Info> listLoaded() const;

    [[nodiscard]] Result<Info> info(const std::string& name) const;

    /**
     * @brief Run hook on every loaded plugin that declares it
     *
     * Executions run concurrently, bounded by maxConcurrentExecutions. Each
     * gets the plugin's timeout, and all of them share globalHookTimeout.
     * Results come back in load order; a plugin that produced an empty
     * response is left out.
     */
    std::vector<HookResult> executeHook(const Hook& hook, const ReleaseContext& context,
                                        bool dryRun, std::stop_token stop = {});

    /// Kill every plugin
    void shutdown();

private:
    struct LoadedPlugin {
        std::string name;
        std::unique_ptr<PluginClient> client;
        std::shared_ptr<IPlugin> plugin;
        Info info;
        ConfigMap config;
        std::chrono::milliseconds timeout{0};
    };

    PluginHostConfig config_;

    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<LoadedPlugin>> plugins_;
};

/// InvalidArgument naming the first rule the plugin name breaks
[[nodiscard]] Result<void> validatePluginName(std::string_view name);

} // namespace relicta::plugin
