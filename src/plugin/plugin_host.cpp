#include <relicta/plugin/plugin_host.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <mutex>
#include <semaphore>

namespace relicta::plugin {

namespace {

ExecuteResponse failedResponse(std::string error) {
    ExecuteResponse resp;
    resp.success = false;
    resp.error = std::move(error);
    return resp;
}

bool isEmptyResponse(const ExecuteResponse& resp) {
    return !resp.success && resp.error.empty() && resp.message.empty() &&
           (resp.outputs.is_null() || resp.outputs.empty());
}

} // namespace

Result<void> validatePluginName(std::string_view name) {
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_';
        if (!ok) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("plugin name contains invalid character: '{}'", c)};
        }
    }
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "plugin name cannot be empty"};
    }
    if (name.size() > 64) {
        return Error{ErrorCode::InvalidArgument, "plugin name too long (max 64 characters)"};
    }
    return {};
}

PluginHost::PluginHost(PluginHostConfig config) : config_(std::move(config)) {
    if (config_.maxConcurrentExecutions == 0) {
        config_.maxConcurrentExecutions = 1;
        spdlog::warn("PluginHost: maxConcurrentExecutions was 0; coercing to 1");
    }
}

PluginHost::~PluginHost() {
    shutdown();
}

Result<Info> PluginHost::load(const PluginSpec& spec) {
    auto reject = [&](AuditEventType type, Error error) -> Error {
        AuditEvent event;
        event.type = type;
        event.plugin = spec.name;
        event.error = error.message;
        recordAuditEvent(config_.auditLogger, event);
        return error;
    };

    if (auto valid = validatePluginName(spec.name); !valid) {
        return reject(AuditEventType::Rejected,
                      Error{valid.error().code, "invalid plugin name: " + valid.error().message});
    }
    {
        std::shared_lock lk(mutex_);
        for (const auto& lp : plugins_) {
            if (lp->name == spec.name) {
                return Error{ErrorCode::InvalidState,
                             fmt::format("plugin already loaded: {}", spec.name)};
            }
        }
    }

    PluginClientConfig clientConfig;
    if (!spec.reattach) {
        auto binary = findPluginBinary(spec.name, spec.executable, config_.pluginDirs);
        if (!binary) {
            spdlog::error("PluginHost: Refusing to load plugin '{}': {}", spec.name,
                          binary.error().message);
            return reject(AuditEventType::Rejected,
                          Error{binary.error().code,
                                "failed to find plugin binary: " + binary.error().message});
        }
        clientConfig.executable = binary.value();
    }

    spdlog::debug("PluginHost: Loading plugin '{}' from {}", spec.name,
                  clientConfig.executable.string());

    clientConfig.args = spec.args;
    clientConfig.env = spec.env;
    clientConfig.startTimeout = config_.startTimeout;
    clientConfig.reattach = spec.reattach;
    clientConfig.name = spec.name;

    auto loaded = std::make_shared<LoadedPlugin>();
    loaded->name = spec.name;
    loaded->config = spec.config;
    loaded->timeout = spec.timeout.count() > 0 ? spec.timeout : config_.defaultPluginTimeout;
    loaded->client = std::make_unique<PluginClient>(std::move(clientConfig));

    if (auto started = loaded->client->start(); !started) {
        spdlog::error("PluginHost: Failed to connect to plugin '{}': {}", spec.name,
                      started.error().message);
        return reject(AuditEventType::Load,
                      Error{started.error().code,
                            "failed to connect to plugin: " + started.error().message});
    }

    auto dispensed = loaded->client->dispense();
    if (!dispensed) {
        loaded->client->kill();
        return reject(AuditEventType::Load,
                      Error{dispensed.error().code,
                            "failed to dispense plugin: " + dispensed.error().message});
    }
    loaded->plugin = dispensed.value();

    loaded->info = loaded->plugin->getInfo();
    if (loaded->info.name.empty()) {
        loaded->client->kill();
        return reject(AuditEventType::Load,
                      Error{ErrorCode::InvalidData,
                            fmt::format("plugin '{}' returned no info", spec.name)});
    }

    if (!spec.config.is_null()) {
        auto validated = loaded->plugin->validate(CallContext::withTimeout(loaded->timeout),
                                                  spec.config);
        if (!validated) {
            loaded->client->kill();
            return reject(AuditEventType::Load,
                          Error{validated.error().code, "failed to validate plugin config: " +
                                                            validated.error().message});
        }
        if (!validated.value().valid) {
            loaded->client->kill();
            std::vector<std::string> messages;
            for (const auto& e : validated.value().errors) {
                messages.push_back(fmt::format("{}: {}", e.field, e.message));
            }
            return reject(AuditEventType::Load,
                          Error{ErrorCode::ValidationError,
                                fmt::format("invalid plugin configuration: {}",
                                            fmt::join(messages, "; "))});
        }
    }

    std::vector<std::string> hookNames;
    for (const auto& h : loaded->info.hooks) {
        hookNames.push_back(h.str());
    }
    spdlog::info("PluginHost: Plugin loaded name={} version={} hooks=[{}]", spec.name,
                 loaded->info.version, fmt::join(hookNames, ", "));

    AuditEvent event;
    event.type = AuditEventType::Load;
    event.plugin = spec.name;
    event.success = true;
    event.metadata = {{"version", loaded->info.version}};
    recordAuditEvent(config_.auditLogger, event);

    Info info = loaded->info;
    {
        std::unique_lock lk(mutex_);
        plugins_.push_back(std::move(loaded));
    }
    return info;
}

Result<void> PluginHost::unload(const std::string& name) {
    std::shared_ptr<LoadedPlugin> removed;
    {
        std::unique_lock lk(mutex_);
        auto it = std::find_if(plugins_.begin(), plugins_.end(),
                               [&](const auto& lp) { return lp->name == name; });
        if (it == plugins_.end()) {
            return Error{ErrorCode::NotFound, fmt::format("plugin not found: {}", name)};
        }
        removed = std::move(*it);
        plugins_.erase(it);
    }
    spdlog::debug("PluginHost: Unloading plugin '{}'", name);
    removed->client->kill();

    AuditEvent event;
    event.type = AuditEventType::Unload;
    event.plugin = name;
    event.success = true;
    recordAuditEvent(config_.auditLogger, event);
    return {};
}

std::vector<Info> PluginHost::listLoaded() const {
    std::shared_lock lk(mutex_);
    std::vector<Info> infos;
    infos.reserve(plugins_.size());
    for (const auto& lp : plugins_) {
        infos.push_back(lp->info);
    }
    return infos;
}

Result<Info> PluginHost::info(const std::string& name) const {
    std::shared_lock lk(mutex_);
    for (const auto& lp : plugins_) {
        if (lp->name == name) {
            return lp->info;
        }
    }
    return Error{ErrorCode::NotFound, fmt::format("plugin not found: {}", name)};
}

std::vector<HookResult> PluginHost::executeHook(const Hook& hook, const ReleaseContext& context,
                                                bool dryRun, std::stop_token stop) {
    std::vector<std::shared_ptr<LoadedPlugin>> toExecute;
    {
        std::shared_lock lk(mutex_);
        for (const auto& lp : plugins_) {
            if (lp->info.supports(hook)) {
                toExecute.push_back(lp);
            }
        }
    }
    if (toExecute.empty()) {
        return {};
    }

    using clock = std::chrono::steady_clock;
    const auto globalDeadline = clock::now() + config_.globalHookTimeout;
    std::counting_semaphore<> slots(static_cast<std::ptrdiff_t>(config_.maxConcurrentExecutions));

    auto runOne = [&, this](const std::shared_ptr<LoadedPlugin>& lp) -> ExecuteResponse {
        if (stop.stop_requested()) {
            return failedResponse("execution canceled: hook was cancelled");
        }
        if (clock::now() >= globalDeadline) {
            return failedResponse("execution canceled: global hook timeout reached");
        }
        if (!slots.try_acquire_until(globalDeadline)) {
            spdlog::error("PluginHost: Failed to acquire execution slot for '{}'", lp->name);
            return failedResponse(
                "failed to acquire execution slot: global hook timeout reached");
        }
        struct SlotGuard {
            std::counting_semaphore<>& sem;
            ~SlotGuard() { sem.release(); }
        } guard{slots};

        spdlog::debug("PluginHost: Executing hook '{}' on '{}'", hook.str(), lp->name);

        CallContext ctx;
        ctx.stop = stop;
        ctx.deadline = std::min(clock::now() + lp->timeout, globalDeadline);

        ExecuteRequest request;
        request.hook = hook;
        request.config = lp->config.is_null() ? ConfigMap::object() : lp->config;
        request.context = context;
        request.dryRun = dryRun;

        StreamingOptions options;
        if (config_.onProgress) {
            options.onProgress = [this, name = lp->name](const ProgressEvent& event) {
                config_.onProgress(name, event);
            };
        }
        if (config_.onLog) {
            options.onLog = [this, name = lp->name](const LogNotification& log) {
                config_.onLog(name, log);
            };
        }

        const auto started = clock::now();
        auto result = lp->client->streaming().executeWithProgress(ctx, request, options);
        auto duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);
        auto durationMs = duration.count();

        AuditEvent audit;
        audit.type = AuditEventType::Execute;
        audit.plugin = lp->name;
        audit.hook = std::string(hook.str());
        audit.duration = duration;
        audit.metadata = {{"dry_run", dryRun}};
        if (!result) {
            audit.type = result.error().code == ErrorCode::Timeout ? AuditEventType::Timeout
                                                                   : AuditEventType::Error;
            audit.error = result.error().message;
        } else {
            audit.success = result.value().success;
            audit.error = result.value().error;
        }
        recordAuditEvent(config_.auditLogger, audit);

        if (!result) {
            spdlog::error("PluginHost: Plugin '{}' failed on hook '{}' after {}ms: {}", lp->name,
                          hook.str(), durationMs, result.error().message);
            return failedResponse(result.error().message);
        }
        if (result.value().success) {
            spdlog::info("PluginHost: Plugin '{}' executed hook '{}' in {}ms", lp->name,
                         hook.str(), durationMs);
        } else {
            spdlog::warn("PluginHost: Plugin '{}' reported failure on hook '{}': {}", lp->name,
                         hook.str(), result.value().error);
        }
        return std::move(result).value();
    };

    std::vector<std::future<ExecuteResponse>> futures;
    futures.reserve(toExecute.size());
    for (const auto& lp : toExecute) {
        futures.push_back(std::async(std::launch::async, runOne, lp));
    }

    std::vector<HookResult> results;
    results.reserve(toExecute.size());
    for (std::size_t i = 0; i < futures.size(); ++i) {
        ExecuteResponse response;
        try {
            response = futures[i].get();
        } catch (const std::exception& e) {
            spdlog::error("PluginHost: Execution of '{}' threw: {}", toExecute[i]->name, e.what());
            response = failedResponse(e.what());
        }
        if (isEmptyResponse(response)) {
            continue;
        }
        results.push_back(HookResult{toExecute[i]->name, std::move(response)});
    }

    if (clock::now() >= globalDeadline) {
        spdlog::warn("PluginHost: Global hook timeout reached for '{}' ({}ms)", hook.str(),
                     config_.globalHookTimeout.count());
    }
    return results;
}

void PluginHost::shutdown() {
    std::vector<std::shared_ptr<LoadedPlugin>> plugins;
    {
        std::unique_lock lk(mutex_);
        plugins.swap(plugins_);
    }
    for (auto& lp : plugins) {
        spdlog::debug("PluginHost: Shutting down plugin '{}'", lp->name);
        lp->client->kill();
    }
}

} // namespace relicta::plugin
