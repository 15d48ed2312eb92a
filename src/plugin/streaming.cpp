#include <relicta/plugin/conversion.h>
#include <relicta/plugin/streaming.h>
#include <relicta/plugin/wire.h>

#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <ctime>
#include <vector>

namespace relicta::plugin {

namespace {

std::atomic<uint64_t> g_tokenCounter{0};

spdlog::level::level_enum spdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
    }
    return spdlog::level::info;
}

} // namespace

NotificationSink transportSink(std::shared_ptr<IStreamingTransport> transport) {
    return [transport = std::move(transport)](std::string_view method, json params) {
        transport->sendNotificationAsync(method, std::move(params));
    };
}

std::string_view progressKindToString(ProgressKind kind) {
    switch (kind) {
        case ProgressKind::Begin: return "begin";
        case ProgressKind::Report: return "report";
        case ProgressKind::End: return "end";
    }
    return "report";
}

std::optional<ProgressKind> progressKindFromString(std::string_view kind) {
    if (kind == "begin")
        return ProgressKind::Begin;
    if (kind == "report")
        return ProgressKind::Report;
    if (kind == "end")
        return ProgressKind::End;
    return std::nullopt;
}

json progressToJson(const ProgressEvent& event) {
    json value = {{"kind", progressKindToString(event.kind)},
                  {"percentage", event.percentage},
                  {"cancellable", event.cancellable}};
    if (!event.title.empty()) {
        value["title"] = event.title;
    }
    if (!event.message.empty()) {
        value["message"] = event.message;
    }
    json j = {{"token", event.token}, {"value", std::move(value)}};
    if (event.totalSteps) {
        j["totalSteps"] = *event.totalSteps;
    }
    return j;
}

Result<ProgressEvent> progressFromJson(const json& j) {
    if (!j.is_object() || !j.contains("token") || !j["token"].is_string()) {
        return Error{ErrorCode::InvalidData, "progress notification without token"};
    }
    auto valueIt = j.find("value");
    if (valueIt == j.end() || !valueIt->is_object()) {
        return Error{ErrorCode::InvalidData, "progress notification without value"};
    }
    const json& value = *valueIt;
    auto kindName = wire::stringField(value, "kind");
    auto kind = progressKindFromString(kindName);
    if (!kind) {
        return Error{ErrorCode::InvalidData, "unknown progress kind: " + kindName};
    }

    ProgressEvent event;
    event.token = j["token"].get<std::string>();
    event.kind = *kind;
    event.title = wire::stringField(value, "title");
    event.message = wire::stringField(value, "message");
    event.percentage = wire::numberField(value, "percentage");
    event.cancellable = wire::boolField(value, "cancellable");
    if (j.contains("totalSteps") && j["totalSteps"].is_number_integer()) {
        event.totalSteps = j["totalSteps"].get<int64_t>();
    }
    return event;
}

std::string_view logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
    }
    return "info";
}

LogLevel logLevelFromString(std::string_view level) {
    if (level == "debug")
        return LogLevel::Debug;
    if (level == "warning" || level == "warn")
        return LogLevel::Warning;
    if (level == "error")
        return LogLevel::Error;
    return LogLevel::Info;
}

json logToJson(const LogNotification& log) {
    json j = {{"level", logLevelToString(log.level)},
              {"message", log.message},
              {"logger", log.logger}};
    if (!log.data.is_null()) {
        j["data"] = log.data;
    }
    return j;
}

Result<LogNotification> logFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "log notification is not an object"};
    }
    LogNotification log;
    log.level = logLevelFromString(wire::stringField(j, "level"));
    log.message = wire::stringField(j, "message");
    log.logger = wire::stringField(j, "logger");
    if (j.contains("data")) {
        log.data = j["data"];
    }
    return log;
}

// ============================================================================
// StreamReporter
// ============================================================================

StreamReporter::StreamReporter(NotificationSink sink) : sink_(std::move(sink)) {}

std::string StreamReporter::mintToken() {
    auto n = g_tokenCounter.fetch_add(1, std::memory_order_relaxed) + 1;
    return fmt::format("{:%Y%m%d%H%M%S}-{}", fmt::gmtime(std::time(nullptr)), n);
}

void StreamReporter::report(const ProgressEvent& event) {
    if (sink_) {
        sink_(wire::kNotifyProgress, progressToJson(event));
    }
}

std::string StreamReporter::start(int64_t total, std::string_view message, std::string_view token) {
    std::string tok = token.empty() ? mintToken() : std::string(token);
    {
        std::lock_guard lk(mutex_);
        sessions_[tok] = Session{total, 0, std::chrono::steady_clock::now()};
    }

    ProgressEvent event;
    event.token = tok;
    event.kind = ProgressKind::Begin;
    event.title = std::string(message);
    event.percentage = 0.0;
    event.totalSteps = total;
    report(event);
    return tok;
}

void StreamReporter::update(const std::string& token, int64_t current, std::string_view message) {
    int64_t total = 0;
    {
        std::lock_guard lk(mutex_);
        auto it = sessions_.find(token);
        if (it == sessions_.end()) {
            spdlog::debug("StreamReporter: update for unknown token '{}' ignored", token);
            return;
        }
        it->second.current = current;
        total = it->second.total;
    }

    ProgressEvent event;
    event.token = token;
    event.kind = ProgressKind::Report;
    event.message = std::string(message);
    if (total > 0) {
        event.percentage = static_cast<double>(current) / static_cast<double>(total) * 100.0;
    }
    report(event);
}

void StreamReporter::complete(const std::string& token, std::string_view message) {
    {
        std::lock_guard lk(mutex_);
        if (auto it = sessions_.find(token); it != sessions_.end()) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - it->second.started);
            spdlog::debug("StreamReporter: '{}' completed after {}ms", token, elapsed.count());
            sessions_.erase(it);
        }
    }

    ProgressEvent event;
    event.token = token;
    event.kind = ProgressKind::End;
    event.message = std::string(message);
    event.percentage = 100.0;
    report(event);
}

bool StreamReporter::isActive(const std::string& token) const {
    std::lock_guard lk(mutex_);
    return sessions_.count(token) != 0;
}

std::size_t StreamReporter::activeCount() const {
    std::lock_guard lk(mutex_);
    return sessions_.size();
}

// ============================================================================
// StreamLogger
// ============================================================================

StreamLogger::StreamLogger(NotificationSink sink, std::string logger)
    : sink_(std::move(sink)), logger_(std::move(logger)) {}

void StreamLogger::log(LogLevel level, std::string_view message, json data) {
    if (!sink_) {
        return;
    }
    LogNotification record{level, std::string(message), logger_, std::move(data)};
    sink_(wire::kNotifyMessage, logToJson(record));
}

void StreamLogger::debug(std::string_view message, json data) {
    log(LogLevel::Debug, message, std::move(data));
}

void StreamLogger::info(std::string_view message, json data) {
    log(LogLevel::Info, message, std::move(data));
}

void StreamLogger::warning(std::string_view message, json data) {
    log(LogLevel::Warning, message, std::move(data));
}

void StreamLogger::error(std::string_view message, json data) {
    log(LogLevel::Error, message, std::move(data));
}

// ============================================================================
// StreamingClient
// ============================================================================

StreamingClient::StreamingClient(std::shared_ptr<IPlugin> plugin) : plugin_(std::move(plugin)) {}

void StreamingClient::attach(std::shared_ptr<IPlugin> plugin) {
    plugin_ = std::move(plugin);
}

void StreamingClient::onProgress(const std::string& token, ProgressCallback callback) {
    std::unique_lock lk(progressMutex_);
    progressCallbacks_[token] = std::move(callback);
}

void StreamingClient::removeProgressCallback(const std::string& token) {
    std::unique_lock lk(progressMutex_);
    progressCallbacks_.erase(token);
}

std::size_t StreamingClient::progressCallbackCount() const {
    std::shared_lock lk(progressMutex_);
    return progressCallbacks_.size();
}

uint64_t StreamingClient::onLog(LogCallback callback) {
    std::unique_lock lk(logMutex_);
    auto id = nextLogListener_++;
    logListeners_[id] = std::move(callback);
    return id;
}

void StreamingClient::removeLogListener(uint64_t id) {
    std::unique_lock lk(logMutex_);
    logListeners_.erase(id);
}

void StreamingClient::handleNotification(const std::string& method, const json& params) {
    if (method == wire::kNotifyProgress) {
        dispatchProgress(params);
    } else if (method == wire::kNotifyMessage) {
        dispatchLog(params);
    } else {
        spdlog::debug("StreamingClient: Ignoring notification '{}'", method);
    }
}

void StreamingClient::dispatchProgress(const json& params) {
    auto event = progressFromJson(params);
    if (!event) {
        spdlog::debug("StreamingClient: Dropping progress notification: {}",
                      event.error().message);
        return;
    }
    const auto& ev = event.value();

    ProgressCallback callback;
    {
        std::shared_lock lk(progressMutex_);
        auto it = progressCallbacks_.find(ev.token);
        if (it == progressCallbacks_.end()) {
            spdlog::debug("StreamingClient: No callback for progress token '{}'", ev.token);
            return;
        }
        callback = it->second;
    }

    try {
        callback(ev);
    } catch (const std::exception& e) {
        spdlog::warn("StreamingClient: Progress callback for '{}' threw: {}", ev.token, e.what());
    }

    if (ev.kind == ProgressKind::End) {
        removeProgressCallback(ev.token);
    }
}

void StreamingClient::dispatchLog(const json& params) {
    auto record = logFromJson(params);
    if (!record) {
        spdlog::debug("StreamingClient: Dropping log notification: {}", record.error().message);
        return;
    }
    const auto& log = record.value();
    if (log.data.is_null()) {
        spdlog::log(spdlogLevel(log.level), "[plugin:{}] {}", log.logger, log.message);
    } else {
        spdlog::log(spdlogLevel(log.level), "[plugin:{}] {} {}", log.logger, log.message,
                    log.data.dump());
    }

    std::vector<LogCallback> listeners;
    {
        std::shared_lock lk(logMutex_);
        listeners.reserve(logListeners_.size());
        for (const auto& [id, cb] : logListeners_) {
            listeners.push_back(cb);
        }
    }
    for (const auto& cb : listeners) {
        try {
            cb(log);
        } catch (const std::exception& e) {
            spdlog::warn("StreamingClient: Log listener threw: {}", e.what());
        }
    }
}

Result<ExecuteResponse> StreamingClient::executeWithProgress(const CallContext& ctx,
                                                             const ExecuteRequest& request,
                                                             const StreamingOptions& options) {
    if (!plugin_) {
        return Error{ErrorCode::NotInitialized, "streaming client has no plugin attached"};
    }

    CallContext callCtx = ctx;
    callCtx.progressToken = std::string(kHostTokenPrefix) + StreamReporter::mintToken();
    const std::string token = callCtx.progressToken;

    if (options.onProgress) {
        onProgress(token, options.onProgress);
    }
    std::optional<uint64_t> logListener;
    if (options.onLog) {
        logListener = onLog(options.onLog);
    }

    struct Deregister {
        StreamingClient* self;
        std::string token;
        std::optional<uint64_t> listener;
        ~Deregister() {
            self->removeProgressCallback(token);
            if (listener) {
                self->removeLogListener(*listener);
            }
        }
    } guard{this, token, logListener};

    return plugin_->execute(callCtx, request);
}

} // namespace relicta::plugin
