#pragma once

#include <relicta/core/types.h>
#include <relicta/plugin/plugin.h>
#include <relicta/plugin/transport.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * @file streaming.h
 * @brief Progress and log notifications layered on the plugin connection
 *
 * Plugins report through a StreamReporter / StreamLogger bound to their
 * connection; the host receives the notifications in a StreamingClient and
 * routes them to per-call callbacks. Notifications never block the call that
 * produced them.
 */

namespace relicta::plugin {

using json = nlohmann::json;

/// Sends one notification; the transport-backed sink enqueues without blocking
using NotificationSink = std::function<void(std::string_view method, json params)>;

NotificationSink transportSink(std::shared_ptr<IStreamingTransport> transport);

enum class ProgressKind { Begin, Report, End };

std::string_view progressKindToString(ProgressKind kind);
std::optional<ProgressKind> progressKindFromString(std::string_view kind);

/**
 * @brief One progress notification
 */
struct ProgressEvent {
    std::string token;
    ProgressKind kind{ProgressKind::Report};
    std::string title;   ///< Set on begin
    std::string message;
    double percentage{0.0}; ///< 0-100
    bool cancellable{false};
    std::optional<int64_t> totalSteps; ///< Set on begin
};

json progressToJson(const ProgressEvent& event);
Result<ProgressEvent> progressFromJson(const json& j);

enum class LogLevel { Debug, Info, Warning, Error };

std::string_view logLevelToString(LogLevel level);
LogLevel logLevelFromString(std::string_view level);

struct LogNotification {
    LogLevel level{LogLevel::Info};
    std::string message;
    std::string logger;
    json data; ///< null when absent
};

json logToJson(const LogNotification& log);
Result<LogNotification> logFromJson(const json& j);

/**
 * @brief Plugin-side progress reporter
 *
 * Tracks open progress sessions by token. A token is valid from start() to
 * complete(); update() on an unknown token sends nothing.
 */
/// Tokens minted by the host start with this; plugin-minted ones start with a digit
inline constexpr std::string_view kHostTokenPrefix = "host-";

class StreamReporter {
public:
    explicit StreamReporter(NotificationSink sink);

    /**
     * @brief Open a session and emit "begin" at 0 %
     * @param token Token supplied by the host; a fresh one is minted when empty
     * @return The session token
     */
    std::string start(int64_t total, std::string_view message, std::string_view token = {});

    /// Emit "report" at current/total (0 % when total is 0)
    void update(const std::string& token, int64_t current, std::string_view message = {});

    /// Close the session and emit "end" at 100 %
    void complete(const std::string& token, std::string_view message = {});

    /// Send an event as is
    void report(const ProgressEvent& event);

    [[nodiscard]] bool isActive(const std::string& token) const;
    [[nodiscard]] std::size_t activeCount() const;

    /// "<UTC yyyymmddHHMMSS>-<counter>"
    static std::string mintToken();

private:
    struct Session {
        int64_t total{0};
        int64_t current{0};
        std::chrono::steady_clock::time_point started;
    };

    NotificationSink sink_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
};

/**
 * @brief Plugin-side structured logger forwarding to the host
 */
class StreamLogger {
public:
    StreamLogger(NotificationSink sink, std::string logger);

    void log(LogLevel level, std::string_view message, json data = nullptr);
    void debug(std::string_view message, json data = nullptr);
    void info(std::string_view message, json data = nullptr);
    void warning(std::string_view message, json data = nullptr);
    void error(std::string_view message, json data = nullptr);

    [[nodiscard]] const std::string& name() const noexcept { return logger_; }

private:
    NotificationSink sink_;
    std::string logger_;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using LogCallback = std::function<void(const LogNotification&)>;

struct StreamingOptions {
    ProgressCallback onProgress;
    LogCallback onLog;
};

/**
 * @brief Host-side receiver for plugin notifications
 *
 * Progress callbacks are keyed by token and removed either by the caller or
 * automatically once their "end" event was delivered. Plugin log records are
 * written to spdlog and handed to every registered log listener.
 */
class StreamingClient {
public:
    StreamingClient() = default;
    explicit StreamingClient(std::shared_ptr<IPlugin> plugin);

    /// Plugin used by executeWithProgress
    void attach(std::shared_ptr<IPlugin> plugin);

    void onProgress(const std::string& token, ProgressCallback callback);
    void removeProgressCallback(const std::string& token);
    [[nodiscard]] std::size_t progressCallbackCount() const;

    uint64_t onLog(LogCallback callback);
    void removeLogListener(uint64_t id);

    /// Entry point wired to the JSON-RPC client's notification handler
    void handleNotification(const std::string& method, const json& params);

    /**
     * @brief Execute with per-call progress and log delivery
     *
     * Mints a token, registers the callbacks, passes the token to the plugin
     * and deregisters when the call returns, successful or not.
     */
    Result<ExecuteResponse> executeWithProgress(const CallContext& ctx,
                                                const ExecuteRequest& request,
                                                const StreamingOptions& options);

private:
    void dispatchProgress(const json& params);
    void dispatchLog(const json& params);

    std::shared_ptr<IPlugin> plugin_;

    mutable std::shared_mutex progressMutex_;
    std::unordered_map<std::string, ProgressCallback> progressCallbacks_;

    mutable std::shared_mutex logMutex_;
    std::unordered_map<uint64_t, LogCallback> logListeners_;
    uint64_t nextLogListener_{1};
};

} // namespace relicta::plugin
