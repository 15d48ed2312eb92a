#include <relicta/plugin/audit.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace relicta::plugin {

namespace {

std::string utcTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << millis << 'Z';
    return ss.str();
}

} // namespace

std::string_view auditEventTypeName(AuditEventType type) noexcept {
    switch (type) {
        case AuditEventType::Load:
            return "load";
        case AuditEventType::Unload:
            return "unload";
        case AuditEventType::Execute:
            return "execute";
        case AuditEventType::Error:
            return "error";
        case AuditEventType::Timeout:
            return "timeout";
        case AuditEventType::Rejected:
            return "rejected";
    }
    return "unknown";
}

nlohmann::json auditEventToJson(const AuditEvent& event) {
    nlohmann::json j = {
        {"timestamp", utcTimestamp(event.timestamp)},
        {"plugin_name", event.plugin},
        {"event_type", auditEventTypeName(event.type)},
        {"success", event.success},
        {"duration_ms", event.duration.count()},
    };
    if (!event.hook.empty())
        j["hook"] = event.hook;
    if (!event.error.empty())
        j["error"] = event.error;
    if (!event.metadata.is_null())
        j["metadata"] = event.metadata;
    return j;
}

void recordAuditEvent(const std::shared_ptr<spdlog::logger>& logger, const AuditEvent& event) {
    auto line = auditEventToJson(event).dump();
    if (logger) {
        logger->info(line);
        return;
    }
    spdlog::info("PluginAudit: {}", line);
}

Result<std::shared_ptr<spdlog::logger>> makeAuditFileLogger(const std::filesystem::path& path) {
    // Create with owner-only permissions before spdlog opens it for append
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error{ErrorCode::InvalidArgument,
                     "failed to open audit log file: " + path.string()};
    }
    ::close(fd);

    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
        auto logger = std::make_shared<spdlog::logger>("relicta.audit", std::move(sink));
        logger->set_pattern("%v");
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        return logger;
    } catch (const spdlog::spdlog_ex& e) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("failed to open audit log file: ") + e.what()};
    }
}

} // namespace relicta::plugin
