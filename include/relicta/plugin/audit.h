#pragma once

#include <relicta/core/types.h>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace relicta::plugin {

enum class AuditEventType { Load, Unload, Execute, Error, Timeout, Rejected };

[[nodiscard]] std::string_view auditEventTypeName(AuditEventType type) noexcept;

/**
 * @brief One plugin operation worth keeping a record of
 */
struct AuditEvent {
    AuditEventType type{AuditEventType::Execute};
    std::string plugin;
    std::string hook; ///< Empty for load/unload
    bool success{false};
    std::chrono::milliseconds duration{0};
    std::string error;
    nlohmann::json metadata; ///< Omitted when null
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// {"timestamp","plugin_name","hook","event_type","success","duration_ms","error","metadata"}
[[nodiscard]] nlohmann::json auditEventToJson(const AuditEvent& event);

/**
 * @brief Write one JSON line per event
 *
 * Events go to logger at info level. Without a logger they go to the default
 * logger, prefixed "PluginAudit: ".
 */
void recordAuditEvent(const std::shared_ptr<spdlog::logger>& logger, const AuditEvent& event);

/**
 * @brief Logger appending bare JSON lines to path, flushed per record
 *
 * The file is created with mode 0600 when it does not exist yet.
 */
[[nodiscard]] Result<std::shared_ptr<spdlog::logger>>
makeAuditFileLogger(const std::filesystem::path& path);

} // namespace relicta::plugin
