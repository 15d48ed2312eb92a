#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace relicta::plugin::wire {

/**
 * @brief Wire representation of a hook
 *
 * Numeric values are part of the protocol. Unspecified is the sentinel for
 * anything the peer does not recognise.
 */
enum class WireHook : int {
    Unspecified = 0,
    PreInit = 1,
    PostInit = 2,
    PrePlan = 3,
    PostPlan = 4,
    PreVersion = 5,
    PostVersion = 6,
    PreNotes = 7,
    PostNotes = 8,
    PreApprove = 9,
    PostApprove = 10,
    PrePublish = 11,
    PostPublish = 12,
    OnSuccess = 13,
    OnError = 14,
};

inline constexpr std::string_view kJsonRpcVersion = "2.0";

// Service methods
inline constexpr std::string_view kMethodGetInfo = "Plugin.GetInfo";
inline constexpr std::string_view kMethodExecute = "Plugin.Execute";
inline constexpr std::string_view kMethodValidate = "Plugin.Validate";

// Notifications
inline constexpr std::string_view kNotifyProgress = "notifications/progress";
inline constexpr std::string_view kNotifyMessage = "notifications/message";
inline constexpr std::string_view kNotifyCancelled = "notifications/cancelled";
inline constexpr std::string_view kNotifyShutdown = "$/shutdown";

// JSON-RPC 2.0 error codes
inline constexpr int kErrParse = -32700;
inline constexpr int kErrInvalidRequest = -32600;
inline constexpr int kErrMethodNotFound = -32601;
inline constexpr int kErrInvalidParams = -32602;
inline constexpr int kErrInternal = -32603;
inline constexpr int kErrRequestCancelled = -32800;

/// Object carrying "jsonrpc": "2.0"; any other shape is not a JSON-RPC 2.0 message
inline bool isJsonRpc2(const nlohmann::json& msg) {
    if (!msg.is_object()) {
        return false;
    }
    auto it = msg.find("jsonrpc");
    return it != msg.end() && it->is_string() &&
           it->get_ref<const std::string&>() == kJsonRpcVersion;
}

} // namespace relicta::plugin::wire
