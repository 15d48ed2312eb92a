#pragma once

#include <relicta/plugin/jsonrpc_server.hpp>
#include <relicta/plugin/plugin.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace relicta::plugin {

/**
 * @brief Plugin-side adapter from wire calls to an IPlugin implementation
 *
 * Business failures of the implementation never become JSON-RPC errors: a
 * malformed config or a failing/throwing implementation is folded into the
 * response (success=false, or a single validation error).
 */
class PluginRpcServer {
public:
    explicit PluginRpcServer(std::shared_ptr<IPlugin> impl, std::string loggerName = "plugin");

    /// Plugin.GetInfo
    json handleGetInfo();

    /// Plugin.Execute; ctx carries the stop token and the connection's reporter/logger
    json handleExecute(const json& params, const CallContext& ctx);

    /// Plugin.Validate
    json handleValidate(const json& params, const CallContext& ctx);

    /**
     * @brief Register the three service methods on a connection
     *
     * A StreamReporter and StreamLogger bound to the connection's transport are
     * created here and exposed to the implementation through CallContext.
     */
    void bind(JsonRpcServer& server);

    [[nodiscard]] const std::shared_ptr<IPlugin>& impl() const noexcept { return impl_; }

private:
    std::shared_ptr<IPlugin> impl_;
    std::string loggerName_;
};

} // namespace relicta::plugin
