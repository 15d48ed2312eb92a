#pragma once

#include <relicta/plugin/jsonrpc_client.hpp>
#include <relicta/plugin/plugin.h>

#include <chrono>
#include <memory>
#include <string>

namespace relicta::plugin {

/// Upper bound for GetInfo; a plugin that does not answer in time reports an empty Info
inline constexpr std::chrono::milliseconds kGetInfoTimeout{5000};

/**
 * @brief Host-side IPlugin proxy speaking to a plugin over JSON-RPC
 *
 * Errors returned from execute()/validate() are transport errors only
 * (connection lost, malformed reply, remote protocol error, or the caller's
 * deadline). What the plugin reports about its own work is in the response.
 */
class PluginRpcClient final : public IPlugin {
public:
    explicit PluginRpcClient(std::shared_ptr<JsonRpcClient> rpc,
                             std::chrono::milliseconds getInfoTimeout = kGetInfoTimeout);

    Info getInfo() override;

    Result<ExecuteResponse> execute(const CallContext& ctx, const ExecuteRequest& request) override;

    Result<ValidateResponse> validate(const CallContext& ctx, const ConfigMap& config) override;

    /// Plugin.Execute params; the release context is only sent for a named version
    static json buildExecuteParams(const ExecuteRequest& request, const std::string& progressToken);

private:
    std::shared_ptr<JsonRpcClient> rpc_;
    std::chrono::milliseconds getInfoTimeout_;
};

} // namespace relicta::plugin
