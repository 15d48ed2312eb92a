#include <relicta/plugin/conversion.h>
#include <relicta/plugin/rpc_client.h>
#include <relicta/plugin/wire.h>

#include <spdlog/spdlog.h>

namespace relicta::plugin {

PluginRpcClient::PluginRpcClient(std::shared_ptr<JsonRpcClient> rpc,
                                 std::chrono::milliseconds getInfoTimeout)
    : rpc_(std::move(rpc)), getInfoTimeout_(getInfoTimeout) {}

Info PluginRpcClient::getInfo() {
    auto result = rpc_->call(wire::kMethodGetInfo, json::object(), getInfoTimeout_);
    if (!result) {
        spdlog::warn("PluginRpc: GetInfo failed: {}", result.error().message);
        return Info{};
    }
    try {
        return wire::infoFromWire(result.value());
    } catch (const json::exception& e) {
        spdlog::warn("PluginRpc: Discarding malformed GetInfo result: {}", e.what());
        return Info{};
    }
}

json PluginRpcClient::buildExecuteParams(const ExecuteRequest& request,
                                         const std::string& progressToken) {
    json params = {{"hook", static_cast<int>(wire::hookToWire(request.hook))},
                   {"config", wire::encodeConfig(request.config)},
                   {"dry_run", request.dryRun}};
    if (!request.context.version.empty()) {
        params["context"] = wire::releaseContextToWire(request.context);
    }
    if (!progressToken.empty()) {
        params["_meta"] = {{"progressToken", progressToken}};
    }
    return params;
}

Result<ExecuteResponse> PluginRpcClient::execute(const CallContext& ctx,
                                                 const ExecuteRequest& request) {
    auto result =
        rpc_->call(wire::kMethodExecute, buildExecuteParams(request, ctx.progressToken), ctx);
    if (!result) {
        return result.error();
    }
    try {
        return wire::executeResponseFromWire(result.value());
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed Execute result: ") + e.what()};
    }
}

Result<ValidateResponse> PluginRpcClient::validate(const CallContext& ctx, const ConfigMap& config) {
    auto result =
        rpc_->call(wire::kMethodValidate, json{{"config", wire::encodeConfig(config)}}, ctx);
    if (!result) {
        return result.error();
    }
    try {
        return wire::validateResponseFromWire(result.value());
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed Validate result: ") + e.what()};
    }
}

} // namespace relicta::plugin
