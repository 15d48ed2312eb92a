#include <relicta/plugin/conversion.h>
#include <relicta/plugin/rpc_server.h>
#include <relicta/plugin/streaming.h>
#include <relicta/plugin/wire.h>

#include <spdlog/spdlog.h>

namespace relicta::plugin {

namespace {

// Config travels as an encoded string; tolerate a peer that sends the object itself
Result<ConfigMap> configFromParams(const json& params) {
    if (!params.is_object() || !params.contains("config")) {
        return ConfigMap::object();
    }
    const auto& raw = params["config"];
    if (raw.is_string()) {
        return wire::decodeConfig(raw.get<std::string>());
    }
    if (raw.is_object()) {
        return raw;
    }
    if (raw.is_null()) {
        return ConfigMap::object();
    }
    return Error{ErrorCode::InvalidData, std::string("config must be a string, got ") +
                                             raw.type_name()};
}

ExecuteResponse failedExecution(std::string error) {
    ExecuteResponse resp;
    resp.success = false;
    resp.error = std::move(error);
    return resp;
}

ValidateResponse singleValidationError(std::string field, std::string message) {
    ValidateResponse resp;
    resp.valid = false;
    resp.errors.push_back(ValidationError{std::move(field), std::move(message), {}});
    return resp;
}

} // namespace

PluginRpcServer::PluginRpcServer(std::shared_ptr<IPlugin> impl, std::string loggerName)
    : impl_(std::move(impl)), loggerName_(std::move(loggerName)) {}

json PluginRpcServer::handleGetInfo() {
    return wire::infoToWire(impl_->getInfo());
}

json PluginRpcServer::handleExecute(const json& params, const CallContext& ctx) {
    if (!params.is_object()) {
        return wire::executeResponseToWire(
            failedExecution("invalid request: params must be an object"));
    }
    auto config = configFromParams(params);
    if (!config) {
        return wire::executeResponseToWire(
            failedExecution("invalid config JSON: " + config.error().message));
    }

    ExecuteRequest request;
    auto hookNumber = wire::intField(params, "hook");
    if (hookNumber < 0 || hookNumber > static_cast<int64_t>(wire::WireHook::OnError)) {
        hookNumber = 0;
    }
    request.hook = wire::hookFromWire(wire::wireHookFromInt(static_cast<int>(hookNumber)));
    request.config = std::move(config).value();
    if (auto it = params.find("context"); it != params.end() && it->is_object()) {
        request.context = wire::releaseContextFromWire(*it);
    }
    request.dryRun = wire::boolField(params, "dry_run");

    CallContext callCtx = ctx;
    if (callCtx.progressToken.empty()) {
        if (auto meta = params.find("_meta"); meta != params.end() && meta->is_object()) {
            callCtx.progressToken = wire::stringField(*meta, "progressToken");
        }
    }

    spdlog::debug("PluginRpc: Execute hook='{}' dry_run={}", request.hook.str(), request.dryRun);
    try {
        auto result = impl_->execute(callCtx, request);
        if (!result) {
            return wire::executeResponseToWire(failedExecution(result.error().message));
        }
        return wire::executeResponseToWire(result.value());
    } catch (const std::exception& e) {
        spdlog::error("PluginRpc: Execute threw: {}", e.what());
        return wire::executeResponseToWire(failedExecution(e.what()));
    }
}

json PluginRpcServer::handleValidate(const json& params, const CallContext& ctx) {
    auto config = configFromParams(params);
    if (!config) {
        return wire::validateResponseToWire(
            singleValidationError("config", "invalid JSON: " + config.error().message));
    }

    try {
        auto result = impl_->validate(ctx, config.value());
        if (!result) {
            return wire::validateResponseToWire(singleValidationError("", result.error().message));
        }
        return wire::validateResponseToWire(result.value());
    } catch (const std::exception& e) {
        spdlog::error("PluginRpc: Validate threw: {}", e.what());
        return wire::validateResponseToWire(singleValidationError("", e.what()));
    }
}

void PluginRpcServer::bind(JsonRpcServer& server) {
    auto sink = transportSink(server.transport());
    auto reporter = std::make_shared<StreamReporter>(sink);
    auto logger = std::make_shared<StreamLogger>(sink, loggerName_);

    auto makeContext = [reporter, logger](const RequestContext& rc) {
        CallContext ctx;
        ctx.stop = rc.stop;
        ctx.progress = reporter.get();
        ctx.log = logger.get();
        return ctx;
    };

    server.registerMethod(std::string(wire::kMethodGetInfo),
                          [this](const json&, const RequestContext&) -> Result<json> {
                              return handleGetInfo();
                          });
    server.registerMethod(std::string(wire::kMethodExecute),
                          [this, makeContext](const json& params,
                                              const RequestContext& rc) -> Result<json> {
                              return handleExecute(params, makeContext(rc));
                          });
    server.registerMethod(std::string(wire::kMethodValidate),
                          [this, makeContext](const json& params,
                                              const RequestContext& rc) -> Result<json> {
                              return handleValidate(params, makeContext(rc));
                          });
}

} // namespace relicta::plugin
