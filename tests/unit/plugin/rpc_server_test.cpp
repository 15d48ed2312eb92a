#include <gtest/gtest.h>

#include <relicta/plugin/conversion.h>
#include <relicta/plugin/rpc_client.h>
#include <relicta/plugin/rpc_server.h>

#include <relicta/plugin/transport.h>

#include <chrono>
#include <functional>
#include <optional>
#include <thread>

#include "../../common/test_plugins.h"

using namespace relicta;
using namespace relicta::plugin;
using relicta::test::ScriptedPlugin;
using namespace std::chrono_literals;

namespace {

// Host-side proxy wired to a peer that answers each request through `reply`
class ScriptedPeer {
public:
    using Reply = std::function<std::optional<json>(const json& request)>;

    explicit ScriptedPeer(Reply reply) {
        auto [hostSide, peerSide] = SocketTransport::createPair();
        peer_ = std::shared_ptr<IStreamingTransport>(std::move(peerSide));
        rpc_ = std::make_shared<JsonRpcClient>(
            std::shared_ptr<IStreamingTransport>(std::move(hostSide)));
        thread_ = std::thread([peer = peer_, reply = std::move(reply)] {
            while (true) {
                auto request = peer->receive();
                if (!request) {
                    return;
                }
                if (!request.value().contains("id")) {
                    continue;
                }
                if (auto result = reply(request.value())) {
                    (void)peer->send(json{{"jsonrpc", "2.0"},
                                          {"id", request.value()["id"]},
                                          {"result", *result}});
                }
            }
        });
    }

    ~ScriptedPeer() {
        rpc_->close();
        peer_->close();
        thread_.join();
    }

    std::shared_ptr<JsonRpcClient> rpc() const { return rpc_; }

private:
    std::shared_ptr<IStreamingTransport> peer_;
    std::shared_ptr<JsonRpcClient> rpc_;
    std::thread thread_;
};

json executeParams(const Hook& hook, std::string config, bool dryRun = false) {
    return {{"hook", static_cast<int>(wire::hookToWire(hook))},
            {"config", std::move(config)},
            {"dry_run", dryRun}};
}

} // namespace

TEST(PluginRpcServerTest, GetInfo) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    PluginRpcServer server(plugin);

    auto info = wire::infoFromWire(server.handleGetInfo());
    EXPECT_EQ(info.name, "scripted");
    EXPECT_EQ(info.hooks, plugin->info.hooks);
}

TEST(PluginRpcServerTest, ExecuteDecodesRequest) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    PluginRpcServer server(plugin);

    auto params = executeParams(kHookPostPublish, R"({"channel":"#releases"})", true);
    ReleaseContext ctx;
    ctx.version = "3.1.0";
    ctx.tagName = "v3.1.0";
    params["context"] = wire::releaseContextToWire(ctx);
    params["_meta"] = {{"progressToken", "tok-9"}};

    auto resp = wire::executeResponseFromWire(server.handleExecute(params, {}));
    EXPECT_TRUE(resp.success);
    EXPECT_EQ(resp.message, "executed post-publish");

    auto seen = plugin->seenRequests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].hook, kHookPostPublish);
    EXPECT_TRUE(seen[0].dryRun);
    EXPECT_EQ(seen[0].config["channel"], "#releases");
    EXPECT_EQ(seen[0].context.version, "3.1.0");
    EXPECT_EQ(seen[0].context.tagName, "v3.1.0");
    EXPECT_EQ(plugin->seenProgressTokens()[0], "tok-9");
}

TEST(PluginRpcServerTest, ExecuteAcceptsMissingOrObjectConfig) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    PluginRpcServer server(plugin);

    json params = {{"hook", 11}, {"config", {{"retries", 2}}}};
    EXPECT_TRUE(wire::executeResponseFromWire(server.handleExecute(params, {})).success);
    EXPECT_TRUE(wire::executeResponseFromWire(server.handleExecute({{"hook", 11}}, {})).success);

    auto seen = plugin->seenRequests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].config["retries"], 2);
    EXPECT_TRUE(seen[1].config.is_object());
    EXPECT_TRUE(seen[1].context.version.empty());
}

TEST(PluginRpcServerTest, UnknownHookNumberIsUnspecified) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    PluginRpcServer server(plugin);
    (void)server.handleExecute({{"hook", 99}, {"config", "{}"}}, {});
    ASSERT_EQ(plugin->seenRequests().size(), 1u);
    EXPECT_TRUE(plugin->seenRequests()[0].hook.empty());
}

TEST(PluginRpcServerTest, ExecuteFoldsBadInputIntoResponse) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    PluginRpcServer server(plugin);

    auto badConfig = wire::executeResponseFromWire(
        server.handleExecute(executeParams(kHookPrePublish, "{not json"), {}));
    EXPECT_FALSE(badConfig.success);
    EXPECT_EQ(badConfig.error.rfind("invalid config JSON: ", 0), 0u);

    auto arrayConfig = wire::executeResponseFromWire(
        server.handleExecute(executeParams(kHookPrePublish, "[1]"), {}));
    EXPECT_FALSE(arrayConfig.success);
    EXPECT_EQ(arrayConfig.error, "invalid config JSON: expected a JSON object, got array");

    auto notObject = wire::executeResponseFromWire(server.handleExecute(json::array(), {}));
    EXPECT_FALSE(notObject.success);
    EXPECT_EQ(notObject.error, "invalid request: params must be an object");

    EXPECT_EQ(plugin->executeCalls.load(), 0);
}

TEST(PluginRpcServerTest, ExecuteFoldsImplementationFailures) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    PluginRpcServer server(plugin);

    plugin->onExecute = [](const CallContext&, const ExecuteRequest&) -> Result<ExecuteResponse> {
        return Error{ErrorCode::NetworkError, "slack unreachable"};
    };
    auto failed = wire::executeResponseFromWire(
        server.handleExecute(executeParams(kHookPrePublish, "{}"), {}));
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.error, "slack unreachable");

    plugin->onExecute = [](const CallContext&, const ExecuteRequest&) -> Result<ExecuteResponse> {
        throw std::runtime_error("nil map");
    };
    auto threw = wire::executeResponseFromWire(
        server.handleExecute(executeParams(kHookPrePublish, "{}"), {}));
    EXPECT_FALSE(threw.success);
    EXPECT_EQ(threw.error, "nil map");
}

TEST(PluginRpcServerTest, Validate) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    PluginRpcServer server(plugin);

    plugin->onValidate = [](const CallContext&, const ConfigMap& config) -> Result<ValidateResponse> {
        ValidateResponse resp;
        resp.valid = config.contains("webhook");
        if (!resp.valid) {
            resp.errors.push_back({"webhook", "webhook is required", "required"});
        }
        return resp;
    };

    auto ok = wire::validateResponseFromWire(
        server.handleValidate({{"config", R"({"webhook":"https://x"})"}}, {}));
    EXPECT_TRUE(ok.valid);

    auto missing = wire::validateResponseFromWire(server.handleValidate({{"config", "{}"}}, {}));
    EXPECT_FALSE(missing.valid);
    ASSERT_EQ(missing.errors.size(), 1u);
    EXPECT_EQ(missing.errors[0].code, "required");
}

TEST(PluginRpcServerTest, ValidateFoldsFailures) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    PluginRpcServer server(plugin);

    auto badJson = wire::validateResponseFromWire(server.handleValidate({{"config", "{"}}, {}));
    EXPECT_FALSE(badJson.valid);
    ASSERT_EQ(badJson.errors.size(), 1u);
    EXPECT_EQ(badJson.errors[0].field, "config");
    EXPECT_EQ(badJson.errors[0].message.rfind("invalid JSON: ", 0), 0u);

    plugin->onValidate = [](const CallContext&, const ConfigMap&) -> Result<ValidateResponse> {
        throw std::runtime_error("schema missing");
    };
    auto threw = wire::validateResponseFromWire(server.handleValidate({{"config", "{}"}}, {}));
    EXPECT_FALSE(threw.valid);
    ASSERT_EQ(threw.errors.size(), 1u);
    EXPECT_EQ(threw.errors[0].field, "");
    EXPECT_EQ(threw.errors[0].message, "schema missing");

    plugin->onValidate = [](const CallContext&, const ConfigMap&) -> Result<ValidateResponse> {
        return Error{ErrorCode::InternalError, "validator crashed"};
    };
    auto failed = wire::validateResponseFromWire(server.handleValidate({{"config", "{}"}}, {}));
    EXPECT_FALSE(failed.valid);
    EXPECT_EQ(failed.errors.at(0).message, "validator crashed");
}

TEST(PluginRpcClientTest, ExecuteParams) {
    ExecuteRequest request;
    request.hook = kHookPreVersion;
    request.config = {{"dry", false}};
    request.dryRun = true;

    auto bare = PluginRpcClient::buildExecuteParams(request, "");
    EXPECT_EQ(bare["hook"], 5);
    EXPECT_EQ(bare["config"], R"({"dry":false})");
    EXPECT_EQ(bare["dry_run"], true);
    EXPECT_FALSE(bare.contains("context"));
    EXPECT_FALSE(bare.contains("_meta"));

    request.context.version = "1.0.0";
    request.config = nullptr;
    auto full = PluginRpcClient::buildExecuteParams(request, "tok");
    EXPECT_EQ(full["config"], "{}");
    EXPECT_EQ(full["context"]["version"], "1.0.0");
    EXPECT_EQ(full["_meta"]["progressToken"], "tok");
}

TEST(PluginRpcClientTest, MalformedResultsDegrade) {
    ScriptedPeer peer([](const json& request) -> std::optional<json> {
        auto method = request["method"].get<std::string>();
        if (method == wire::kMethodGetInfo) {
            return json{{"name", 42}, {"version", "1.0.0"}};
        }
        if (method == wire::kMethodExecute) {
            return json{{"success", true}, {"message", 12}, {"artifacts", json::array({7})}};
        }
        return json("not an object");
    });
    PluginRpcClient client(peer.rpc());

    auto info = client.getInfo();
    EXPECT_TRUE(info.name.empty());
    EXPECT_EQ(info.version, "1.0.0");

    ExecuteRequest request;
    request.hook = kHookPrePublish;
    auto executed = client.execute(CallContext::withTimeout(5s), request);
    ASSERT_TRUE(executed) << executed.error().message;
    EXPECT_TRUE(executed.value().success);
    EXPECT_TRUE(executed.value().message.empty());
    ASSERT_EQ(executed.value().artifacts.size(), 1u);

    auto validated = client.validate(CallContext::withTimeout(5s), ConfigMap::object());
    ASSERT_TRUE(validated);
    EXPECT_FALSE(validated.value().valid);
}

TEST(PluginRpcClientTest, SilentPluginYieldsEmptyInfoWithinWindow) {
    ScriptedPeer peer([](const json&) -> std::optional<json> { return std::nullopt; });
    PluginRpcClient client(peer.rpc());

    auto started = std::chrono::steady_clock::now();
    auto info = client.getInfo();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(info.name.empty());
    EXPECT_TRUE(info.hooks.empty());
    EXPECT_GE(elapsed, kGetInfoTimeout - 100ms);
    EXPECT_LT(elapsed, kGetInfoTimeout + 2s);
}
