#include <gtest/gtest.h>

#include <relicta/plugin/plugin_client.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifndef RELICTA_TEST_PLUGIN_PATH
#error "RELICTA_TEST_PLUGIN_PATH must name the fixture plugin binary"
#endif

using namespace relicta;
using namespace relicta::plugin;
using namespace std::chrono_literals;

namespace {

PluginClientConfig fixtureConfig(const std::string& mode = {}) {
    PluginClientConfig cfg;
    cfg.executable = RELICTA_TEST_PLUGIN_PATH;
    cfg.startTimeout = 10s;
    cfg.name = "fixture";
    if (!mode.empty()) {
        cfg.env["RELICTA_TEST_PLUGIN_MODE"] = mode;
    }
    return cfg;
}

} // namespace

TEST(PluginClientIntegration, StartsAndExecutes) {
    PluginClient client(fixtureConfig());
    auto started = client.start();
    ASSERT_TRUE(started) << started.error().message;
    EXPECT_FALSE(client.exited());

    auto reattach = client.reattachConfig();
    ASSERT_TRUE(reattach.has_value());
    EXPECT_EQ(reattach->network, "unix");
    EXPECT_TRUE(std::filesystem::exists(reattach->address));

    auto dispensed = client.dispense();
    ASSERT_TRUE(dispensed) << dispensed.error().message;
    auto plugin = dispensed.value();

    auto info = plugin->getInfo();
    EXPECT_EQ(info.name, "fixture");
    EXPECT_EQ(info.version, "0.1.0");
    EXPECT_TRUE(info.supports(kHookOnSuccess));
    EXPECT_FALSE(info.supports(kHookPreInit));

    ExecuteRequest request;
    request.hook = kHookPostPublish;
    request.config = {{"channel", "#releases"}};
    request.context.version = "2.4.0";
    request.context.tagName = "v2.4.0";
    request.dryRun = true;

    auto result = plugin->execute(CallContext::withTimeout(5s), request);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result.value().success);
    EXPECT_EQ(result.value().message, "fixture ran post-publish");
    EXPECT_EQ(result.value().outputs["version"], "2.4.0");
    EXPECT_EQ(result.value().outputs["channel"], "#releases");
    EXPECT_EQ(result.value().outputs["dry_run"], true);
    ASSERT_EQ(result.value().artifacts.size(), 1u);
    EXPECT_EQ(result.value().artifacts[0].name, "v2.4.0.tar.gz");

    auto valid = plugin->validate(CallContext::withTimeout(5s), {{"format", "html"}});
    ASSERT_TRUE(valid);
    EXPECT_FALSE(valid.value().valid);
    ASSERT_EQ(valid.value().errors.size(), 1u);
    EXPECT_EQ(valid.value().errors[0].field, "format");

    client.kill();
    EXPECT_TRUE(client.exited());
    client.kill();

    auto after = plugin->execute(CallContext::withTimeout(1s), request);
    ASSERT_FALSE(after);
    EXPECT_EQ(after.error().code, ErrorCode::NetworkError);
}

TEST(PluginClientIntegration, StreamsProgressAndLogs) {
    PluginClient client(fixtureConfig("progress"));
    ASSERT_TRUE(client.start());

    std::mutex mutex;
    std::vector<ProgressEvent> events;
    std::vector<LogNotification> logs;
    StreamingOptions options;
    options.onProgress = [&](const ProgressEvent& e) {
        std::lock_guard lk(mutex);
        events.push_back(e);
    };
    options.onLog = [&](const LogNotification& l) {
        std::lock_guard lk(mutex);
        logs.push_back(l);
    };

    ExecuteRequest request;
    request.hook = kHookPrePublish;
    auto result =
        client.streaming().executeWithProgress(CallContext::withTimeout(5s), request, options);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result.value().success);

    std::lock_guard lk(mutex);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events.front().kind, ProgressKind::Begin);
    EXPECT_EQ(events.front().title, "publishing");
    EXPECT_EQ(events.back().kind, ProgressKind::End);
    EXPECT_DOUBLE_EQ(events.back().percentage, 100.0);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].message, "release published");
    EXPECT_EQ(logs[0].data["steps"], 3);
}

TEST(PluginClientIntegration, FailureModes) {
    {
        PluginClient client(fixtureConfig("exit-early"));
        auto started = client.start();
        ASSERT_FALSE(started);
        EXPECT_EQ(started.error().code, ErrorCode::NetworkError);
        EXPECT_NE(started.error().message.find("exited before completing the handshake"),
                  std::string::npos);
    }
    {
        PluginClient client(fixtureConfig("bad-handshake"));
        auto started = client.start();
        ASSERT_FALSE(started);
        EXPECT_EQ(started.error().code, ErrorCode::InvalidData);
    }
    {
        PluginClient client(fixtureConfig("wrong-version"));
        auto started = client.start();
        ASSERT_FALSE(started);
        EXPECT_EQ(started.error().code, ErrorCode::ProtocolMismatch);
    }
    {
        auto cfg = fixtureConfig("silent");
        cfg.startTimeout = 300ms;
        PluginClient client(std::move(cfg));
        auto started = client.start();
        ASSERT_FALSE(started);
        EXPECT_EQ(started.error().code, ErrorCode::Timeout);
    }
    {
        PluginClientConfig cfg;
        cfg.executable = "/nonexistent/relicta-plugin-slack";
        PluginClient client(std::move(cfg));
        auto started = client.start();
        ASSERT_FALSE(started);
        EXPECT_EQ(started.error().code, ErrorCode::InternalError);
    }
}

TEST(PluginClientIntegration, CrashDuringExecute) {
    PluginClient client(fixtureConfig("crash"));
    ASSERT_TRUE(client.start());
    auto plugin = client.dispense().value();

    ExecuteRequest request;
    request.hook = kHookPrePublish;
    auto result = plugin->execute(CallContext::withTimeout(5s), request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NetworkError);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!client.exited() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(client.exited());
}
