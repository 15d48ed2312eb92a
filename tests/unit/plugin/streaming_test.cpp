#include <gtest/gtest.h>

#include <relicta/plugin/streaming.h>
#include <relicta/plugin/wire.h>

#include "../../common/test_plugins.h"

#include <map>
#include <regex>
#include <thread>
#include <vector>

using namespace relicta;
using namespace relicta::plugin;
using relicta::test::RecordingSink;
using relicta::test::ScriptedPlugin;

namespace {

ProgressEvent eventAt(const RecordingSink& recorded, std::size_t i) {
    auto event = progressFromJson(recorded.sent.at(i).second);
    EXPECT_TRUE(event);
    return event.value();
}

} // namespace

TEST(StreamReporterTest, StartUpdateComplete) {
    RecordingSink recorded;
    StreamReporter reporter(recorded.sink());

    auto token = reporter.start(4, "uploading assets", "tok-1");
    EXPECT_EQ(token, "tok-1");
    EXPECT_TRUE(reporter.isActive("tok-1"));
    EXPECT_EQ(reporter.activeCount(), 1u);

    reporter.update(token, 1, "asset 1");
    reporter.update(token, 3);
    reporter.complete(token, "all uploaded");
    EXPECT_FALSE(reporter.isActive(token));
    EXPECT_EQ(reporter.activeCount(), 0u);

    ASSERT_EQ(recorded.sent.size(), 4u);
    for (const auto& [method, params] : recorded.sent) {
        EXPECT_EQ(method, wire::kNotifyProgress);
        EXPECT_EQ(params["token"], "tok-1");
    }

    auto begin = eventAt(recorded, 0);
    EXPECT_EQ(begin.kind, ProgressKind::Begin);
    EXPECT_EQ(begin.title, "uploading assets");
    EXPECT_DOUBLE_EQ(begin.percentage, 0.0);
    ASSERT_TRUE(begin.totalSteps.has_value());
    EXPECT_EQ(*begin.totalSteps, 4);

    auto first = eventAt(recorded, 1);
    EXPECT_EQ(first.kind, ProgressKind::Report);
    EXPECT_EQ(first.message, "asset 1");
    EXPECT_DOUBLE_EQ(first.percentage, 25.0);
    EXPECT_DOUBLE_EQ(eventAt(recorded, 2).percentage, 75.0);

    auto end = eventAt(recorded, 3);
    EXPECT_EQ(end.kind, ProgressKind::End);
    EXPECT_EQ(end.message, "all uploaded");
    EXPECT_DOUBLE_EQ(end.percentage, 100.0);
}

TEST(StreamReporterTest, UnknownTokens) {
    RecordingSink recorded;
    StreamReporter reporter(recorded.sink());

    reporter.update("nobody", 1);
    EXPECT_TRUE(recorded.sent.empty());

    reporter.complete("nobody");
    ASSERT_EQ(recorded.sent.size(), 1u);
    EXPECT_EQ(eventAt(recorded, 0).kind, ProgressKind::End);
}

TEST(StreamReporterTest, ZeroTotalReportsZeroPercent) {
    RecordingSink recorded;
    StreamReporter reporter(recorded.sink());
    auto token = reporter.start(0, "indeterminate");
    reporter.update(token, 5);
    ASSERT_EQ(recorded.sent.size(), 2u);
    EXPECT_DOUBLE_EQ(eventAt(recorded, 1).percentage, 0.0);
}

TEST(StreamReporterTest, MintedTokensAreUnique) {
    std::regex shape(R"(\d{14}-\d+)");
    auto a = StreamReporter::mintToken();
    auto b = StreamReporter::mintToken();
    EXPECT_NE(a, b);
    EXPECT_TRUE(std::regex_match(a, shape)) << a;

    RecordingSink recorded;
    StreamReporter reporter(recorded.sink());
    auto token = reporter.start(1, "minted");
    EXPECT_TRUE(std::regex_match(token, shape)) << token;
}

TEST(StreamReporterTest, ConcurrentSessionsStayIsolated) {
    constexpr int kThreads = 16;
    constexpr int kSessionsPerThread = 200;

    RecordingSink recorded;
    StreamReporter reporter(recorded.sink());

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&reporter] {
            for (int i = 0; i < kSessionsPerThread; ++i) {
                auto token = reporter.start(10, "session");
                reporter.update(token, 5, "half");
                reporter.update(token, 8);
                reporter.complete(token, "done");
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::map<std::string, std::vector<ProgressEvent>> byToken;
    for (const auto& [method, params] : recorded.snapshot()) {
        ASSERT_EQ(method, wire::kNotifyProgress);
        auto event = progressFromJson(params);
        ASSERT_TRUE(event);
        byToken[event.value().token].push_back(event.value());
    }

    ASSERT_EQ(byToken.size(), static_cast<std::size_t>(kThreads * kSessionsPerThread));
    for (const auto& [token, events] : byToken) {
        ASSERT_EQ(events.size(), 4u) << token;
        EXPECT_EQ(events[0].kind, ProgressKind::Begin);
        EXPECT_DOUBLE_EQ(events[1].percentage, 50.0) << token;
        EXPECT_DOUBLE_EQ(events[2].percentage, 80.0) << token;
        EXPECT_EQ(events[3].kind, ProgressKind::End);
    }
    EXPECT_EQ(reporter.activeCount(), 0u);
}

TEST(StreamLoggerTest, EmitsMessageNotifications) {
    RecordingSink recorded;
    StreamLogger logger(recorded.sink(), "slack");

    logger.info("posted message");
    logger.warning("rate limited", {{"retryAfter", 2}});
    logger.error("gave up");
    logger.debug("trace");

    ASSERT_EQ(recorded.sent.size(), 4u);
    EXPECT_EQ(recorded.sent[0].first, wire::kNotifyMessage);
    EXPECT_EQ(recorded.sent[0].second,
              json({{"level", "info"}, {"message", "posted message"}, {"logger", "slack"}}));
    EXPECT_EQ(recorded.sent[1].second["level"], "warning");
    EXPECT_EQ(recorded.sent[1].second["data"]["retryAfter"], 2);
    EXPECT_EQ(recorded.sent[2].second["level"], "error");
    EXPECT_EQ(recorded.sent[3].second["level"], "debug");
    EXPECT_EQ(logger.name(), "slack");
}

TEST(StreamingWireTest, ProgressJsonShape) {
    ProgressEvent event;
    event.token = "t";
    event.kind = ProgressKind::Begin;
    event.title = "Publishing";
    event.cancellable = true;
    event.totalSteps = 10;

    auto j = progressToJson(event);
    EXPECT_EQ(j["token"], "t");
    EXPECT_EQ(j["totalSteps"], 10);
    EXPECT_EQ(j["value"]["kind"], "begin");
    EXPECT_EQ(j["value"]["title"], "Publishing");
    EXPECT_EQ(j["value"]["cancellable"], true);
    EXPECT_FALSE(j["value"].contains("message"));

    auto back = progressFromJson(j);
    ASSERT_TRUE(back);
    EXPECT_TRUE(back.value().cancellable);
    EXPECT_EQ(back.value().title, "Publishing");
}

TEST(StreamingWireTest, MalformedProgressRejected) {
    EXPECT_FALSE(progressFromJson(json::object()));
    EXPECT_FALSE(progressFromJson({{"token", 5}}));
    EXPECT_FALSE(progressFromJson({{"token", "t"}, {"value", {{"kind", "middle"}}}}));
}

TEST(StreamingWireTest, LogLevels) {
    EXPECT_EQ(logLevelFromString("warn"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("verbose"), LogLevel::Info);

    auto log = logFromJson({{"level", "error"}, {"message", "boom"}, {"logger", "gh"}});
    ASSERT_TRUE(log);
    EXPECT_EQ(log.value().level, LogLevel::Error);
    EXPECT_TRUE(log.value().data.is_null());
    EXPECT_FALSE(logFromJson(json::array()));
}

TEST(StreamingClientTest, RoutesProgressByTokenAndDropsAfterEnd) {
    StreamingClient client;
    std::vector<ProgressEvent> seen;
    client.onProgress("tok", [&](const ProgressEvent& e) { seen.push_back(e); });
    EXPECT_EQ(client.progressCallbackCount(), 1u);

    RecordingSink recorded;
    StreamReporter reporter(recorded.sink());
    reporter.start(2, "work", "tok");
    reporter.start(2, "other", "someone-else");
    reporter.update("tok", 1);
    reporter.complete("tok");
    reporter.update("tok", 2);

    for (const auto& [method, params] : recorded.snapshot()) {
        client.handleNotification(method, params);
    }

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].kind, ProgressKind::Begin);
    EXPECT_EQ(seen[1].kind, ProgressKind::Report);
    EXPECT_EQ(seen[2].kind, ProgressKind::End);
    EXPECT_EQ(client.progressCallbackCount(), 0u);
}

TEST(StreamingClientTest, RemoveProgressCallback) {
    StreamingClient client;
    int calls = 0;
    client.onProgress("tok", [&](const ProgressEvent&) { ++calls; });
    client.removeProgressCallback("tok");
    client.removeProgressCallback("never-registered");

    client.handleNotification(std::string(wire::kNotifyProgress),
                              {{"token", "tok"}, {"value", {{"kind", "report"}}}});
    EXPECT_EQ(calls, 0);
}

TEST(StreamingClientTest, LogListeners) {
    StreamingClient client;
    std::vector<std::string> a;
    std::vector<std::string> b;
    auto idA = client.onLog([&](const LogNotification& log) { a.push_back(log.message); });
    client.onLog([&](const LogNotification& log) { b.push_back(log.message); });

    json first = {{"level", "info"}, {"message", "one"}, {"logger", "p"}};
    client.handleNotification(std::string(wire::kNotifyMessage), first);
    client.removeLogListener(idA);
    json second = {{"level", "info"}, {"message", "two"}, {"logger", "p"}};
    client.handleNotification(std::string(wire::kNotifyMessage), second);
    client.handleNotification("notifications/unknown", json::object());

    EXPECT_EQ(a, std::vector<std::string>{"one"});
    EXPECT_EQ(b, (std::vector<std::string>{"one", "two"}));
}

TEST(StreamingClientTest, ThrowingCallbackDoesNotEscape) {
    StreamingClient client;
    client.onProgress("tok", [](const ProgressEvent&) { throw std::runtime_error("bad callback"); });
    EXPECT_NO_THROW(client.handleNotification(std::string(wire::kNotifyProgress),
                                              {{"token", "tok"}, {"value", {{"kind", "end"}}}}));
    EXPECT_EQ(client.progressCallbackCount(), 0u);
}

TEST(StreamingClientTest, ExecuteWithProgressWithoutPlugin) {
    StreamingClient client;
    auto result = client.executeWithProgress({}, {}, {});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotInitialized);
}

TEST(StreamingClientTest, ExecuteWithProgressMintsTokenAndDeregisters) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    StreamingClient client(plugin);

    std::vector<ProgressEvent> progress;
    std::vector<LogNotification> logs;
    plugin->onExecute = [&](const CallContext& ctx, const ExecuteRequest&) -> Result<ExecuteResponse> {
        // Deliver notifications the way the connection's reader thread would
        EXPECT_EQ(client.progressCallbackCount(), 1u);
        client.handleNotification(std::string(wire::kNotifyProgress),
                                  {{"token", ctx.progressToken},
                                   {"value", {{"kind", "report"}, {"percentage", 50.0}}}});
        client.handleNotification(std::string(wire::kNotifyMessage),
                                  {{"level", "info"}, {"message", "halfway"}, {"logger", "p"}});
        ExecuteResponse resp;
        resp.success = true;
        return resp;
    };

    StreamingOptions options;
    options.onProgress = [&](const ProgressEvent& e) { progress.push_back(e); };
    options.onLog = [&](const LogNotification& l) { logs.push_back(l); };

    ExecuteRequest request;
    request.hook = kHookPrePublish;
    auto result = client.executeWithProgress({}, request, options);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().success);

    ASSERT_EQ(progress.size(), 1u);
    EXPECT_DOUBLE_EQ(progress[0].percentage, 50.0);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].message, "halfway");

    auto tokens = plugin->seenProgressTokens();
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].rfind(kHostTokenPrefix, 0), 0u) << tokens[0];
    // A plugin minting its own token can never land on the host's
    EXPECT_FALSE(std::regex_match(tokens[0], std::regex(R"(\d{14}-\d+)")));
    EXPECT_EQ(client.progressCallbackCount(), 0u);

    // Listener is gone once the call returned
    client.handleNotification(std::string(wire::kNotifyMessage),
                              {{"level", "info"}, {"message", "late"}, {"logger", "p"}});
    EXPECT_EQ(logs.size(), 1u);
}

TEST(StreamingClientTest, ExecuteWithProgressDeregistersOnError) {
    auto plugin = std::make_shared<ScriptedPlugin>();
    plugin->onExecute = [](const CallContext&, const ExecuteRequest&) -> Result<ExecuteResponse> {
        return Error{ErrorCode::NetworkError, "plugin connection lost"};
    };
    StreamingClient client;
    client.attach(plugin);

    StreamingOptions options;
    options.onProgress = [](const ProgressEvent&) {};
    auto result = client.executeWithProgress({}, {}, options);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(client.progressCallbackCount(), 0u);
}
