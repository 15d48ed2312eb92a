#include <gtest/gtest.h>

#include <relicta/plugin/config_parser.h>

#include "../../common/scoped_env.h"

#include <filesystem>
#include <cstdint>
#include <fstream>
#include <limits>
#include <random>

using namespace relicta;
using namespace relicta::plugin;
using relicta::test::ScopedEnv;
namespace fs = std::filesystem;

TEST(ConfigParserTest, StringsFallBackToEnvironment) {
    ScopedEnv primary("RELICTA_TEST_TOKEN_A", std::nullopt);
    ScopedEnv secondary("RELICTA_TEST_TOKEN_B", "from-env");

    ConfigParser parser({{"token", "from-config"}, {"empty", ""}, {"number", 3}});
    EXPECT_EQ(parser.getString("token", {"RELICTA_TEST_TOKEN_B"}), "from-config");
    EXPECT_EQ(parser.getString("empty", {"RELICTA_TEST_TOKEN_A", "RELICTA_TEST_TOKEN_B"}),
              "from-env");
    EXPECT_EQ(parser.getString("number"), "");
    EXPECT_EQ(parser.getString("missing"), "");
}

TEST(ConfigParserTest, TypedReadsAreLenient) {
    ConfigParser parser({{"enabled", true},
                         {"notBool", "yes"},
                         {"retries", 3},
                         {"ratio", 2.9},
                         {"negative", -7.5},
                         {"labels", {"a", 1, "b"}},
                         {"headers", {{"X-A", "1"}, {"X-B", 2}}},
                         {"nothing", nullptr}});

    EXPECT_TRUE(parser.getBool("enabled"));
    EXPECT_FALSE(parser.getBool("notBool"));
    EXPECT_TRUE(parser.getBoolDefault("notBool", true));
    EXPECT_TRUE(parser.getBoolDefault("missing", true));

    EXPECT_EQ(parser.getInt("retries"), 3);
    EXPECT_EQ(parser.getInt("ratio"), 2);
    EXPECT_EQ(parser.getInt("negative"), -7);
    EXPECT_EQ(parser.getIntDefault("labels", 9), 9);
    EXPECT_DOUBLE_EQ(parser.getFloat("ratio"), 2.9);
    EXPECT_DOUBLE_EQ(parser.getFloat("retries"), 3.0);
    EXPECT_DOUBLE_EQ(parser.getFloat("enabled"), 0.0);

    EXPECT_EQ(parser.getStringSlice("labels"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(parser.getStringSlice("retries").empty());

    auto headers = parser.getStringMap("headers");
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers["X-A"], "1");

    EXPECT_TRUE(parser.has("nothing"));
    EXPECT_FALSE(parser.has("missing"));
}

TEST(ConfigParserTest, OutOfRangeNumbersReadAsDefault) {
    ConfigParser parser({{"huge", 1e300},
                         {"tiny", -1e300},
                         {"edge", 9223372036854775808.0},
                         {"big", 18446744073709551615ull},
                         {"max", 9223372036854775807ll},
                         {"fits", -9.2e18}});

    EXPECT_EQ(parser.getInt("huge"), 0);
    EXPECT_EQ(parser.getIntDefault("huge", 5), 5);
    EXPECT_EQ(parser.getIntDefault("tiny", 5), 5);
    EXPECT_EQ(parser.getIntDefault("edge", 5), 5);
    EXPECT_EQ(parser.getIntDefault("big", 5), 5);
    EXPECT_EQ(parser.getInt("max"), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(parser.getInt("fits"), static_cast<int64_t>(-9.2e18));
    EXPECT_DOUBLE_EQ(parser.getFloat("huge"), 1e300);
}

TEST(ValidationBuilderTest, ListsEveryAlternativeInMessages) {
    ScopedEnv a("RELICTA_TEST_TOKEN_A", std::nullopt);
    ScopedEnv b("RELICTA_TEST_TOKEN_B", std::nullopt);
    ConfigMap config = {{"level", "loud"}};

    auto resp = ValidationBuilder()
                    .requireStringWithEnv(config, "token",
                                          {"RELICTA_TEST_TOKEN_A", "RELICTA_TEST_TOKEN_B"})
                    .requireStringWithEnv(config, "secret", {})
                    .validateEnum(config, "level", {"debug", "info", "warn"})
                    .build();

    ASSERT_EQ(resp.errors.size(), 3u);
    EXPECT_EQ(resp.errors[0].message,
              "token is required (or set RELICTA_TEST_TOKEN_A or RELICTA_TEST_TOKEN_B)");
    EXPECT_EQ(resp.errors[1].message, "secret is required");
    EXPECT_EQ(resp.errors[2].message, "level must be one of: debug, info, warn");
}

TEST(ConfigParserTest, NonObjectConfigReadsAsEmpty) {
    ConfigParser parser(ConfigMap::array({1, 2}));
    EXPECT_TRUE(parser.raw().is_object());
    EXPECT_EQ(parser.getString("anything"), "");
    EXPECT_FALSE(parser.has("anything"));
}

TEST(ValidationBuilderTest, CollectsErrorsInOrder) {
    ScopedEnv token("RELICTA_TEST_SLACK_TOKEN", std::nullopt);
    ConfigMap config = {{"format", "html"},
                        {"pattern", "(unclosed"},
                        {"webhook", "https://bad host/x"},
                        {"mentions", {"alice", 42}}};

    auto resp = ValidationBuilder()
                    .requireString(config, "channel")
                    .requireStringWithEnv(config, "token", {"RELICTA_TEST_SLACK_TOKEN"})
                    .validateEnum(config, "format", {"plain", "markdown"})
                    .validateRegex(config, "pattern")
                    .validateUrl(config, "webhook")
                    .validateStringSlice(config, "mentions")
                    .build();

    EXPECT_FALSE(resp.valid);
    ASSERT_EQ(resp.errors.size(), 6u);

    EXPECT_EQ(resp.errors[0].field, "channel");
    EXPECT_EQ(resp.errors[0].message, "channel is required");
    EXPECT_EQ(resp.errors[0].code, "required");

    EXPECT_EQ(resp.errors[1].message, "token is required (or set RELICTA_TEST_SLACK_TOKEN)");

    EXPECT_EQ(resp.errors[2].message, "format must be one of: plain, markdown");
    EXPECT_EQ(resp.errors[2].code, "enum");

    EXPECT_EQ(resp.errors[3].code, "format");
    EXPECT_EQ(resp.errors[3].message.rfind("invalid regex pattern: ", 0), 0u);

    EXPECT_EQ(resp.errors[4].field, "webhook");
    EXPECT_EQ(resp.errors[4].message, "invalid URL format");

    EXPECT_EQ(resp.errors[5].field, "mentions[1]");
    EXPECT_EQ(resp.errors[5].message, "mentions[1] must be string");
    EXPECT_EQ(resp.errors[5].code, "type");
}

TEST(ValidationBuilderTest, EnvironmentSatisfiesRequirement) {
    ScopedEnv token("RELICTA_TEST_SLACK_TOKEN", "xoxb-1");
    auto resp = ValidationBuilder()
                    .requireStringWithEnv(ConfigMap::object(), "token",
                                          {"RELICTA_TEST_UNSET_VAR", "RELICTA_TEST_SLACK_TOKEN"})
                    .build();
    EXPECT_TRUE(resp.valid);
    EXPECT_TRUE(resp.errors.empty());
}

TEST(ValidationBuilderTest, AbsentOptionalFieldsPass) {
    ConfigMap config = {{"format", "plain"}, {"webhook", "https://hooks.slack.com/x"}};
    ValidationBuilder builder;
    builder.validateEnum(config, "format", {"plain", "markdown"})
        .validateRegex(config, "pattern")
        .validateUrl(config, "webhook")
        .validateStringSlice(config, "mentions");
    EXPECT_FALSE(builder.hasErrors());
    EXPECT_TRUE(builder.build().valid);
}

TEST(ValidationBuilderTest, ManualErrors) {
    ValidationBuilder builder;
    builder.addTypeError("retries", "integer").addFormatError("when", "bad timestamp");
    ASSERT_EQ(builder.errors().size(), 2u);
    EXPECT_EQ(builder.errors()[0].message, "retries must be integer");
    EXPECT_EQ(builder.errors()[1].code, "format");
}

TEST(UrlTest, ParseUrl) {
    auto url = parseUrl("HTTPS://user:pw@hooks.slack.com:443/services/T0/B0?x=1#frag");
    ASSERT_TRUE(url);
    EXPECT_EQ(url.value().scheme, "https");
    EXPECT_EQ(url.value().host, "hooks.slack.com:443");
    EXPECT_EQ(url.value().path, "/services/T0/B0");
    EXPECT_EQ(url.value().query, "x=1");
    EXPECT_EQ(url.value().fragment, "frag");

    auto relative = parseUrl("just/a/path");
    ASSERT_TRUE(relative);
    EXPECT_EQ(relative.value().scheme, "");
    EXPECT_EQ(relative.value().path, "just/a/path");

    EXPECT_FALSE(parseUrl("://missing-scheme"));
    EXPECT_FALSE(parseUrl("https://example.com/%zz"));
    EXPECT_FALSE(parseUrl("https://exa\nmple.com"));
}

TEST(UrlTest, Validator) {
    auto validator = UrlValidator("https").withHosts({"hooks.slack.com"}).withPathPrefix("/services/");

    EXPECT_TRUE(validator.validate("https://hooks.slack.com/services/T0/B0"));

    auto empty = validator.validate("");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(empty.error().message, "URL is required");

    auto scheme = validator.validate("http://hooks.slack.com/services/T0");
    ASSERT_FALSE(scheme);
    EXPECT_EQ(scheme.error().message, "URL must use https scheme");

    auto host = validator.validate("https://internal.corp/services/T0");
    ASSERT_FALSE(host);
    EXPECT_EQ(host.error().message,
              "URL host internal.corp is not allowed, must be one of: hooks.slack.com");

    auto path = validator.validate("https://hooks.slack.com/api/chat");
    ASSERT_FALSE(path);
    EXPECT_EQ(path.error().message, "URL path must start with /services/");
}

namespace {

class AssetPathTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("relicta-assets-" + std::to_string(rd()));
        fs::create_directories(root_ / "dist");
        std::ofstream(root_ / "dist" / "app.tar.gz") << "payload";
        previous_ = fs::current_path();
        fs::current_path(root_);
    }

    void TearDown() override {
        fs::current_path(previous_);
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    fs::path previous_;
};

} // namespace

TEST_F(AssetPathTest, ResolvesFilesInsideWorkingDirectory) {
    auto resolved = validateAssetPath("dist/app.tar.gz");
    ASSERT_TRUE(resolved) << resolved.error().message;
    EXPECT_EQ(resolved.value().string(), fs::canonical(root_ / "dist" / "app.tar.gz").string());

    auto absolute = validateAssetPath((root_ / "dist" / "app.tar.gz").string());
    EXPECT_TRUE(absolute);
}

TEST_F(AssetPathTest, RejectsBadPaths) {
    auto empty = validateAssetPath("");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);

    auto traversal = validateAssetPath("../etc/passwd");
    ASSERT_FALSE(traversal);
    EXPECT_EQ(traversal.error().message.rfind("path traversal not allowed", 0), 0u);

    auto missing = validateAssetPath("dist/missing.zip");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto directory = validateAssetPath("dist");
    ASSERT_FALSE(directory);
    EXPECT_NE(directory.error().message.find("is a directory"), std::string::npos);

    auto outside = validateAssetPath("/etc/hostname");
    if (fs::exists("/etc/hostname")) {
        ASSERT_FALSE(outside);
        EXPECT_NE(outside.error().message.find("outside working directory"), std::string::npos);
    }
}

TEST_F(AssetPathTest, RejectsSymlinkEscapes) {
    std::error_code ec;
    fs::create_symlink("/etc", root_ / "dist" / "escape", ec);
    if (ec) {
        GTEST_SKIP() << "cannot create symlink: " << ec.message();
    }
    auto escaped = validateAssetPath("dist/escape/hostname");
    ASSERT_FALSE(escaped);
}

TEST(MentionTest, Formats) {
    std::vector<std::string> mentions{"alice", "@bob", "<@U123>"};
    EXPECT_EQ(buildMentionText(mentions, MentionFormat::Plain), "@alice @bob @<@U123>");
    EXPECT_EQ(buildMentionText(mentions, MentionFormat::Slack), "<@alice> <@bob> <@U123>");
    EXPECT_EQ(buildMentionText({"@everyone", "<#C1>", "42"}, MentionFormat::Discord),
              "@everyone <#C1> <@42>");
    EXPECT_EQ(buildMentionText({}, MentionFormat::Slack), "");
}
