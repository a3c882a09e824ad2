#include <gtest/gtest.h>

#include <filesystem>
#include <spdlog/spdlog.h>
#include <wirebind/config/config_helpers.h>
#include <wirebind/config/marshalling_config.h>

#include "../../common/test_helpers.h"

using namespace wirebind;
using namespace wirebind::config;

namespace {

class MarshallingConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("wirebind_config_test_");
        savedLevel_ = spdlog::get_level();
    }

    void TearDown() override {
        spdlog::set_level(savedLevel_);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path writeConfig(const std::string& body) {
        return tests::write_file(dir_ / "config.toml", body);
    }

    std::filesystem::path dir_;
    spdlog::level::level_enum savedLevel_ = spdlog::level::info;
};

} // namespace

TEST_F(MarshallingConfigTest, MissingFileIsNotFound) {
    auto cfg = loadMarshallingConfig(dir_ / "absent.toml");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::NotFound);
}

TEST_F(MarshallingConfigTest, ReadsMarshallingSection) {
    auto path = writeConfig(R"(# engine settings
[logging]
log_level = "info"

[marshalling]
header_list_separator = ";"
aws_json_version = "1.0"
query_api_version = '2012-11-05'   # SQS
xml_namespace = "http://s3.amazonaws.com/doc/2006-03-01/"
emit_empty_aws_json_body = no
log_level = debug
)");

    auto cfg = loadMarshallingConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().headerListSeparator, ";");
    EXPECT_EQ(cfg.value().awsJsonVersion, "1.0");
    EXPECT_EQ(cfg.value().awsJsonContentType(), "application/x-amz-json-1.0");
    EXPECT_EQ(cfg.value().queryApiVersion, "2012-11-05");
    EXPECT_EQ(cfg.value().xmlNamespace, "http://s3.amazonaws.com/doc/2006-03-01/");
    EXPECT_FALSE(cfg.value().emitEmptyAwsJsonBody);
    EXPECT_EQ(cfg.value().logLevel, "debug");
    EXPECT_EQ(cfg.value().jsonContentType, "application/json");
}

TEST_F(MarshallingConfigTest, DottedKeysOutsideSection) {
    auto path = writeConfig("marshalling.header_list_separator = \"|\"\n");
    auto cfg = loadMarshallingConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().headerListSeparator, "|");
}

TEST_F(MarshallingConfigTest, RejectsNonBooleanFlag) {
    auto path = writeConfig("[marshalling]\nemit_empty_aws_json_body = maybe\n");
    auto cfg = loadMarshallingConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
}

TEST_F(MarshallingConfigTest, RejectsEmptySeparator) {
    auto path = writeConfig("[marshalling]\nheader_list_separator = \"\"\n");
    auto cfg = loadMarshallingConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
}

TEST_F(MarshallingConfigTest, ResolveFallsBackToDefaults) {
    tests::EnvGuard cfgEnv("WIREBIND_CONFIG", (dir_ / "nowhere.toml").string());
    tests::EnvGuard lvlEnv("WIREBIND_LOG_LEVEL", std::nullopt);

    auto cfg = resolveMarshallingConfig();
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().headerListSeparator, ",");
    EXPECT_TRUE(cfg.value().emitEmptyAwsJsonBody);
    EXPECT_TRUE(cfg.value().logLevel.empty());
}

TEST_F(MarshallingConfigTest, EnvironmentLogLevelOverridesFile) {
    auto path = writeConfig("[marshalling]\nlog_level = info\n");
    tests::EnvGuard cfgEnv("WIREBIND_CONFIG", path.string());
    tests::EnvGuard lvlEnv("WIREBIND_LOG_LEVEL", std::string("trace"));

    auto cfg = resolveMarshallingConfig();
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().logLevel, "trace");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::trace);
}

TEST_F(MarshallingConfigTest, ResolvedLogLevelIsApplied) {
    auto path = writeConfig("[marshalling]\nlog_level = error\n");
    tests::EnvGuard cfgEnv("WIREBIND_CONFIG", path.string());
    tests::EnvGuard lvlEnv("WIREBIND_LOG_LEVEL", std::nullopt);
    spdlog::set_level(spdlog::level::info);

    auto cfg = resolveMarshallingConfig();
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
}

TEST_F(MarshallingConfigTest, EmptyLogLevelLeavesLoggerAlone) {
    tests::EnvGuard cfgEnv("WIREBIND_CONFIG", (dir_ / "nowhere.toml").string());
    tests::EnvGuard lvlEnv("WIREBIND_LOG_LEVEL", std::nullopt);
    spdlog::set_level(spdlog::level::warn);

    auto cfg = resolveMarshallingConfig();
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}

TEST_F(MarshallingConfigTest, ConfigPathPrecedence) {
    tests::EnvGuard cfgEnv("WIREBIND_CONFIG", std::nullopt);
    tests::EnvGuard xdg("XDG_CONFIG_HOME", dir_.string());

    EXPECT_EQ(get_config_path("/etc/wirebind.toml"), std::filesystem::path("/etc/wirebind.toml"));
    EXPECT_EQ(get_config_path(), dir_ / "wirebind" / "config.toml");
}

TEST(ConfigHelpersTest, ParseBoolAcceptsCommonSpellings) {
    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool(" off "), false);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_FALSE(parse_bool("enabled").has_value());
}
