#include <gtest/gtest.h>

#include <spdlog/spdlog.h>
#include <wirebind/core/logging.h>

#include "../../common/test_helpers.h"

using namespace wirebind;

namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = spdlog::get_level(); }
    void TearDown() override { spdlog::set_level(saved_); }

private:
    spdlog::level::level_enum saved_ = spdlog::level::info;
};

} // namespace

TEST_F(LoggingTest, ParsesKnownLevelsCaseInsensitively) {
    EXPECT_EQ(logging::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::parseLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(logging::parseLevel("Warning"), spdlog::level::warn);
    EXPECT_EQ(logging::parseLevel("err"), spdlog::level::err);
    EXPECT_EQ(logging::parseLevel("off"), spdlog::level::off);
    EXPECT_FALSE(logging::parseLevel("verbose").has_value());
}

TEST_F(LoggingTest, ConfigureAppliesLevel) {
    EXPECT_TRUE(logging::configure("error"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
}

TEST_F(LoggingTest, UnknownLevelLeavesLoggerUntouched) {
    spdlog::set_level(spdlog::level::info);
    EXPECT_FALSE(logging::configure("chatty"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}

TEST_F(LoggingTest, EnvironmentWinsOverFallback) {
    tests::EnvGuard env("WIREBIND_LOG_LEVEL", std::string("critical"));
    logging::configureFromEnvironment("debug");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::critical);
}

TEST_F(LoggingTest, FallbackUsedWithoutEnvironment) {
    tests::EnvGuard env("WIREBIND_LOG_LEVEL", std::nullopt);
    logging::configureFromEnvironment("debug");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
}
