#include "daemon/app/app.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;
using zonelink::AppConfig;
using zonelink::app::App;
using zonelink::app::AppOverrides;
using zonelink::logging::LogLevel;

class AppConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        tempDir_ = fs::temp_directory_path() / ("zonelink_app_config_" + std::to_string(getpid()));
        fs::create_directories(tempDir_);
        configPath_ = tempDir_ / "zonelink.json";
        clearEnv();
    }

    void TearDown() override {
        clearEnv();
        fs::remove_all(tempDir_);
    }

    static void clearEnv() {
        ::unsetenv("ZONELINK_CALLBACK_HOST");
        ::unsetenv("ZONELINK_CALLBACK_PORT");
        ::unsetenv("ZONELINK_SEARCH_INTERVAL_SEC");
        ::unsetenv("ZONELINK_LOG_LEVEL");
    }

    void writeConfig(const std::string& json) {
        std::ofstream out(configPath_);
        out << json;
    }

    fs::path tempDir_;
    fs::path configPath_;
};

TEST_F(AppConfigTest, MissingFileFallsBackToDefaults) {
    AppConfig config;
    config.events.callbackHost = "leftover";
    ASSERT_TRUE(App::loadRuntimeConfig((tempDir_ / "absent.json").string(), {}, config));
    EXPECT_EQ(config.events.callbackHost, "");
    EXPECT_EQ(config.discovery.searchIntervalSec, AppConfig{}.discovery.searchIntervalSec);
}

TEST_F(AppConfigTest, CommandLineOverridesWinOverFileAndEnvironment) {
    writeConfig(R"({"events": {"callbackHost": "10.0.0.2", "callbackPort": 3400}})");
    ::setenv("ZONELINK_CALLBACK_HOST", "10.0.0.3", 1);

    AppOverrides overrides;
    overrides.callbackPort = 3500;
    overrides.logLevel = "debug";

    AppConfig config;
    ASSERT_TRUE(App::loadRuntimeConfig(configPath_.string(), overrides, config));
    EXPECT_EQ(config.events.callbackHost, "10.0.0.3");
    EXPECT_EQ(config.events.callbackPort, 3500);
    EXPECT_EQ(config.logging.level, LogLevel::Debug);

    overrides.callbackHost = "10.0.0.4";
    ASSERT_TRUE(App::loadRuntimeConfig(configPath_.string(), overrides, config));
    EXPECT_EQ(config.events.callbackHost, "10.0.0.4");
}

TEST_F(AppConfigTest, InvalidEnvironmentValueFailsTheLoad) {
    ::setenv("ZONELINK_SEARCH_INTERVAL_SEC", "soon", 1);
    AppConfig config;
    EXPECT_FALSE(App::loadRuntimeConfig(configPath_.string(), {}, config));

    ::setenv("ZONELINK_SEARCH_INTERVAL_SEC", "0", 1);
    EXPECT_FALSE(App::loadRuntimeConfig(configPath_.string(), {}, config));
}
