#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>

#include "./test_utils.hpp"

#include "../src/core/converter.h"
#include "../src/system/config.h"

#ifndef _WIN32

class config_test : public ::testing::Test {
protected:
    void SetUp() override {
        config::Config::getInstance().reset();
        for (const char* name : { config::ENV_BIN, config::ENV_BIN_DIR, config::ENV_DEBUG,
                                  config::ENV_EMBEDDED_BIN, config::ENV_LOG_FILE }) {
            unsetenv(name);
        }
    }

    void TearDown() override {
        SetUp();
    }
};

TEST_F(config_test, defaults) {
    const auto s = config::getSettings();
    EXPECT_TRUE(s.binPath.empty());
    EXPECT_TRUE(s.binDir.empty());
    EXPECT_FALSE(s.debug);
}

TEST_F(config_test, missing_file_is_not_fatal) {
    EXPECT_FALSE(config::loadConfig("/nonexistent/sz2zip/config.json"));
    EXPECT_TRUE(config::getSettings().binPath.empty());
}

TEST_F(config_test, environment_overrides_file) {
    const auto dir = make_tmp_dir("config");
    const auto path = (std::filesystem::path(dir) / "config.json").string();
    write_file(path, R"({"bin": "/from/file/7zz", "bin_dir": "/from/file", "debug": false})");

    setenv(config::ENV_BIN, "/from/env/7zz", 1);
    setenv(config::ENV_DEBUG, "1", 1);
    EXPECT_TRUE(config::loadConfig(path));
    config::loadEnvironment();

    const auto s = config::getSettings();
    EXPECT_EQ(s.binPath, "/from/env/7zz");
    EXPECT_EQ(s.binDir, "/from/file");
    EXPECT_TRUE(s.debug);

    const auto options = core::resolverOptionsFromConfig();
    EXPECT_EQ(options.binPath, "/from/env/7zz");
    EXPECT_EQ(options.binDir, "/from/file");
    std::filesystem::remove_all(dir);
}

TEST_F(config_test, malformed_file_ignored) {
    const auto dir = make_tmp_dir("config-bad");
    const auto path = (std::filesystem::path(dir) / "config.json").string();
    write_file(path, "{ not json");
    EXPECT_FALSE(config::loadConfig(path));
    EXPECT_TRUE(config::getSettings().binPath.empty());
    std::filesystem::remove_all(dir);
}

TEST_F(config_test, debug_toggle_only_on_one) {
    setenv(config::ENV_DEBUG, "0", 1);
    config::loadEnvironment();
    EXPECT_FALSE(config::getSettings().debug);
}

#endif // _WIN32
