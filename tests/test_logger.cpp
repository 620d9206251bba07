#include <gtest/gtest.h>
#include <core/Logger.hpp>

#include "support/TempDir.hpp"

#include <fstream>

namespace fs = std::filesystem;

using gas::core::LogLevel;
using gas::core::Logger;
using gas::core::LoggerOptions;

class LoggerTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = gas::test::makeTempDir("gas_logger");
    }

    void TearDown() override {
        Logger::instance().initialize(LoggerOptions{LogLevel::Off, "", 1024, 1});
        fs::remove_all(test_dir);
    }
};

TEST_F(LoggerTest, WritesLogFileUnderLogDir) {
    LoggerOptions options;
    options.consoleLevel = LogLevel::Off;
    options.logDir = (test_dir / "logs").string();

    Logger::instance().initialize(options);
    EXPECT_TRUE(Logger::instance().hasFileSink());

    LOG_INFO("hello {}", "file");
    Logger::instance().flush();

    EXPECT_TRUE(fs::exists(test_dir / "logs" / "gas.log"));
}

TEST_F(LoggerTest, UncreatableLogDirFallsBackToConsole) {
    // A regular file where a parent directory is expected
    std::ofstream(test_dir / "blocker") << "x";

    LoggerOptions options;
    options.consoleLevel = LogLevel::Off;
    options.logDir = (test_dir / "blocker" / "logs").string();

    EXPECT_NO_THROW(Logger::instance().initialize(options));
    EXPECT_FALSE(Logger::instance().hasFileSink());
    EXPECT_NO_THROW(LOG_ERROR("still logging"));
}
