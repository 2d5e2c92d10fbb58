#include <gtest/gtest.h>
#include "pghstore/config.h"
#include "pghstore/pghstore_error.h"

#include <stdlib.h>

#include <string>
#include <unordered_map>

using namespace pghstore;

TEST(ConfigTest, EmptyEnvironmentChangesNothing) {
    LoggingConfig config = logging_config_from_environ(std::unordered_map<std::string, std::string>());
    EXPECT_FALSE(config.log_level.has_value());
    EXPECT_FALSE(config.log_times.has_value());
    EXPECT_FALSE(config.log_path.has_value());
}

TEST(ConfigTest, ParsesAllSettings) {
    std::unordered_map<std::string, std::string> env = {
        {"PGHSTORE_LOG_LEVEL", "LOG_DEBUG2"},
        {"PGHSTORE_LOG_TIMES", "no"},
        {"PGHSTORE_LOG_PATH", "/tmp/pghstore.log"},
        {"UNRELATED", "x"},
    };

    LoggingConfig config = logging_config_from_environ(env);
    EXPECT_EQ(config.log_level, LOG_DEBUG2);
    EXPECT_EQ(config.log_times, false);
    EXPECT_EQ(config.log_path, "/tmp/pghstore.log");
}

TEST(ConfigTest, EmptyValuesAreUnset) {
    std::unordered_map<std::string, std::string> env = {{"PGHSTORE_LOG_LEVEL", ""}, {"PGHSTORE_LOG_PATH", ""}};

    LoggingConfig config = logging_config_from_environ(env);
    EXPECT_FALSE(config.log_level.has_value());
    EXPECT_FALSE(config.log_path.has_value());
}

TEST(ConfigTest, RejectsUnknownValues) {
    std::unordered_map<std::string, std::string> bad_level = {{"PGHSTORE_LOG_LEVEL", "VERBOSE"}};
    std::unordered_map<std::string, std::string> bad_times = {{"PGHSTORE_LOG_TIMES", "maybe"}};

    EXPECT_THROW(logging_config_from_environ(bad_level), ConfigError);
    EXPECT_THROW(logging_config_from_environ(bad_times), ConfigError);
}

TEST(ConfigTest, ReadsProcessEnvironment) {
    setenv("PGHSTORE_LOG_LEVEL", "DEBUG3", 1);
    setenv("PGHSTORE_LOG_TIMES", "TRUE", 1);

    LoggingConfig config = logging_config_from_env();

    unsetenv("PGHSTORE_LOG_LEVEL");
    unsetenv("PGHSTORE_LOG_TIMES");

    EXPECT_EQ(config.log_level, LOG_DEBUG3);
    EXPECT_EQ(config.log_times, true);
}

TEST(ConfigTest, AppliesToLogger) {
    Logger *logger = Logger::getInstance();
    const LogLevel saved_level = logger->getLogLevel();
    const bool saved_times = logger->logTimes;

    LoggingConfig config;
    config.log_level = LOG_DEBUG4;
    config.log_times = false;
    apply_logging_config(config, logger);

    EXPECT_EQ(logger->getLogLevel(), LOG_DEBUG4);
    EXPECT_FALSE(logger->logTimes);

    apply_logging_config(LoggingConfig(), logger);
    EXPECT_EQ(logger->getLogLevel(), LOG_DEBUG4);

    logger->setLogLevel(saved_level);
    logger->logTimes = saved_times;
}
