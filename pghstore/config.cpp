#include "config.h"

#include <unistd.h>

#include "pghstore_error.h"
#include "utils.h"

extern char **environ;

namespace
{

std::optional<std::string> lookup(const std::unordered_map<std::string, std::string> &env, const std::string &name)
{
    auto it = env.find(name);
    if (it == env.end() or it->second.empty())
        return {};
    return it->second;
}

}

pghstore::LoggingConfig pghstore::logging_config_from_environ(const std::unordered_map<std::string, std::string> &env)
{
    LoggingConfig config;

    std::optional<std::string> log_level = lookup(env, "PGHSTORE_LOG_LEVEL");
    if (log_level)
    {
        const std::string level_name = normalize_log_level(log_level.value());
        if (StringToLogLevel.count(level_name) == 0)
            throw ConfigError(std::string("Unrecognized log level: ") + log_level.value());
        config.log_level = StringToLogLevel.at(level_name);
    }

    std::optional<std::string> log_times = lookup(env, "PGHSTORE_LOG_TIMES");
    if (log_times)
    {
        const std::string &v = log_times.value();
        if (v == "true" or v == "TRUE" or v == "yes" or v == "YES")
            config.log_times = true;
        else if (v == "false" or v == "FALSE" or v == "no" or v == "NO")
            config.log_times = false;
        else
            throw ConfigError(std::string("Unrecognized boolean for PGHSTORE_LOG_TIMES: ") + v);
    }

    config.log_path = lookup(env, "PGHSTORE_LOG_PATH");

    return config;
}

pghstore::LoggingConfig pghstore::logging_config_from_env()
{
    return logging_config_from_environ(environ_to_unordered_map(environ));
}

void pghstore::apply_logging_config(const LoggingConfig &config, Logger *logger)
{
    if (config.log_level)
        logger->setLogLevel(config.log_level.value());
    if (config.log_times)
        logger->logTimes = config.log_times.value();
    if (config.log_path)
        logger->setLogPath(config.log_path.value());
}
