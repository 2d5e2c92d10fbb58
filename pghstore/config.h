#ifndef PGHSTORE_CONFIG_H
#define PGHSTORE_CONFIG_H

#include <optional>
#include <string>
#include <unordered_map>

#include "logger.h"

namespace pghstore
{

/**
 * Logging settings as found in the environment. Unset variables stay empty and leave the
 * logger's current setting alone.
 *
 *   - `PGHSTORE_LOG_LEVEL`: one of the `StringToLogLevel` names, optionally with a `LOG_` prefix;
 *   - `PGHSTORE_LOG_TIMES`: `true`/`yes` or `false`/`no` (lower or upper case);
 *   - `PGHSTORE_LOG_PATH`: file to append log lines to, instead of stderr.
 */
struct LoggingConfig
{
    std::optional<LogLevel> log_level;
    std::optional<bool> log_times;
    std::optional<std::string> log_path;
};

/**
 * Throws `ConfigError` for a level or boolean that cannot be recognized.
 */
LoggingConfig logging_config_from_environ(const std::unordered_map<std::string, std::string> &env);

LoggingConfig logging_config_from_env();

void apply_logging_config(const LoggingConfig &config, Logger *logger);

}

#endif // PGHSTORE_CONFIG_H
