#ifndef PGHSTORE_LOGGER_H
#define PGHSTORE_LOGGER_H

#include <stdio.h>
#include <stdarg.h>

#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace pghstore
{

/**
 * The log levels and their interpretations have been taken from PostgreSQL.
 * See “Message Severity Levels” in the Postgres documentation for details:
 * https://www.postgresql.org/docs/current/runtime-config-logging.html#RUNTIME-CONFIG-SEVERITY-LEVELS
 */
enum LogLevel {
    LOG_NONE    = 0b00000000000000000000000000000000,
    LOG_PANIC   = 0b00000000000000000000000000000001,
    LOG_FATAL   = 0b00000000000000000000000000000011,
    LOG_LOG     = 0b00000000000000000000000000000111,
    LOG_ERROR   = 0b00000000000000000000000000001111,
    LOG_WARNING = 0b00000000000000000000000000011111,
    LOG_NOTICE  = 0b00000000000000000000000000111111,
    LOG_INFO    = 0b00000000000000000000000001111111,
    LOG_DEBUG1  = 0b00000000000000000000000011111111,
    LOG_DEBUG2  = 0b00000000000000000000000111111111,
    LOG_DEBUG3  = 0b00000000000000000000001111111111,
    LOG_DEBUG4  = 0b00000000000000000000011111111111,
    LOG_DEBUG5  = 0b00000000000000000000111111111111,
};

const std::unordered_map<std::string, LogLevel> StringToLogLevel = {
    {"DEBUG1",  LOG_DEBUG1},
    {"DEBUG2",  LOG_DEBUG2},
    {"DEBUG3",  LOG_DEBUG3},
    {"DEBUG4",  LOG_DEBUG4},
    {"DEBUG5",  LOG_DEBUG5},
    {"ERROR",   LOG_ERROR},
    {"FATAL",   LOG_FATAL},
    {"INFO",    LOG_INFO},
    {"LOG",     LOG_LOG},
    {"NONE",    LOG_NONE},
    {"NOTICE",  LOG_NOTICE},
    {"PANIC",   LOG_PANIC},
    {"WARNING", LOG_WARNING},
};

const std::map<LogLevel, std::string> LogLevelToString = []() -> std::map<LogLevel, std::string>
{
    std::map<LogLevel, std::string> m;
    for (auto it = StringToLogLevel.begin(); it != StringToLogLevel.end(); ++it)
        m.emplace((*it).second, (*it).first);

    return m;
}();

/**
 * Strips the optional `LOG_` prefix, so that both `DEBUG1` and `LOG_DEBUG1` name the same level.
 */
std::string normalize_log_level(const std::string &str);

/**
 * @brief Use as a temporary, so don't give a name. This makes the stream gets logged immediately.
 */
class StreamToLog : public std::ostringstream
{
    LogLevel level = LOG_NOTICE;
public:
    StreamToLog(LogLevel level);
    ~StreamToLog();
};

/**
 * Process-wide logger for the hstore codec.
 *
 * Lines are written synchronously, either to the log file set with `setLogPath()` or to stderr.
 * The environment (see `config.h`) is applied once, when the instance is first created.
 */
class Logger
{
    std::string logPath;
    LogLevel curLogLevel = LOG_WARNING;
    std::mutex logMutex;
    FILE *file = nullptr;
    bool reload = false;

    Logger();
    ~Logger();
    std::string getLogLevelString(LogLevel level) const;
    void reOpen();
    void writeLine(const std::string &line);

public:
    bool logTimes = true;

    static Logger *getInstance();
    void log(LogLevel level, const char *str, va_list args);
    void log(LogLevel level, const char *str, ...);
    StreamToLog logstream(LogLevel level);

    bool wouldLog(LogLevel level) const;

    void setLogPath(const std::string &path);
    const std::string &getLogPath() const;
    void setLogLevel(const LogLevel level);
    LogLevel getLogLevel() const;
};

}

#endif // PGHSTORE_LOGGER_H
