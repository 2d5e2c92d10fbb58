/*
Adapted from the logger of pg_cmd_queue, which in turn had been adapted from FlashMQ (https://www.flashmq.org)
*/

#include "logger.h"

#include <ctime>
#include <iomanip>
#include <string.h>

#include <errno.h>

#include "config.h"
#include "pghstore_error.h"

std::string pghstore::normalize_log_level(const std::string &str)
{
    if (str.substr(0, 4) == "LOG_")
        return str.substr(4);
    return str;
}

pghstore::StreamToLog::StreamToLog(LogLevel level) :
    level(level)
{

}

pghstore::StreamToLog::~StreamToLog()
{
    const std::string s = str();
    Logger *logger = Logger::getInstance();
    logger->log(this->level, "%s", s.c_str());
}

pghstore::Logger::Logger()
{
    try
    {
        apply_logging_config(logging_config_from_env(), this);
    }
    catch (const ConfigError &err)
    {
        log(LOG_WARNING, "Ignoring logging configuration from the environment: %s", err.what());
    }
}

pghstore::Logger::~Logger()
{
    if (file)
    {
        fclose(file);
        file = nullptr;
    }
}

std::string pghstore::Logger::getLogLevelString(LogLevel level) const
{
    auto it = LogLevelToString.find(level);
    if (it == LogLevelToString.end())
        return "UNKNOWN LOG LEVEL";
    return it->second;
}

pghstore::Logger *pghstore::Logger::getInstance()
{
    static Logger instance;
    return &instance;
}

// Must be called with `logMutex` held.
void pghstore::Logger::reOpen()
{
    reload = false;

    if (file)
    {
        fclose(file);
        file = nullptr;
    }

    if (logPath.empty())
        return;

    if ((file = fopen(logPath.c_str(), "a")) == nullptr)
    {
        fprintf(stderr, "(Re)opening log file '%s' error: %s. Logging to stderr.\n", logPath.c_str(), strerror(errno));
    }
}

void pghstore::Logger::setLogPath(const std::string &path)
{
    std::lock_guard<std::mutex> locker(logMutex);
    this->logPath = path;
    reload = true;
}

const std::string &pghstore::Logger::getLogPath() const
{
    return logPath;
}

void pghstore::Logger::setLogLevel(LogLevel level)
{
    curLogLevel = level;
}

pghstore::LogLevel pghstore::Logger::getLogLevel() const
{
    return curLogLevel;
}

bool pghstore::Logger::wouldLog(LogLevel level) const
{
    return level <= curLogLevel and level != LOG_NONE;
}

// Must be called with `logMutex` held.
void pghstore::Logger::writeLine(const std::string &line)
{
    if (reload)
        reOpen();

    if (this->file)
    {
        if (fputs(line.c_str(), this->file) >= 0 and
            fputs("\n", this->file) >= 0 and
            fflush(this->file) == 0)
        {
            return;
        }

        fputs("Writing to log failed. Falling back to stderr.\n", stderr);
    }

    fputs(line.c_str(), stderr);
    fputs("\n", stderr);
    fflush(stderr);
}

void pghstore::Logger::log(LogLevel level, const char *str, va_list valist)
{
    if (not wouldLog(level))
        return;

    time_t time = std::time(nullptr);
    struct tm tm = *std::localtime(&time);
    std::ostringstream oss;

    if (logTimes) oss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    oss << "[pghstore] [" << getLogLevelString(level) << "] ";

    va_list valisttmp;
    va_copy(valisttmp, valist);
    const int buf_size = vsnprintf(nullptr, 0, str, valisttmp) + 1;
    va_end(valisttmp);

    if (buf_size > 0)
    {
        std::string buf(buf_size, '\0');
        va_list valist2;
        va_copy(valist2, valist);
        vsnprintf(&buf[0], buf_size, str, valist2);
        va_end(valist2);
        buf.resize(buf_size - 1);
        oss << buf;
    }

    std::lock_guard<std::mutex> locker(logMutex);
    writeLine(oss.str());
}

void pghstore::Logger::log(LogLevel level, const char *str, ...)
{
    va_list valist;
    va_start(valist, str);
    this->log(level, str, valist);
    va_end(valist);
}

/**
 * @brief Logger::logstream
 * @param level
 * @return a StreamToLog, that you're not suppose to name. When you don't, its destructor will log the stream.
 *
 * Allows logging like: logger->logstream(LOG_NOTICE) << "blabla: " << 1 << ".". The advantage is safety (printf crashes), and not forgetting printf arguments.
 */
pghstore::StreamToLog pghstore::Logger::logstream(LogLevel level)
{
    return StreamToLog(level);
}
