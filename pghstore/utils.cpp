#include "utils.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <stdexcept>

std::string pghstore::formatString(const char *fmt, ...)
{
    va_list valist;

    va_start(valist, fmt);
    const int buf_size = vsnprintf(nullptr, 0, fmt, valist) + 1;
    va_end(valist);

    if (buf_size <= 0)
        throw std::runtime_error(std::string("Invalid format string: ") + fmt);

    std::string result(buf_size, '\0');

    va_start(valist, fmt);
    vsnprintf(&result[0], buf_size, fmt, valist);
    va_end(valist);

    result.resize(buf_size - 1);
    return result;
}

std::unordered_map<std::string, std::string> pghstore::environ_to_unordered_map(char **environ)
{
    std::unordered_map<std::string, std::string> map;

    for (int i = 0; environ[i]; i++)
    {
        const char* equalSign = strchr(environ[i], '=');
        if (equalSign == nullptr)
            throw std::runtime_error("`**environ` member strings are each expected to have an equals sign.");
        map[std::string(environ[i], equalSign - environ[i])] = std::string(equalSign+1);
    }

    return map;
}
