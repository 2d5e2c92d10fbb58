#ifndef PGHSTORE_UTILS_H
#define PGHSTORE_UTILS_H

#include <string>
#include <unordered_map>

namespace pghstore
{

std::string formatString(const char *fmt, ...);

std::unordered_map<std::string, std::string> environ_to_unordered_map(char **environ);

/**
 * ASCII whitespace, as matched by `\s` on a byte string: space, `\t`, `\n`, `\v`, `\f` and `\r`.
 */
inline bool is_space(char c)
{
    return c == ' ' or (c >= '\t' and c <= '\r');
}

}

#endif // PGHSTORE_UTILS_H
