#include "pghstore_escape.h"

#include <regex>

std::string pghstore::escape(const std::string &raw)
{
    static const std::regex re("\"|\\\\");

    return std::regex_replace(raw, re, "\\$&");
}

std::string pghstore::unescape(const std::string &escaped)
{
    std::string unescaped;
    unescaped.reserve(escaped.size());

    for (std::string::size_type i = 0; i < escaped.size(); ++i)
    {
        if (escaped[i] == '\\' and i + 1 < escaped.size())
            ++i;

        unescaped.push_back(escaped[i]);
    }

    return unescaped;
}

std::string pghstore::double_quote(const std::string &unquoted)
{
    return std::string("\"") + escape(unquoted) + "\"";
}
