#ifndef PGHSTORE_ESCAPE_H
#define PGHSTORE_ESCAPE_H

#include <string>

namespace pghstore
{

/**
 * Backslash-escape every `\` and `"`, so that the result can be put between double quotes.
 */
std::string escape(const std::string &raw);

/**
 * Drop the backslash from every `\X` sequence, whatever `X` is: `\a` becomes `a`, `\\` becomes `\`.
 * A lone backslash at the very end is kept.
 */
std::string unescape(const std::string &escaped);

/**
 * `escape()` the string and wrap it in double quotes.
 */
std::string double_quote(const std::string &unquoted);

}

#endif // PGHSTORE_ESCAPE_H
