#include "pghstore_datum.h"

#include <sstream>

std::string pghstore::repr(const Datum &datum)
{
    if (is_null(datum))
        return "NULL";

    std::ostringstream oss;
    if (const std::string *s = std::get_if<std::string>(&datum))
        oss << "'" << *s << "'";
    else if (const bool *b = std::get_if<bool>(&datum))
        oss << (*b ? "true" : "false");
    else if (const int64_t *i = std::get_if<int64_t>(&datum))
        oss << *i;
    else
        oss << std::get<double>(datum);

    return oss.str();
}
