#ifndef PGHSTORE_DATUM_H
#define PGHSTORE_DATUM_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace pghstore
{

/**
 * A key or value as handed to the serializer. `std::monostate` stands for SQL `NULL`.
 *
 * Only strings (and, for values, `NULL`) can be written as they are; everything else needs a
 * `key_map` or `value_map` to turn it into a string first.
 */
using Datum = std::variant<std::monostate, std::string, bool, int64_t, double>;

inline bool is_null(const Datum &datum)
{
    return std::holds_alternative<std::monostate>(datum);
}

inline bool is_string(const Datum &datum)
{
    return std::holds_alternative<std::string>(datum);
}

/**
 * Python-ish rendering for diagnostics: strings in single quotes, `NULL` for null, numbers and
 * booleans as they would be printed.
 */
std::string repr(const Datum &datum);

inline Datum make_datum(const Datum &datum) { return datum; }
inline Datum make_datum(const std::string &s) { return s; }
inline Datum make_datum(std::string_view s) { return std::string(s); }
inline Datum make_datum(std::nullptr_t) { return std::monostate(); }
inline Datum make_datum(std::nullopt_t) { return std::monostate(); }
inline Datum make_datum(bool b) { return b; }

/**
 * A null `c_str` becomes `NULL`.
 */
inline Datum make_datum(const char *c_str)
{
    if (c_str == nullptr)
        return std::monostate();
    return std::string(c_str);
}

template<typename T>
inline typename std::enable_if<std::is_integral<T>::value, Datum>::type
make_datum(T i)
{
    return static_cast<int64_t>(i);
}

template<typename T>
inline typename std::enable_if<std::is_floating_point<T>::value, Datum>::type
make_datum(T d)
{
    return static_cast<double>(d);
}

template<typename T>
inline Datum make_datum(const std::optional<T> &nullable)
{
    if (not nullable.has_value())
        return std::monostate();
    return make_datum(nullable.value());
}

}

#endif // PGHSTORE_DATUM_H
