#ifndef PGHSTORE_H
#define PGHSTORE_H

#include <istream>
#include <iterator>
#include <list>
#include <map>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "logger.h"
#include "pghstore_datum.h"
#include "pghstore_error.h"
#include "pghstore_escape.h"
#include "pghstore_parser.h"
#include "pghstore_serializer.h"

/**
 * Reading and writing PostgreSQL `hstore` text.
 *
 *   - `dump()` / `dumps()` accept anything that can be iterated over as key/value tuples: a
 *     `std::map`, a `std::unordered_map`, a `std::vector<std::pair<…>>` or a `Document`. The pairs
 *     are written in the container's own iteration order.
 *   - `parse()` yields the pairs lazily, `load()` / `loads()` collect them into a container.
 */
namespace pghstore
{

using HstoreMap = std::unordered_map<std::string, std::optional<std::string>>;

/**
 * Write every key/value tuple of `items` to `sink`.
 */
template<typename Items>
void dump(const Items &items, std::ostream &sink, const DumpOptions &options = DumpOptions())
{
    Serializer serializer(sink, options);

    for (const auto &item : items)
        serializer.write(make_datum(std::get<0>(item)), make_datum(std::get<1>(item)));

    Logger::getInstance()->log(LOG_DEBUG3, "Dumped %zu hstore pairs", serializer.pairs_written());
}

/**
 * Like `dump()`, but returns the hstore text instead of writing it to a stream.
 */
template<typename Items>
std::string dumps(const Items &items, const DumpOptions &options = DumpOptions())
{
    std::ostringstream out;
    dump(items, out, options);
    return out.str();
}

template<typename Hash, typename KeyEqual, typename Alloc>
inline void insert_pair(std::unordered_map<std::string, std::optional<std::string>, Hash, KeyEqual, Alloc> &map, Pair &&pair)
{
    map[pair.first] = std::move(pair.second);
}

template<typename Compare, typename Alloc>
inline void insert_pair(std::map<std::string, std::optional<std::string>, Compare, Alloc> &map, Pair &&pair)
{
    map[pair.first] = std::move(pair.second);
}

template<typename Alloc>
inline void insert_pair(std::vector<Pair, Alloc> &sequence, Pair &&pair)
{
    sequence.push_back(std::move(pair));
}

template<typename Alloc>
inline void insert_pair(std::list<Pair, Alloc> &sequence, Pair &&pair)
{
    sequence.push_back(std::move(pair));
}

/**
 * Parse `text` into a `ReturnType`.
 *
 * With a map type, a key that occurs more than once keeps its last value. With `Document` (or any
 * other `std::vector<Pair>` or `std::list<Pair>`), every pair is kept, in order.
 */
template<typename ReturnType = HstoreMap>
ReturnType loads(const std::string &text, const std::string &encoding = "UTF-8")
{
    ReturnType result;

    for (const Pair &pair : parse(text, encoding))
        insert_pair(result, Pair(pair));

    return result;
}

/**
 * Read all of `source`, then `loads()` it.
 */
template<typename ReturnType = HstoreMap>
ReturnType load(std::istream &source, const std::string &encoding = "UTF-8")
{
    if (not source.good())
        throw InvalidArgument("the hstore source must be a stream that can be read from");

    const std::string text((std::istreambuf_iterator<char>(source)), std::istreambuf_iterator<char>());

    if (source.bad())
        throw Error("reading from the hstore source failed");

    return loads<ReturnType>(text, encoding);
}

}

#endif // PGHSTORE_H
