#ifndef PGHSTORE_SERIALIZER_H
#define PGHSTORE_SERIALIZER_H

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

#include "pghstore_codec.h"
#include "pghstore_datum.h"
#include "pghstore_parser.h"

namespace pghstore
{

/**
 * Turns a key that is not a string into one. Without it, such keys are a `NonStringKey` error.
 */
using KeyMap = std::function<std::string(const Datum &)>;

/**
 * Turns a value that is neither a string nor null into a string (`std::to_string`, a JSON encoder, ...).
 * Without it, such values are a `NonStringValue` error.
 */
using ValueMap = std::function<std::string(const Datum &)>;

struct DumpOptions
{
    KeyMap key_map;
    ValueMap value_map;

    /**
     * Encoding that keys and values are converted to before they are escaped. Quotes, `=>`,
     * commas and `NULL` are always written as single ASCII bytes.
     */
    std::string encoding = "UTF-8";
};

/**
 * Writes pairs to `sink` in the canonical `"key"=>"value"` form, comma separated, with a bare
 * `NULL` for null values.
 *
 * A `sink` that is not `good()` or an unknown encoding is rejected by the constructor, before
 * anything has been written.
 */
class Serializer
{
    std::ostream &sink;
    DumpOptions options;
    TextCodec codec;
    std::size_t count = 0;

public:
    Serializer(std::ostream &sink, const DumpOptions &options = DumpOptions());
    Serializer(const Serializer &other) = delete;
    Serializer &operator=(const Serializer &other) = delete;

    void write(const Datum &key, const Datum &value);
    void write(const Pair &pair);

    std::size_t pairs_written() const;
};

}

#endif // PGHSTORE_SERIALIZER_H
