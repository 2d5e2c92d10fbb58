#include "pghstore_serializer.h"

#include <optional>

#include "logger.h"
#include "pghstore_error.h"
#include "pghstore_escape.h"

pghstore::Serializer::Serializer(std::ostream &sink, const DumpOptions &options)
    : sink(sink),
      options(options),
      codec(options.encoding)
{
    if (not sink.good())
        throw InvalidArgument("the hstore sink must be a stream that can be written to");
}

void pghstore::Serializer::write(const Datum &key, const Datum &value)
{
    std::string key_text;
    if (is_string(key))
        key_text = std::get<std::string>(key);
    else if (options.key_map)
        key_text = options.key_map(key);
    else
        throw NonStringKey(repr(key));

    std::optional<std::string> value_text;
    if (is_string(value))
        value_text = std::get<std::string>(value);
    else if (is_null(value))
        value_text.reset();
    else if (options.value_map)
        value_text = options.value_map(value);
    else
        throw NonStringValue(key_text, repr(value));

    const std::string quoted_key = double_quote(codec.encode(key_text));
    const std::string quoted_value = value_text ? double_quote(codec.encode(value_text.value())) : "NULL";

    if (count > 0)
        sink << ',';
    sink << quoted_key << "=>" << quoted_value;

    if (sink.fail())
        throw Error("writing to the hstore sink failed");

    ++count;

    Logger *logger = Logger::getInstance();
    if (logger->wouldLog(LOG_DEBUG5))
        logger->log(LOG_DEBUG5, "Wrote hstore pair #%zu with key '%s'", count, key_text.c_str());
}

void pghstore::Serializer::write(const Pair &pair)
{
    write(make_datum(pair.first), make_datum(pair.second));
}

std::size_t pghstore::Serializer::pairs_written() const
{
    return count;
}
