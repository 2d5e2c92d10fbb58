#include "pghstore_error.h"

#include "utils.h"

pghstore::Error::Error(const std::string &msg)
    : _message(msg)
{
}

const char *pghstore::Error::what() const noexcept
{
    return _message.data();
}

pghstore::MalformedInput::MalformedInput(std::string::size_type position)
    : Error(formatString("malformed hstore value: position %zu", position)),
      _position(position)
{
}

std::string::size_type pghstore::MalformedInput::position() const
{
    return _position;
}

pghstore::NonStringKey::NonStringKey(const std::string &key_repr)
    : Error("key " + key_repr + " is not a string"),
      _key_repr(key_repr)
{
}

const std::string &pghstore::NonStringKey::key_repr() const
{
    return _key_repr;
}

pghstore::NonStringValue::NonStringValue(const std::string &key, const std::string &value_repr)
    : Error("value " + value_repr + " of key '" + key + "' is not a string"),
      _key(key),
      _value_repr(value_repr)
{
}

const std::string &pghstore::NonStringValue::key() const
{
    return _key;
}

const std::string &pghstore::NonStringValue::value_repr() const
{
    return _value_repr;
}

pghstore::InvalidArgument::InvalidArgument(const std::string &msg)
    : Error(msg)
{
}

pghstore::EncodingError::EncodingError(const std::string &msg)
    : Error(msg)
{
}

pghstore::ConfigError::ConfigError(const std::string &msg)
    : Error(msg)
{
}
