#ifndef PGHSTORE_ERROR_H
#define PGHSTORE_ERROR_H

#include <exception>
#include <string>

namespace pghstore
{

/**
 * Base of everything the hstore codec throws.
 */
class Error : public std::exception
{
    std::string _message;

public:
    Error(const std::string &msg);

    const char *what() const noexcept override;
};

/**
 * The text could not be decomposed into `key=>value` pairs at `position()`, and what remained
 * from there on was not just whitespace.
 */
class MalformedInput : public Error
{
    std::string::size_type _position;

public:
    MalformedInput(std::string::size_type position);

    std::string::size_type position() const;
};

/**
 * A key that is not a string was handed to the serializer without a `key_map` to convert it.
 */
class NonStringKey : public Error
{
    std::string _key_repr;

public:
    NonStringKey(const std::string &key_repr);

    const std::string &key_repr() const;
};

/**
 * A value that is neither a string nor null was handed to the serializer without a `value_map`.
 */
class NonStringValue : public Error
{
    std::string _key;
    std::string _value_repr;

public:
    NonStringValue(const std::string &key, const std::string &value_repr);

    const std::string &key() const;
    const std::string &value_repr() const;
};

/**
 * The caller passed something unusable: a sink or source stream in a failed state, or an encoding
 * name that the text codec does not know.
 */
class InvalidArgument : public Error
{
public:
    InvalidArgument(const std::string &msg);
};

class EncodingError : public Error
{
public:
    EncodingError(const std::string &msg);
};

class ConfigError : public Error
{
public:
    ConfigError(const std::string &msg);
};

}

#endif // PGHSTORE_ERROR_H
