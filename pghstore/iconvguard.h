#ifndef PGHSTORE_ICONVGUARD_H
#define PGHSTORE_ICONVGUARD_H

#include <iconv.h>

#include <string>

namespace pghstore
{

/**
 * RAII wrapper for an `iconv_t` conversion descriptor.
 */
class IconvGuard
{
    iconv_t _cd;

public:
    /**
     * The constructor will throw an `InvalidArgument` when `iconv_open()` does not know one of
     * the encodings, and a `std::runtime_error` for any other `iconv_open()` failure.
     */
    IconvGuard(const std::string &tocode, const std::string &fromcode);
    IconvGuard(const IconvGuard &other) = delete;
    IconvGuard &operator=(const IconvGuard &other) = delete;
    ~IconvGuard();

    iconv_t cd() const;
};

}

#endif // PGHSTORE_ICONVGUARD_H
