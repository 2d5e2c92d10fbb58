#include "iconvguard.h"

#include <errno.h>
#include <string.h>

#include <stdexcept>

#include "pghstore_error.h"

pghstore::IconvGuard::IconvGuard(const std::string &tocode, const std::string &fromcode)
    : _cd(iconv_open(tocode.c_str(), fromcode.c_str()))
{
    if (_cd == reinterpret_cast<iconv_t>(-1))
    {
        if (errno == EINVAL)
            throw InvalidArgument("unsupported encoding conversion from " + fromcode + " to " + tocode);
        throw std::runtime_error(strerror(errno));
    }
}

pghstore::IconvGuard::~IconvGuard()
{
    iconv_close(_cd);
}

iconv_t pghstore::IconvGuard::cd() const
{
    return _cd;
}
