#include "pghstore_codec.h"

#include <errno.h>
#include <string.h>

#include <cctype>
#include <stdexcept>

#include "logger.h"
#include "pghstore_error.h"
#include "utils.h"

namespace
{

const char UTF8[] = "UTF-8";

std::string convert(iconv_t cd, const std::string &input, const std::string &fromcode, const std::string &tocode)
{
    // Start from the initial shift state; the descriptor is reused across calls.
    iconv(cd, nullptr, nullptr, nullptr, nullptr);

    std::string output;
    output.reserve(input.size());

    char *inbuf = const_cast<char *>(input.data());
    size_t inleft = input.size();
    char buf[4096];

    while (inleft > 0)
    {
        char *outbuf = buf;
        size_t outleft = sizeof(buf);
        const size_t rc = iconv(cd, &inbuf, &inleft, &outbuf, &outleft);
        output.append(buf, outbuf - buf);

        if (rc != static_cast<size_t>(-1))
            continue;

        const size_t position = input.size() - inleft;
        if (errno == E2BIG)
            continue;
        if (errno == EILSEQ)
            throw pghstore::EncodingError(pghstore::formatString(
                "cannot convert %s to %s: invalid byte sequence at position %zu", fromcode.c_str(), tocode.c_str(), position));
        if (errno == EINVAL)
            throw pghstore::EncodingError(pghstore::formatString(
                "cannot convert %s to %s: incomplete byte sequence at position %zu", fromcode.c_str(), tocode.c_str(), position));
        throw std::runtime_error(strerror(errno));
    }

    char *outbuf = buf;
    size_t outleft = sizeof(buf);
    if (iconv(cd, nullptr, nullptr, &outbuf, &outleft) == static_cast<size_t>(-1))
        throw std::runtime_error(strerror(errno));
    output.append(buf, outbuf - buf);

    return output;
}

}

bool pghstore::is_utf8_encoding_name(const std::string &encoding)
{
    std::string normalized;
    for (char c : encoding)
    {
        if (c == '-' or c == '_')
            continue;
        normalized.push_back(std::toupper(static_cast<unsigned char>(c)));
    }
    return normalized == "UTF8";
}

pghstore::TextCodec::TextCodec()
    : _encoding(UTF8)
{
}

pghstore::TextCodec::TextCodec(const std::string &encoding)
    : _encoding(encoding)
{
    if (is_utf8_encoding_name(encoding))
        return;

    if (encoding.empty())
        throw InvalidArgument("encoding name must not be empty");

    encoder = std::make_shared<IconvGuard>(encoding, UTF8);
    decoder = std::make_shared<IconvGuard>(UTF8, encoding);

    Logger::getInstance()->log(LOG_DEBUG1, "Converting hstore fields between UTF-8 and %s", encoding.c_str());
}

const std::string &pghstore::TextCodec::encoding() const
{
    return _encoding;
}

bool pghstore::TextCodec::is_identity() const
{
    return not encoder;
}

std::string pghstore::TextCodec::encode(const std::string &text) const
{
    if (is_identity())
        return text;
    return convert(encoder->cd(), text, UTF8, _encoding);
}

std::string pghstore::TextCodec::decode(const std::string &bytes) const
{
    if (is_identity())
        return bytes;
    return convert(decoder->cd(), bytes, _encoding, UTF8);
}
