#ifndef PGHSTORE_CODEC_H
#define PGHSTORE_CODEC_H

#include <memory>
#include <string>

#include "iconvguard.h"

namespace pghstore
{

/**
 * Converts between the UTF-8 strings the codec works with and the bytes of a named encoding.
 *
 * UTF-8 itself (however it is spelled: `utf-8`, `UTF8`, `utf_8`) is passed through untouched.
 * Any other name is handed to `iconv_open()`, so that the constructor fails early, with an
 * `InvalidArgument`, when the name is unknown.
 */
class TextCodec
{
    std::string _encoding;
    std::shared_ptr<IconvGuard> encoder;
    std::shared_ptr<IconvGuard> decoder;

public:
    TextCodec();
    TextCodec(const std::string &encoding);

    const std::string &encoding() const;
    bool is_identity() const;

    /**
     * UTF-8 text to bytes in `encoding()`. Throws `EncodingError` on unconvertible input.
     */
    std::string encode(const std::string &text) const;

    /**
     * Bytes in `encoding()` to UTF-8 text. Throws `EncodingError` on invalid or truncated input.
     */
    std::string decode(const std::string &bytes) const;
};

bool is_utf8_encoding_name(const std::string &encoding);

}

#endif // PGHSTORE_CODEC_H
