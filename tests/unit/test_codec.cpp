#include <gtest/gtest.h>
#include "pghstore/pghstore_codec.h"
#include "pghstore/pghstore_error.h"

#include <string>

using namespace pghstore;
using namespace std::string_literals;

TEST(CodecTest, Utf8SpellingsAreIdentity) {
    EXPECT_TRUE(is_utf8_encoding_name("UTF-8"));
    EXPECT_TRUE(is_utf8_encoding_name("utf-8"));
    EXPECT_TRUE(is_utf8_encoding_name("utf8"));
    EXPECT_TRUE(is_utf8_encoding_name("Utf_8"));
    EXPECT_FALSE(is_utf8_encoding_name("UTF-16"));
    EXPECT_FALSE(is_utf8_encoding_name(""));

    TextCodec codec("utf8");
    EXPECT_TRUE(codec.is_identity());
    EXPECT_EQ(codec.encode("\xed\x99\x8d"), "\xed\x99\x8d");
    EXPECT_EQ(codec.decode("\xff not even utf-8"), "\xff not even utf-8");
}

TEST(CodecTest, DefaultIsUtf8) {
    TextCodec codec;
    EXPECT_TRUE(codec.is_identity());
    EXPECT_EQ(codec.encoding(), "UTF-8");
}

TEST(CodecTest, Utf16RoundTrip) {
    TextCodec codec("UTF-16LE");
    EXPECT_FALSE(codec.is_identity());

    const std::string encoded = codec.encode("s\xed\x99\x8d");
    EXPECT_EQ(encoded, "s\0\x4d\xd6"s);
    EXPECT_EQ(codec.decode(encoded), "s\xed\x99\x8d");
}

TEST(CodecTest, CodecIsReusable) {
    TextCodec codec("ISO-8859-1");
    EXPECT_EQ(codec.decode("caf\xe9"), "caf\xc3\xa9");
    EXPECT_EQ(codec.decode("\xe9t\xe9"), "\xc3\xa9t\xc3\xa9");
    EXPECT_EQ(codec.encode("caf\xc3\xa9"), "caf\xe9");
}

TEST(CodecTest, CopiesShareTheConversion) {
    TextCodec original("ISO-8859-1");
    TextCodec copy(original);
    EXPECT_EQ(copy.encoding(), "ISO-8859-1");
    EXPECT_EQ(copy.decode("\xe9"), "\xc3\xa9");
}

TEST(CodecTest, UnknownEncoding) {
    EXPECT_THROW(TextCodec("NO-SUCH-ENCODING"), InvalidArgument);
    EXPECT_THROW(TextCodec(""), InvalidArgument);
}

TEST(CodecTest, InvalidInput) {
    TextCodec codec("UTF-16LE");
    EXPECT_THROW(codec.decode("\x41"), EncodingError);
    EXPECT_THROW(codec.encode("\xc3"), EncodingError);
}
