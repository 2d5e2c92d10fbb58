#include <gtest/gtest.h>
#include "pghstore/pghstore.h"

#include <list>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <vector>

using namespace pghstore;

TEST(ApiTest, DumpsStringViews) {
    std::map<std::string_view, std::string_view> m = {{"a", "1"}, {"b", "say \"hi\""}};
    EXPECT_EQ(dumps(m), R"("a"=>"1","b"=>"say \"hi\"")");
}

TEST(ApiTest, DumpsMapping) {
    std::map<std::string, std::string> m = {{"a", "1 \"quotes\""}};
    EXPECT_EQ(dumps(m), R"("a"=>"1 \"quotes\"")");
}

TEST(ApiTest, DumpsSequenceInGivenOrder) {
    std::vector<std::pair<std::string, std::string>> items = {{"key", "value"}, {"k", "v"}};
    EXPECT_EQ(dumps(items), R"("key"=>"value","k"=>"v")");
}

TEST(ApiTest, DumpsNull) {
    HstoreMap m = {{"null", std::nullopt}};
    EXPECT_EQ(dumps(m), R"("null"=>NULL)");
}

TEST(ApiTest, DumpsTuplesAndCStrings) {
    std::vector<std::tuple<const char *, const char *>> items = {
        std::make_tuple("a", "1"),
        std::make_tuple("b", nullptr),
    };
    EXPECT_EQ(dumps(items), R"("a"=>"1","b"=>NULL)");
}

TEST(ApiTest, DumpsNonStringValues) {
    std::vector<std::pair<std::string, int>> items = {{"a", 1}, {"b", 2}};

    try {
        dumps(items);
        FAIL() << "expected NonStringValue";
    } catch (const NonStringValue &err) {
        EXPECT_STREQ(err.what(), "value 1 of key 'a' is not a string");
    }

    DumpOptions options;
    options.value_map = [](const Datum &value) { return repr(value); };
    EXPECT_EQ(dumps(items, options), R"("a"=>"1","b"=>"2")");
}

TEST(ApiTest, DumpsNonStringKeys) {
    std::map<int, std::string> m = {{1, "one"}, {2, "two"}};
    EXPECT_THROW(dumps(m), NonStringKey);

    DumpOptions options;
    options.key_map = [](const Datum &key) { return "#" + repr(key); };
    EXPECT_EQ(dumps(m, options), R"("#1"=>"one","#2"=>"two")");
}

TEST(ApiTest, DumpToStream) {
    std::ostringstream out;
    dump(HstoreMap{{"a", "1"}}, out);
    EXPECT_EQ(out.str(), R"("a"=>"1")");
}

TEST(ApiTest, DumpToFailedStream) {
    std::ostringstream out;
    out.setstate(std::ios::failbit);
    EXPECT_THROW(dump(HstoreMap{{"a", "1"}}, out), InvalidArgument);
}

TEST(ApiTest, LoadsIntoMap) {
    HstoreMap m = loads("a=>1");
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m.at("a"), "1");
}

TEST(ApiTest, LoadsKeepsLastDuplicateInMaps) {
    HstoreMap m = loads("a=>1, a=>2");
    EXPECT_EQ(m.at("a"), "2");

    auto ordered = loads<std::map<std::string, std::optional<std::string>>>("b=>NULL, a=>1, b=>2");
    ASSERT_EQ(ordered.size(), 2u);
    EXPECT_EQ(ordered.at("b"), "2");
}

TEST(ApiTest, LoadsIntoDocument) {
    Document expected = {{"a", "1"}, {"b", "2"}, {"a", std::nullopt}};
    EXPECT_EQ(loads<Document>("a=>1, b=>2, a=>NULL"), expected);

    std::list<Pair> pairs = loads<std::list<Pair>>("a=>1, b=>2, a=>NULL");
    EXPECT_EQ(Document(pairs.begin(), pairs.end()), expected);
}

TEST(ApiTest, LoadFromStream) {
    std::istringstream in(R"("return_type"=>"tuple")");
    Document expected = {{"return_type", "tuple"}};
    EXPECT_EQ(load<Document>(in), expected);
}

TEST(ApiTest, LoadFromFailedStream) {
    std::istringstream in("a=>1");
    in.setstate(std::ios::badbit);
    EXPECT_THROW(load(in), InvalidArgument);
}

TEST(ApiTest, LoadsMalformed) {
    EXPECT_THROW(loads("a=>1, garbage"), MalformedInput);
}

TEST(ApiTest, RoundTrip) {
    Document document = {
        {"plain", "value"},
        {"quote\"d", "back\\slash"},
        {"a=>1", "\"b\"=>2"},
        {"comma,key", "comma,value"},
        {"", ""},
        {"null", std::nullopt},
        {"NULL string", "NULL"},
        {" spaced ", "  "},
        {"\xed\x99\x8d", "caf\xc3\xa9"},
        {"plain", "duplicate"},
    };

    EXPECT_EQ(loads<Document>(dumps(document)), document);
}

TEST(ApiTest, NullAndNullStringStayDistinct) {
    const std::string sentinel = dumps(Document{{"k", std::nullopt}});
    EXPECT_EQ(sentinel, R"("k"=>NULL)");
    EXPECT_EQ(loads<Document>(sentinel), (Document{{"k", std::nullopt}}));

    const std::string text = dumps(Document{{"k", "NULL"}});
    EXPECT_EQ(text, R"("k"=>"NULL")");
    EXPECT_EQ(loads<Document>(text), (Document{{"k", "NULL"}}));
}

TEST(ApiTest, RoundTripThroughOtherEncoding) {
    Document document = {{"caf\xc3\xa9", "cr\xc3\xa8me \"br\xc3\xbbl\xc3\xa9\""}, {"x", std::nullopt}};

    DumpOptions options;
    options.encoding = "ISO-8859-1";
    const std::string latin1 = dumps(document, options);

    EXPECT_EQ(latin1.find("\xc3"), std::string::npos);
    EXPECT_EQ(loads<Document>(latin1, "ISO-8859-1"), document);
}
