/**
 * @file test_json_utils.cpp
 * @brief Unit tests for the JSON reader used by the store and HTTP backend
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/core/json_utils.h>

#include <string>

namespace kcenon::resumable_upload::test {

class JsonUtilsTest : public ::testing::Test {};

TEST_F(JsonUtilsTest, Escape_SpecialCharacters) {
    EXPECT_EQ(json::escape("plain"), "plain");
    EXPECT_EQ(json::escape("a\"b"), "a\\\"b");
    EXPECT_EQ(json::escape("c:\\dir"), "c:\\\\dir");
    EXPECT_EQ(json::escape("line\nnext\t"), "line\\nnext\\t");
    EXPECT_EQ(json::escape(std::string(1, '\x01')), "\\u0001");
    EXPECT_EQ(json::quote("x"), "\"x\"");
}

TEST_F(JsonUtilsTest, Parse_Object) {
    auto parsed = json::parse(R"({"uploadId":"u-1","chunkSize":5242880,"ok":true,"none":null})");
    ASSERT_TRUE(parsed.has_value());

    const auto& doc = parsed.value();
    EXPECT_TRUE(doc.is_object());
    EXPECT_EQ(doc.get_string("uploadId"), "u-1");
    EXPECT_EQ(doc.get_int64("chunkSize"), 5242880);
    ASSERT_NE(doc.find("ok"), nullptr);
    EXPECT_EQ(doc.find("ok")->as_bool(), true);
    ASSERT_NE(doc.find("none"), nullptr);
    EXPECT_TRUE(doc.find("none")->is_null());
    EXPECT_EQ(doc.find("missing"), nullptr);
    EXPECT_FALSE(doc.get_string("chunkSize").has_value());
}

TEST_F(JsonUtilsTest, Parse_ArrayOfObjects) {
    auto parsed = json::parse(R"({"parts":[{"partNumber":1,"etag":"a"},{"partNumber":2,"etag":"b"}]})");
    ASSERT_TRUE(parsed.has_value());

    const auto* parts = parsed.value().find("parts");
    ASSERT_NE(parts, nullptr);
    ASSERT_TRUE(parts->is_array());
    ASSERT_EQ(parts->items().size(), 2u);
    EXPECT_EQ(parts->items()[1].get_int64("partNumber"), 2);
    EXPECT_EQ(parts->items()[1].get_string("etag"), "b");
}

TEST_F(JsonUtilsTest, Parse_LargeIntegerStaysExact) {
    auto parsed = json::parse(R"({"size":9007199254740993})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().get_int64("size"), 9007199254740993LL);
}

TEST_F(JsonUtilsTest, Parse_NumericStringAsInteger) {
    auto parsed = json::parse(R"({"size":"1024","name":"clip"})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().get_int64("size"), 1024);
    EXPECT_FALSE(parsed.value().get_int64("name").has_value());
}

TEST_F(JsonUtilsTest, Parse_DoubleValue) {
    auto parsed = json::parse("[1.5, -2]");
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed.value().items().size(), 2u);
    EXPECT_DOUBLE_EQ(*parsed.value().items()[0].as_double(), 1.5);
    EXPECT_EQ(parsed.value().items()[1].as_int64(), -2);
}

TEST_F(JsonUtilsTest, Parse_StringEscapes) {
    auto parsed = json::parse(R"({"etag":"\"abc\"","path":"a\/b","euro":"\u20ac"})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().get_string("etag"), "\"abc\"");
    EXPECT_EQ(parsed.value().get_string("path"), "a/b");
    EXPECT_EQ(parsed.value().get_string("euro"), "\xE2\x82\xAC");
}

TEST_F(JsonUtilsTest, Parse_EscapedTextRoundTrips) {
    std::string original = "name \"with\" quotes\\ and\nnewline";
    auto parsed = json::parse("{\"v\":" + json::quote(original) + "}");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().get_string("v"), original);
}

TEST_F(JsonUtilsTest, Parse_MalformedInput) {
    for (const char* text : {"", "{", "{\"a\" 1}", "{\"a\":1,}", "[1 2]", "tru",
                             "{\"a\":\"unterminated}", "{\"a\":1} extra", "\"\\x\""}) {
        auto parsed = json::parse(text);
        ASSERT_FALSE(parsed.has_value()) << text;
        EXPECT_EQ(parsed.error().code, error_code::invalid_response) << text;
    }
}

TEST_F(JsonUtilsTest, Parse_NestingLimit) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    auto parsed = json::parse(deep);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_response);

    auto shallow = json::parse("[[[[]]]]");
    EXPECT_TRUE(shallow.has_value());
}

}  // namespace kcenon::resumable_upload::test
