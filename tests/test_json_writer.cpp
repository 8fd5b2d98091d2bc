// ---------------------------------------------------------------------------
// test_json_writer.cpp
//
// JsonWriter / escape_json_string 단위 테스트.
// ---------------------------------------------------------------------------

#include "common/json_writer.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

TEST(JsonEscape, SpecialCharacters) {
    EXPECT_EQ(escape_json_string(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(escape_json_string("a\\b"), "a\\\\b");
    EXPECT_EQ(escape_json_string("line1\nline2\ttab\r"), "line1\\nline2\\ttab\\r");
    EXPECT_EQ(escape_json_string(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(escape_json_string("plain"), "plain");
}

TEST(JsonEscape, Utf8PassesThrough) {
    EXPECT_EQ(escape_json_string("테이블"), "테이블");
}

TEST(JsonWriter, Compact) {
    JsonWriter w;
    w.begin_object()
        .key("name").value("migsafe")
        .key("count").value(std::int64_t{3})
        .key("missing").null_value()
        .key("items").begin_array().value("a").value("b").end_array()
        .end_object();

    EXPECT_EQ(w.str(), R"({"name":"migsafe","count":3,"missing":null,"items":["a","b"]})");
}

TEST(JsonWriter, Indented) {
    JsonWriter w(2);
    w.begin_object()
        .key("a").value(std::int64_t{1})
        .key("list").begin_array()
            .begin_object().key("b").value("x").end_object()
        .end_array()
        .end_object();

    const std::string expected =
        "{\n"
        "  \"a\": 1,\n"
        "  \"list\": [\n"
        "    {\n"
        "      \"b\": \"x\"\n"
        "    }\n"
        "  ]\n"
        "}";
    EXPECT_EQ(w.str(), expected);
}

TEST(JsonWriter, EmptyContainers) {
    JsonWriter w(2);
    w.begin_object().key("o").begin_object().end_object().key("l").begin_array().end_array()
        .end_object();

    EXPECT_EQ(w.str(), "{\n  \"o\": {},\n  \"l\": []\n}");
}

TEST(JsonWriter, BoolValue) {
    JsonWriter w;
    w.begin_object().key("ok").bool_value(true).key("failed").bool_value(false).end_object();
    EXPECT_EQ(w.str(), R"({"ok":true,"failed":false})");
}

TEST(JsonWriter, ValueOrNull) {
    JsonWriter w;
    w.begin_array()
        .value_or_null(std::optional<std::int64_t>{42})
        .value_or_null(std::nullopt)
        .end_array();
    EXPECT_EQ(w.str(), "[42,null]");
}

TEST(JsonWriter, EscapesKeysAndValues) {
    JsonWriter w;
    w.begin_object().key("pa\"th").value("C:\\dir\\x.sql").end_object();
    EXPECT_EQ(w.str(), R"({"pa\"th":"C:\\dir\\x.sql"})");
}
