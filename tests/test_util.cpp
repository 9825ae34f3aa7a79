/**
 * @file test_util.cpp
 * @brief Tests for single-level helpers
 */

#include <gtest/gtest.h>
#include "treedict/Util.hpp"
#include "treedict/Errors.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using namespace treedict;

// ============================================================================
// lookup
// ============================================================================

TEST(Lookup, FirstPresentKeyWins) {
    Value d = {{"b", 2}, {"c", 3}};
    EXPECT_EQ(lookup(d, {"a", "b", "c"}), 2);
    EXPECT_EQ(lookup(d, {"c", "b"}), 3);
}

TEST(Lookup, NullCountsAsPresent) {
    Value d = {{"a", nullptr}, {"b", 1}};
    EXPECT_TRUE(lookup(d, {"a", "b"}).is_null());
}

TEST(Lookup, NoneFoundRaisesKeyError) {
    Value d = {{"x", 1}};
    try {
        lookup(d, {"a", "b"});
        FAIL() << "Should have thrown KeyError";
    } catch (const KeyError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("'a'"), std::string::npos);
        EXPECT_NE(msg.find("'b'"), std::string::npos);
    }
}

TEST(Lookup, Default) {
    Value d = {{"x", 1}};
    EXPECT_EQ(lookup(d, {"a", "b"}, "fallback"), "fallback");
    EXPECT_EQ(lookup(d, {"a", "x"}, "fallback"), 1);
}

TEST(Lookup, DefaultReturnedByValue) {
    using Keys = std::vector<std::string>;
    static_assert(!std::is_reference<decltype(lookup(std::declval<const Value&>(), Keys{}, Value()))>::value,
                  "lookup() with a default must not return a reference");

    Value d = {{"x", 1}};
    const Value& missing = lookup(d, {"a", "b"}, Value("fallback-value"));
    const Value& found = lookup(d, {"a", "x"}, Value(0));

    EXPECT_EQ(missing.dump(), "\"fallback-value\"");
    EXPECT_EQ(found, 1);
}

TEST(Lookup, NonMappingRaisesTypeError) {
    Value d = {1, 2};
    EXPECT_THROW(lookup(d, {"a"}), TypeError);
}

// ============================================================================
// extract
// ============================================================================

TEST(Extract, SelectedKeysOnly) {
    Value d = {{"a", 1}, {"b", {{"n", 2}}}, {"c", 3}};
    EXPECT_EQ(extract(d, {"a", "b"}), (Value{{"a", 1}, {"b", {{"n", 2}}}}));
}

TEST(Extract, MissingKeyRaises) {
    Value d = {{"a", 1}};
    try {
        extract(d, {"a", "missing"});
        FAIL() << "Should have thrown KeyError";
    } catch (const KeyError& e) {
        EXPECT_EQ(e.segment(), "missing");
    }
}

TEST(Extract, SkipMissingKeys) {
    Value d = {{"a", 1}};
    EXPECT_EQ(extract(d, {"a", "missing"}, true), (Value{{"a", 1}}));
}

TEST(Extract, NoKeys) {
    Value d = {{"a", 1}};
    auto result = extract(d, {});
    EXPECT_TRUE(result.is_object());
    EXPECT_TRUE(result.empty());
}

TEST(Extract, OrderedFollowsKeyList) {
    OrderedValue d = {{"a", 1}, {"b", 2}};
    auto result = extract(d, {"b", "a"});
    EXPECT_EQ(result.begin().key(), "b");
}

// ============================================================================
// invert
// ============================================================================

TEST(Invert, StringValues) {
    Value d = {{"en", "hello"}, {"fr", "bonjour"}};
    EXPECT_EQ(invert(d), (Value{{"hello", "en"}, {"bonjour", "fr"}}));
}

TEST(Invert, NonStringValuesUseJsonText) {
    Value d = {{"one", 1}, {"yes", true}, {"none", nullptr}};
    EXPECT_EQ(invert(d), (Value{{"1", "one"}, {"true", "yes"}, {"null", "none"}}));
}

TEST(Invert, DuplicateValuesKeepLastKey) {
    OrderedValue d = {{"first", "x"}, {"second", "x"}};
    auto result = invert(d);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result["x"], "second");
}

TEST(Invert, NonMappingRaisesTypeError) {
    Value d = "text";
    EXPECT_THROW(invert(d), TypeError);
}

// ============================================================================
// parse_value
// ============================================================================

TEST(ParseValue, JsonScalars) {
    EXPECT_EQ(parse_value("42"), 42);
    EXPECT_EQ(parse_value("3.5"), 3.5);
    EXPECT_EQ(parse_value("true"), true);
    EXPECT_TRUE(parse_value("null").is_null());
    EXPECT_EQ(parse_value("\"quoted\""), "quoted");
}

TEST(ParseValue, JsonContainers) {
    EXPECT_EQ(parse_value("[1, 2]"), Value::array({1, 2}));
    EXPECT_EQ(parse_value("{\"a\": {\"b\": 1}}"), (Value{{"a", {{"b", 1}}}}));
}

TEST(ParseValue, FallsBackToString) {
    EXPECT_EQ(parse_value("localhost"), "localhost");
    EXPECT_EQ(parse_value("not json {"), "not json {");
    EXPECT_EQ(parse_value(""), "");
}

TEST(ParseValue, OrderedObject) {
    auto result = parse_value<OrderedValue>("{\"z\": 1, \"a\": 2}");
    EXPECT_EQ(result.begin().key(), "z");
}
