/**
 * @file test_items.cpp
 * @brief Tests for leaf enumeration and the copy/update/build helpers
 */

#include <gtest/gtest.h>
#include "treedict/Tree.hpp"
#include "treedict/Combine.hpp"
#include "treedict/Errors.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using namespace treedict;

namespace {

class ItemsTest : public ::testing::Test {
protected:
    Value data = {
        {"a", {{"b", 1}, {"c", {{"d", 2}}}}},
        {"e", 3},
        {"f", Value::array({1, 2})}
    };
};

// True when items() can be called on an argument of type T
template <typename T, typename = void>
struct accepts_items : std::false_type {};

template <typename T>
struct accepts_items<T, std::void_t<decltype(items(std::declval<T>()))>> : std::true_type {};

std::vector<Path> paths_of(const Value& d, Depth depth = unbounded) {
    std::vector<Path> out;
    for (const auto& item : items(d, depth)) {
        out.push_back(item.path);
    }
    return out;
}

} // namespace

// ============================================================================
// items()
// ============================================================================

TEST_F(ItemsTest, DepthFirstInKeyOrder) {
    std::vector<Path> expected = {
        {"a", "b"},
        {"a", "c", "d"},
        {"e"},
        {"f"},
    };
    EXPECT_EQ(paths_of(data), expected);
}

TEST_F(ItemsTest, ValuesMatchPaths) {
    for (const auto& item : items(data)) {
        EXPECT_EQ(item.value, get(data, item.path));
        EXPECT_FALSE(item.value.is_object());
    }
}

TEST_F(ItemsTest, ArraysAreLeaves) {
    auto all = collect_items(data);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[3].path, Path{"f"});
    EXPECT_EQ(all[3].value, Value::array({1, 2}));
}

TEST_F(ItemsTest, DepthCutoffYieldsSubMappingWhole) {
    auto top = collect_items(data, 1);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].path, Path{"a"});
    EXPECT_EQ(top[0].value, data["a"]);

    auto two = collect_items(data, 2);
    ASSERT_EQ(two.size(), 4u);
    EXPECT_EQ(two[1].path, (Path{"a", "c"}));
    EXPECT_EQ(two[1].value, (Value{{"d", 2}}));
}

TEST_F(ItemsTest, DepthZeroMatchesDepthOne) {
    EXPECT_EQ(paths_of(data, 0), paths_of(data, 1));
}

TEST_F(ItemsTest, RangeCanBeIteratedTwice) {
    auto range = items(data);
    size_t first = 0;
    size_t second = 0;
    for (auto it = range.begin(); it != range.end(); ++it) ++first;
    for (auto it = range.begin(); it != range.end(); ++it) ++second;
    EXPECT_EQ(first, 4u);
    EXPECT_EQ(first, second);
}

TEST(Items, EmptyRootYieldsNothing) {
    Value d = Value::object();
    auto range = items(d);
    EXPECT_TRUE(range.begin() == range.end());
}

TEST(Items, EmptySubMappingsYieldNothing) {
    Value d = {{"empty", Value::object()}, {"n", {{"inner", Value::object()}}}, {"x", 1}};
    EXPECT_EQ(paths_of(d), (std::vector<Path>{{"x"}}));
}

TEST(Items, EmptySubMappingAtCutoffIsLeaf) {
    Value d = {{"empty", Value::object()}};
    auto all = collect_items(d, 1);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].value.is_object());
    EXPECT_TRUE(all[0].value.empty());
}

TEST(Items, RejectsTemporaryRoot) {
    static_assert(accepts_items<const Value&>::value, "lvalue roots are accepted");
    static_assert(accepts_items<Value&>::value, "lvalue roots are accepted");
    static_assert(!accepts_items<Value>::value, "temporary roots are rejected");
    static_assert(!accepts_items<const OrderedValue>::value, "temporary roots are rejected");
}

TEST(Items, CollectItemsOfComputedMapping) {
    Value a = {{"n", {{"p", 1}}}, {"same", 2}};
    Value b = {{"n", {{"p", 3}}}, {"same", 2}};

    auto listed = collect_items(diff(a, b));

    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].path, (Path{"n", "p"}));
    EXPECT_EQ(listed[0].value, Value::array({1, 3}));
}

TEST(Items, NonMappingRootRaisesTypeError) {
    Value scalar = 1;
    Value array = {1, 2};
    EXPECT_THROW(items(scalar), TypeError);
    EXPECT_THROW(collect_items(array), TypeError);
}

TEST(Items, DeepChainDoesNotRecurse) {
    const size_t levels = 5000;
    Value d = Value::object();
    Value* current = &d;
    for (size_t i = 0; i < levels; ++i) {
        current = &((*current)["k"] = Value::object());
    }
    (*current)["leaf"] = 1;

    auto all = collect_items(d);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].path.size(), levels + 1);
    EXPECT_EQ(all[0].path.back(), "leaf");
    EXPECT_EQ(all[0].value, 1);
}

TEST(Items, OrderedValueKeepsInsertionOrder) {
    OrderedValue d = {{"z", 1}, {"m", {{"y", 2}, {"b", 3}}}, {"a", 4}};

    std::vector<Path> seen;
    for (const auto& item : items(d)) {
        seen.push_back(item.path);
    }
    std::vector<Path> expected = {{"z"}, {"m", "y"}, {"m", "b"}, {"a"}};
    EXPECT_EQ(seen, expected);
}

// ============================================================================
// build / copy / update
// ============================================================================

TEST_F(ItemsTest, BuildFromItemsReproducesMapping) {
    EXPECT_EQ(build<Value>(items(data)), data);
    EXPECT_EQ(build<Value>(items(data, 1)), data);
}

TEST_F(ItemsTest, BuildFromPathItems) {
    std::vector<PathItem> list = {
        {{"x", "y"}, 1},
        {{"x", "z"}, 2},
        {{"w"}, "s"},
    };
    EXPECT_EQ(build<Value>(list), (Value{{"x", {{"y", 1}, {"z", 2}}}, {"w", "s"}}));
}

TEST_F(ItemsTest, CopyIsEqualAndIndependent) {
    Value copied = copy(data);
    EXPECT_EQ(copied, data);

    copied["a"]["c"]["d"] = 99;
    EXPECT_EQ(data["a"]["c"]["d"], 2);
}

TEST_F(ItemsTest, ShallowCopyStillCopiesValues) {
    Value copied = copy(data, 1);
    EXPECT_EQ(copied, data);

    copied["a"]["b"] = 42;
    EXPECT_EQ(data["a"]["b"], 1);
}

TEST(Copy, DropsEmptySubMappings) {
    Value d = {{"empty", Value::object()}, {"x", 1}};
    EXPECT_EQ(copy(d), (Value{{"x", 1}}));
    EXPECT_EQ(copy(d, 1), d);
}

TEST(Update, MergesItemsIntoTarget) {
    Value target = {{"a", {{"b", 1}, {"keep", true}}}};
    Value source = {{"a", {{"b", 2}, {"c", 3}}}, {"d", 4}};

    update(target, items(source));

    EXPECT_EQ(target, (Value{{"a", {{"b", 2}, {"keep", true}, {"c", 3}}}, {"d", 4}}));
}

TEST(Update, ShallowItemsReplaceSubMappings) {
    Value target = {{"a", {{"b", 1}, {"keep", true}}}};
    Value source = {{"a", {{"b", 2}}}};

    update(target, items(source, 1));

    EXPECT_EQ(target, (Value{{"a", {{"b", 2}}}}));
}

TEST(Update, ReturnsTarget) {
    Value target = Value::object();
    Value source = {{"x", 1}};
    Value& ref = update(target, collect_items(source));
    EXPECT_EQ(&ref, &target);
    EXPECT_EQ(target, source);
}

TEST(Copy, OrderedValue) {
    OrderedValue d = {{"z", {{"y", 1}}}, {"a", 2}};
    OrderedValue copied = copy(d);

    EXPECT_EQ(copied, d);
    EXPECT_EQ(copied.begin().key(), "z");
}
