/**
 * @file Combine.hpp
 * @brief Combinator-based traversal of two nested mappings
 *
 * combine() walks two nested mappings side by side and builds a new one.
 * Each leaf key pair is handed to a combinator that produces the output
 * value, or undefined() to leave the key out. merge() and diff() are
 * combine() with stock combinators.
 *
 * Traversal uses an explicit frame stack, so nesting depth is not limited
 * by the call stack.
 */

#ifndef TREEDICT_COMBINE_HPP
#define TREEDICT_COMBINE_HPP

#include "treedict/Value.hpp"
#include <functional>
#include <initializer_list>
#include <vector>

namespace treedict {

/**
 * @brief Per-key combinator
 *
 * Called as combinator(path, v0, v1) where path runs from the root to the
 * current key and v0/v1 are the operands' values (undefined() if the key is
 * absent on that side). Returns the output value, or undefined() to omit
 * the key.
 */
template <typename BasicJsonType>
using BasicCombinator = std::function<BasicJsonType(
    const Path&, const BasicJsonType&, const BasicJsonType&)>;

using Combinator = BasicCombinator<Value>;

/**
 * @brief Combine two nested mappings key by key
 *
 * For every key k of d0 with value v0, v1 is d1's value at k (undefined()
 * if missing):
 * - If fewer than @p depth levels have been descended and both v0 and v1
 *   are mappings, they are combined recursively. The sub-result is stored
 *   at k unless it is empty.
 * - Otherwise combinator(path, v0, v1) is stored at k unless it returns
 *   undefined().
 *
 * With @p symmetric, every key of d1 missing from d0 is then visited with
 * combinator(path, undefined(), v1).
 *
 * Neither operand is modified. An exception thrown by the combinator
 * propagates unchanged and no partial result is kept.
 *
 * @param d0 Left operand (must be a mapping)
 * @param d1 Right operand (must be a mapping)
 * @param combinator Leaf combinator
 * @param depth Recursion limit; 0 combines top-level values as leaves
 * @param symmetric Also visit keys that only d1 has
 * @return Combined mapping of the operands' type
 * @throws TypeError if an operand is not a mapping
 *
 * Example:
 * ```cpp
 * Value a = {{"x", 1}, {"y", 2}};
 * Value b = {{"y", 3}, {"z", 4}};
 * auto sum = combine(a, b, [](const Path&, const Value& l, const Value& r) {
 *     if (is_undefined(l)) return r;
 *     if (is_undefined(r)) return l;
 *     return Value(l.get<int>() + r.get<int>());
 * });
 * // Result: {"x": 1, "y": 5, "z": 4}
 * ```
 */
template <typename BasicJsonType>
BasicJsonType combine(const BasicJsonType& d0, const BasicJsonType& d1,
                      const detail::non_deduced_t<BasicCombinator<BasicJsonType>>& combinator,
                      Depth depth = unbounded, bool symmetric = true);

/**
 * @brief Combinator used by merge(): later values win
 */
template <typename BasicJsonType>
BasicJsonType merge_value(const Path&, const BasicJsonType& v0, const BasicJsonType& v1) {
    return is_undefined(v1) ? v0 : v1;
}

/**
 * @brief Combinator used by asymmetric diff(): d0's value where they differ
 */
template <typename BasicJsonType>
BasicJsonType asymmetric_value_diff(const Path&, const BasicJsonType& v0, const BasicJsonType& v1) {
    if (!is_undefined(v0) && !is_undefined(v1) && v0 == v1) {
        return undefined<BasicJsonType>();
    }
    return v0;
}

/**
 * @brief Combinator used by symmetric diff(): the pair [v0, v1] where they differ
 *
 * A side missing from its mapping is undefined() inside the pair.
 */
template <typename BasicJsonType>
BasicJsonType symmetric_value_diff(const Path&, const BasicJsonType& v0, const BasicJsonType& v1) {
    if (!is_undefined(v0) && !is_undefined(v1) && v0 == v1) {
        return undefined<BasicJsonType>();
    }
    BasicJsonType pair = BasicJsonType::array();
    pair.push_back(v0);
    pair.push_back(v1);
    return pair;
}

/**
 * @brief Deep merge any number of nested mappings
 *
 * Left fold of symmetric combine() with merge_value(), starting from an
 * empty mapping. Values from later sources win; mappings at the same key
 * are merged within @p depth, anything else replaces whole.
 *
 * @param sources Mappings in precedence order (lowest first)
 * @param depth Recursion limit
 * @return Merged mapping; empty if there are no sources
 *
 * Example:
 * ```cpp
 * Value a = {{"a", 1}, {"b", {{"x", 1}}}};
 * Value b = {{"b", {{"y", 2}}}};
 * auto result = merge(a, b);
 * // Result: {"a": 1, "b": {"x": 1, "y": 2}}
 * ```
 */
template <typename BasicJsonType>
BasicJsonType merge(const std::vector<BasicJsonType>& sources, Depth depth = unbounded);

template <typename BasicJsonType>
BasicJsonType merge(std::initializer_list<BasicJsonType> sources, Depth depth = unbounded) {
    return merge(std::vector<BasicJsonType>(sources), depth);
}

template <typename BasicJsonType>
BasicJsonType merge(const BasicJsonType& d0, const BasicJsonType& d1, Depth depth = unbounded) {
    return merge(std::vector<BasicJsonType>{d0, d1}, depth);
}

/**
 * @brief Difference between two nested mappings
 *
 * - symmetric: every differing key maps to [v0, v1]; keys present on one
 *   side only have undefined() on the other side of the pair.
 * - asymmetric: every differing key of d0 maps to d0's value; keys that
 *   only d1 has never appear.
 *
 * Equal values are omitted, so diff(a, a) is empty.
 *
 * Example:
 * ```cpp
 * Value a = {{"a", 1}, {"b", 2}};
 * Value b = {{"a", 1}, {"b", 3}, {"c", 4}};
 * auto d = diff(a, b);
 * // d["b"] == [2, 3]; d["c"][0] is undefined(), d["c"][1] == 4
 * ```
 */
template <typename BasicJsonType>
BasicJsonType diff(const BasicJsonType& d0, const BasicJsonType& d1,
                   Depth depth = unbounded, bool symmetric = true);

} // namespace treedict

#endif // TREEDICT_COMBINE_HPP
