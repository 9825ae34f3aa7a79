/**
 * @file Tree.hpp
 * @brief Path-addressed access to nested mappings
 *
 * Functions for reading and mutating a nested mapping through key paths:
 * - get()/has() walk a path without changing anything
 * - set()/setdefault() create missing intermediate mappings
 * - pop()/pop_path() remove values, pop_path() also drops emptied parents
 * - items() enumerates leaves lazily, copy()/update()/build() replay them
 *
 * Intermediate mappings are created with the root's own type, so an
 * OrderedValue tree stays insertion-ordered all the way down.
 *
 * Example:
 * ```cpp
 * Value d = Value::object();
 * set(d, {"1", "2"}, 3);        // {"1": {"2": 3}}
 * set(d, {"1", "5", "4"}, 6);   // {"1": {"2": 3, "5": {"4": 6}}}
 * pop_path(d, {"1", "5", "4"}); // {"1": {"2": 3}}
 * ```
 */

#ifndef TREEDICT_TREE_HPP
#define TREEDICT_TREE_HPP

#include "treedict/Value.hpp"
#include "treedict/Errors.hpp"

#include <cstddef>
#include <iterator>
#include <vector>

namespace treedict {

// ============================================================================
// Path access
// ============================================================================

/**
 * @brief Get the value at a path
 *
 * @param d Root mapping
 * @param path Keys to follow; empty returns @p d itself
 * @return Reference to the value at @p path
 * @throws KeyError naming the first missing key
 * @throws TypeError if the walk meets a non-mapping before the last key
 */
template <typename BasicJsonType>
const BasicJsonType& get(const BasicJsonType& d, const Path& path);

template <typename BasicJsonType>
BasicJsonType& get(BasicJsonType& d, const Path& path);

/**
 * @brief Get a copy of the value at a path, or @p default_val if a key is missing
 *
 * Returns by value so a temporary default can be passed safely.
 * Type errors are structural and are still raised.
 */
template <typename BasicJsonType>
BasicJsonType get(const BasicJsonType& d, const Path& path,
                  const detail::non_deduced_t<BasicJsonType>& default_val);

/**
 * @brief Check if a path resolves
 * @throws TypeError if the walk meets a non-mapping before the last key
 */
template <typename BasicJsonType>
bool has(const BasicJsonType& d, const Path& path);

/**
 * @brief Bind a value at a path, creating intermediate mappings
 *
 * Existing intermediate mappings are reused up to the first missing key.
 * From there on every intermediate mapping is newly created.
 *
 * @return Reference to the stored value
 * @throws EmptyPathError if @p path is empty
 * @throws TypeError if an existing intermediate value is not a mapping
 */
template <typename BasicJsonType>
BasicJsonType& set(BasicJsonType& d, const Path& path, detail::non_deduced_t<BasicJsonType> value);

/**
 * @brief Get the value at a path, storing @p default_val first if absent
 *
 * If the parent of the last key exists, acts like a single-level
 * set-if-absent there. Otherwise the whole path is created as by set().
 *
 * @return Reference to the existing or newly stored value
 * @throws EmptyPathError if @p path is empty
 */
template <typename BasicJsonType>
BasicJsonType& setdefault(BasicJsonType& d, const Path& path,
                          detail::non_deduced_t<BasicJsonType> default_val);

/**
 * @brief Remove and return the value at a path
 *
 * @throws KeyError naming the first missing key
 * @throws EmptyPathError if @p path is empty
 */
template <typename BasicJsonType>
BasicJsonType pop(BasicJsonType& d, const Path& path);

/**
 * @brief Remove and return the value at a path, or @p default_val if missing
 */
template <typename BasicJsonType>
BasicJsonType pop(BasicJsonType& d, const Path& path, detail::non_deduced_t<BasicJsonType> default_val);

/**
 * @brief pop(), then erase the intermediate mappings left empty
 *
 * Walks back towards the root erasing each emptied mapping and stops at
 * the first one that still has entries. The root is never erased.
 *
 * Example:
 * ```cpp
 * Value d = {{"a", {{"b", {{"c", 1}}}, {"x", 2}}}};
 * pop_path(d, {"a", "b", "c"});
 * // Result: {"a": {"x": 2}}
 * ```
 */
template <typename BasicJsonType>
BasicJsonType pop_path(BasicJsonType& d, const Path& path);

template <typename BasicJsonType>
BasicJsonType pop_path(BasicJsonType& d, const Path& path,
                       detail::non_deduced_t<BasicJsonType> default_val);

template <typename BasicJsonType>
BasicJsonType remove(BasicJsonType& d, const Path& path) {
    return pop(d, path);
}

template <typename BasicJsonType>
BasicJsonType remove_path(BasicJsonType& d, const Path& path) {
    return pop_path(d, path);
}

// ============================================================================
// Leaf enumeration
// ============================================================================

/**
 * @brief A leaf and the keys leading to it
 */
template <typename BasicJsonType>
struct BasicPathItem {
    Path path;
    BasicJsonType value;
};

using PathItem = BasicPathItem<Value>;

/**
 * @brief Non-owning view of a leaf, produced by ItemIterator
 */
template <typename BasicJsonType>
struct BasicPathItemRef {
    const Path& path;
    const BasicJsonType& value;
};

/**
 * @brief Depth-first input iterator over the leaves of a mapping
 *
 * Keeps a stack of object iterators instead of recursing. A mapping found
 * at the depth limit is yielded as a leaf. Empty mappings below the root
 * yield nothing. The tree must not be modified while iterating.
 */
template <typename BasicJsonType>
class ItemIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = BasicPathItem<BasicJsonType>;
    using difference_type = std::ptrdiff_t;
    using reference = BasicPathItemRef<BasicJsonType>;
    using pointer = void;

    /// End iterator
    ItemIterator() = default;

    ItemIterator(const BasicJsonType& root, Depth depth)
        : depth_(depth)
    {
        stack_.push_back({root.cbegin(), root.cend()});
        advance();
    }

    reference operator*() const {
        return {path_, *leaf_};
    }

    ItemIterator& operator++() {
        advance();
        return *this;
    }

    void operator++(int) {
        advance();
    }

    friend bool operator==(const ItemIterator& a, const ItemIterator& b) {
        return a.leaf_ == b.leaf_;
    }

    friend bool operator!=(const ItemIterator& a, const ItemIterator& b) {
        return !(a == b);
    }

private:
    using const_iterator = typename BasicJsonType::const_iterator;

    struct Level {
        const_iterator it;
        const_iterator end;
    };

    void advance() {
        if (leaf_ != nullptr) {
            path_.pop_back();
            leaf_ = nullptr;
        }

        while (!stack_.empty()) {
            auto& level = stack_.back();
            if (level.it == level.end) {
                stack_.pop_back();
                if (!path_.empty()) {
                    path_.pop_back();
                }
                continue;
            }

            auto current = level.it++;
            path_.push_back(current.key());
            const BasicJsonType& val = current.value();

            if (is_mapping(val) && (!depth_ || path_.size() < *depth_)) {
                stack_.push_back({val.cbegin(), val.cend()});
                continue;
            }

            leaf_ = &val;
            return;
        }
    }

    Depth depth_;
    std::vector<Level> stack_;
    Path path_;
    const BasicJsonType* leaf_ = nullptr;
};

/**
 * @brief Range over the leaves of a mapping, see items()
 */
template <typename BasicJsonType>
class ItemRange {
public:
    ItemRange(const BasicJsonType& root, Depth depth)
        : root_(&root)
        , depth_(depth)
    {}

    ItemIterator<BasicJsonType> begin() const {
        return ItemIterator<BasicJsonType>(*root_, depth_);
    }

    ItemIterator<BasicJsonType> end() const {
        return ItemIterator<BasicJsonType>();
    }

private:
    const BasicJsonType* root_;
    Depth depth_;
};

/**
 * @brief Lazily enumerate (path, value) for every leaf within @p depth
 *
 * A value exactly @p depth keys down is a leaf even if it is a mapping.
 * Order is depth-first in each mapping's iteration order.
 *
 * The range refers to @p d, which must outlive it. Temporaries are
 * rejected; use collect_items() on a computed mapping such as
 * `collect_items(diff(a, b))`.
 *
 * @throws TypeError if @p d is not a mapping
 *
 * Example:
 * ```cpp
 * Value d = {{"a", {{"b", 1}}}, {"c", 2}};
 * for (const auto& item : items(d)) {
 *     // ["a", "b"] -> 1, then ["c"] -> 2
 * }
 * for (const auto& item : items(d, 1)) {
 *     // ["a"] -> {"b": 1}, then ["c"] -> 2
 * }
 * ```
 */
template <typename BasicJsonType>
ItemRange<BasicJsonType> items(const BasicJsonType& d, Depth depth = unbounded) {
    if (!is_mapping(d)) {
        throw TypeError("", "object", type_name(d));
    }
    return ItemRange<BasicJsonType>(d, depth);
}

template <typename BasicJsonType>
ItemRange<BasicJsonType> items(const BasicJsonType&&, Depth = unbounded) = delete;

/**
 * @brief Materialize items() into owning PathItems
 */
template <typename BasicJsonType>
std::vector<BasicPathItem<BasicJsonType>> collect_items(const BasicJsonType& d, Depth depth = unbounded) {
    std::vector<BasicPathItem<BasicJsonType>> out;
    for (const auto& item : items(d, depth)) {
        out.push_back({item.path, item.value});
    }
    return out;
}

/**
 * @brief set() every item of @p item_range into @p d
 *
 * Items are anything with `path` and `value` members, such as PathItem or
 * the elements of items(). @p item_range must not be a view of @p d itself.
 */
template <typename BasicJsonType, typename Range>
BasicJsonType& update(BasicJsonType& d, const Range& item_range) {
    for (const auto& item : item_range) {
        set(d, item.path, BasicJsonType(item.value));
    }
    return d;
}

/**
 * @brief Build a new mapping from path items
 *
 * Example:
 * ```cpp
 * auto d = build<Value>(items(other));
 * ```
 */
template <typename BasicJsonType, typename Range>
BasicJsonType build(const Range& item_range) {
    BasicJsonType d = BasicJsonType::object();
    update(d, item_range);
    return d;
}

/**
 * @brief Independent copy rebuilt from items(d, depth)
 *
 * Mappings deeper than @p depth are copied whole as leaf values.
 */
template <typename BasicJsonType>
BasicJsonType copy(const BasicJsonType& d, Depth depth = unbounded) {
    return build<BasicJsonType>(items(d, depth));
}

} // namespace treedict

#endif // TREEDICT_TREE_HPP
