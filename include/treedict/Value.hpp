/**
 * @file Value.hpp
 * @brief Value model for nested mappings
 *
 * Uses nlohmann::json as the underlying value model. Any basic_json
 * specialization works as a nested mapping:
 * - Object values are mappings (traversal nodes)
 * - Everything else (null, bool, numbers, strings, arrays) is a leaf
 *
 * The library is instantiated for Value (key-sorted objects) and
 * OrderedValue (insertion-ordered objects). Mappings created by the
 * library always have the same type as the caller's root.
 */

#ifndef TREEDICT_VALUE_HPP
#define TREEDICT_VALUE_HPP

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace treedict {

/**
 * @brief Nested mapping with key-sorted objects
 *
 * Alias for nlohmann::json. See nlohmann::json documentation for the
 * complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Nested mapping with insertion-ordered objects
 */
using OrderedValue = nlohmann::ordered_json;

/**
 * @brief Sequence of keys locating a value inside a nested mapping
 */
using Path = std::vector<std::string>;

/**
 * @brief Recursion limit, counted in key levels
 *
 * An empty Depth means unbounded.
 */
using Depth = std::optional<std::size_t>;

inline constexpr Depth unbounded = std::nullopt;

namespace detail {
/// Keeps a parameter out of template argument deduction
template <typename T>
struct non_deduced {
    using type = T;
};

template <typename T>
using non_deduced_t = typename non_deduced<T>::type;
} // namespace detail

/**
 * @brief The absence marker
 *
 * A discarded value is distinct from every payload value, null included.
 * Combinators receive it for a key missing from one operand and return it
 * to drop a key from the result. It is never stored in a result mapping.
 */
template <typename BasicJsonType = Value>
const BasicJsonType& undefined() {
    static const BasicJsonType marker(BasicJsonType::value_t::discarded);
    return marker;
}

/**
 * @brief Check for the absence marker
 */
template <typename BasicJsonType>
bool is_undefined(const BasicJsonType& val) noexcept {
    return val.is_discarded();
}

/**
 * @brief Check if a value is a nested mapping (a traversal node)
 */
template <typename BasicJsonType>
bool is_mapping(const BasicJsonType& val) noexcept {
    return val.is_object();
}

/**
 * @brief Get human-readable type name for a value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object", "undefined")
 */
template <typename BasicJsonType>
std::string type_name(const BasicJsonType& val) {
    if (val.is_discarded()) return "undefined";
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace treedict

#endif // TREEDICT_VALUE_HPP
