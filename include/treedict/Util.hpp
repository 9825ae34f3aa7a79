#ifndef TREEDICT_UTIL_HPP
#define TREEDICT_UTIL_HPP

#include "treedict/Value.hpp"
#include <string>
#include <vector>

namespace treedict {

// Single-level helpers. They look at the top level of a mapping only.

// Value of the first of `keys` present in `d`. Throws KeyError listing all keys if none is.
template <typename BasicJsonType>
const BasicJsonType& lookup(const BasicJsonType& d, const std::vector<std::string>& keys);

// As above, returning a copy of the value, or `default_val` if none of `keys` is present.
template <typename BasicJsonType>
BasicJsonType lookup(const BasicJsonType& d, const std::vector<std::string>& keys,
                     const detail::non_deduced_t<BasicJsonType>& default_val);

// New mapping holding only `keys` of `d`. Missing keys throw KeyError unless skipped.
template <typename BasicJsonType>
BasicJsonType extract(const BasicJsonType& d, const std::vector<std::string>& keys,
                      bool skip_missing_keys = false);

// Swap keys and values. String values become keys as-is, other values by their
// JSON text. When values repeat, the last key in iteration order wins.
template <typename BasicJsonType>
BasicJsonType invert(const BasicJsonType& d);

// Try parsing `raw` as JSON, otherwise return it as a string.
template <typename BasicJsonType = Value>
BasicJsonType parse_value(const std::string& raw);

} // namespace treedict

#endif // TREEDICT_UTIL_HPP
