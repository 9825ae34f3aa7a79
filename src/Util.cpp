#include "treedict/Util.hpp"
#include "treedict/Errors.hpp"
#include <sstream>

namespace treedict {

namespace {

template <typename BasicJsonType>
void require_mapping(const BasicJsonType& d) {
    if (!is_mapping(d)) {
        throw TypeError("", "object", type_name(d));
    }
}

template <typename BasicJsonType>
const BasicJsonType* find_first(const BasicJsonType& d, const std::vector<std::string>& keys) {
    require_mapping(d);
    for (const auto& key : keys) {
        auto it = d.find(key);
        if (it != d.end()) return &*it;
    }
    return nullptr;
}

std::string any_of(const std::vector<std::string>& keys) {
    std::ostringstream oss;
    oss << "any of ";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i) oss << ", ";
        oss << "'" << keys[i] << "'";
    }
    return oss.str();
}

} // anonymous namespace

template <typename BasicJsonType>
const BasicJsonType& lookup(const BasicJsonType& d, const std::vector<std::string>& keys) {
    const BasicJsonType* found = find_first(d, keys);
    if (found == nullptr) {
        throw KeyError("", any_of(keys));
    }
    return *found;
}

template <typename BasicJsonType>
BasicJsonType lookup(const BasicJsonType& d, const std::vector<std::string>& keys,
                     const detail::non_deduced_t<BasicJsonType>& default_val) {
    const BasicJsonType* found = find_first(d, keys);
    return found != nullptr ? *found : default_val;
}

template <typename BasicJsonType>
BasicJsonType extract(const BasicJsonType& d, const std::vector<std::string>& keys,
                      bool skip_missing_keys) {
    require_mapping(d);
    BasicJsonType out = BasicJsonType::object();
    for (const auto& key : keys) {
        auto it = d.find(key);
        if (it == d.end()) {
            if (skip_missing_keys) continue;
            throw KeyError(key, key);
        }
        out[key] = *it;
    }
    return out;
}

template <typename BasicJsonType>
BasicJsonType invert(const BasicJsonType& d) {
    require_mapping(d);
    BasicJsonType out = BasicJsonType::object();
    for (auto it = d.begin(); it != d.end(); ++it) {
        const auto& v = it.value();
        out[v.is_string() ? v.template get<std::string>() : v.dump()] = it.key();
    }
    return out;
}

template <typename BasicJsonType>
BasicJsonType parse_value(const std::string& raw) {
    try {
        return BasicJsonType::parse(raw);
    } catch (const typename BasicJsonType::parse_error&) {
        return BasicJsonType(raw);
    }
}

template const Value& lookup<Value>(const Value&, const std::vector<std::string>&);
template Value lookup<Value>(const Value&, const std::vector<std::string>&, const Value&);
template Value extract<Value>(const Value&, const std::vector<std::string>&, bool);
template Value invert<Value>(const Value&);
template Value parse_value<Value>(const std::string&);

template const OrderedValue& lookup<OrderedValue>(const OrderedValue&, const std::vector<std::string>&);
template OrderedValue lookup<OrderedValue>(const OrderedValue&, const std::vector<std::string>&,
                                           const OrderedValue&);
template OrderedValue extract<OrderedValue>(const OrderedValue&, const std::vector<std::string>&, bool);
template OrderedValue invert<OrderedValue>(const OrderedValue&);
template OrderedValue parse_value<OrderedValue>(const std::string&);

} // namespace treedict
