/**
 * @file Tree.cpp
 * @brief Implementation of path-addressed access
 */

#include "treedict/Tree.hpp"
#include "treedict/Path.hpp"

#include <utility>
#include <vector>

namespace treedict {

namespace {

/**
 * @brief Follow the first @p count keys of @p path below @p root
 *
 * @param missing If not null, receives the index of the missing key
 * @return The node reached, or nullptr if a key is missing
 * @throws TypeError if a non-mapping is met before @p count keys
 */
template <typename Node>
Node* resolve(Node& root, const Path& path, std::size_t count, std::size_t* missing = nullptr) {
    Node* current = &root;
    for (std::size_t i = 0; i < count; ++i) {
        if (!is_mapping(*current)) {
            throw TypeError(join_path(path), "object", type_name(*current));
        }
        auto it = current->find(path[i]);
        if (it == current->end()) {
            if (missing) *missing = i;
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

template <typename BasicJsonType>
void require_mapping(const BasicJsonType& node, const Path& path) {
    if (!is_mapping(node)) {
        throw TypeError(join_path(path), "object", type_name(node));
    }
}

/**
 * @brief Locate the parent of the last key, KeyError if missing
 */
template <typename BasicJsonType>
BasicJsonType& parent_of(BasicJsonType& d, const Path& path, const char* operation) {
    if (path.empty()) {
        throw EmptyPathError(operation);
    }
    std::size_t missing = 0;
    BasicJsonType* parent = resolve(d, path, path.size() - 1, &missing);
    if (parent == nullptr) {
        throw KeyError(join_path(path), path[missing]);
    }
    require_mapping(*parent, path);
    return *parent;
}

} // anonymous namespace

template <typename BasicJsonType>
const BasicJsonType& get(const BasicJsonType& d, const Path& path) {
    std::size_t missing = 0;
    const BasicJsonType* found = resolve(d, path, path.size(), &missing);
    if (found == nullptr) {
        throw KeyError(join_path(path), path[missing]);
    }
    return *found;
}

template <typename BasicJsonType>
BasicJsonType& get(BasicJsonType& d, const Path& path) {
    std::size_t missing = 0;
    BasicJsonType* found = resolve(d, path, path.size(), &missing);
    if (found == nullptr) {
        throw KeyError(join_path(path), path[missing]);
    }
    return *found;
}

template <typename BasicJsonType>
BasicJsonType get(const BasicJsonType& d, const Path& path,
                  const detail::non_deduced_t<BasicJsonType>& default_val) {
    const BasicJsonType* found = resolve(d, path, path.size());
    return found != nullptr ? *found : default_val;
}

template <typename BasicJsonType>
bool has(const BasicJsonType& d, const Path& path) {
    return resolve(d, path, path.size()) != nullptr;
}

template <typename BasicJsonType>
BasicJsonType& set(BasicJsonType& d, const Path& path, detail::non_deduced_t<BasicJsonType> value) {
    if (path.empty()) {
        throw EmptyPathError("set");
    }

    BasicJsonType* current = &d;
    bool fresh = false;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        const auto& key = path[i];
        if (!fresh) {
            require_mapping(*current, path);
            auto it = current->find(key);
            if (it != current->end()) {
                current = &*it;
                continue;
            }
            fresh = true;
        }
        // Past the first missing key nothing below can exist yet
        current = &((*current)[key] = BasicJsonType::object());
    }

    if (!fresh) {
        require_mapping(*current, path);
    }
    return (*current)[path.back()] = std::move(value);
}

template <typename BasicJsonType>
BasicJsonType& setdefault(BasicJsonType& d, const Path& path,
                          detail::non_deduced_t<BasicJsonType> default_val) {
    if (path.empty()) {
        throw EmptyPathError("setdefault");
    }

    BasicJsonType* parent = resolve(d, path, path.size() - 1);
    if (parent == nullptr) {
        return set(d, path, std::move(default_val));
    }
    require_mapping(*parent, path);

    auto it = parent->find(path.back());
    if (it != parent->end()) {
        return *it;
    }
    return (*parent)[path.back()] = std::move(default_val);
}

template <typename BasicJsonType>
BasicJsonType pop(BasicJsonType& d, const Path& path) {
    BasicJsonType& parent = parent_of(d, path, "pop");
    auto it = parent.find(path.back());
    if (it == parent.end()) {
        throw KeyError(join_path(path), path.back());
    }
    BasicJsonType value = std::move(*it);
    parent.erase(it);
    return value;
}

template <typename BasicJsonType>
BasicJsonType pop(BasicJsonType& d, const Path& path, detail::non_deduced_t<BasicJsonType> default_val) {
    if (path.empty()) {
        throw EmptyPathError("pop");
    }
    BasicJsonType* parent = resolve(d, path, path.size() - 1);
    if (parent == nullptr) {
        return default_val;
    }
    require_mapping(*parent, path);

    auto it = parent->find(path.back());
    if (it == parent->end()) {
        return default_val;
    }
    BasicJsonType value = std::move(*it);
    parent->erase(it);
    return value;
}

namespace {

/**
 * @brief Erase the maximal run of empty mappings ending at the popped key
 *
 * @p chain holds the root followed by each intermediate mapping of
 * @p path, so chain[i] contains the key path[i].
 */
template <typename BasicJsonType>
void prune(const std::vector<BasicJsonType*>& chain, const Path& path) {
    for (std::size_t i = chain.size() - 1; i-- > 0;) {
        BasicJsonType& holder = *chain[i];
        auto it = holder.find(path[i]);
        if (!it->empty()) {
            break;
        }
        holder.erase(it);
    }
}

template <typename BasicJsonType>
BasicJsonType* pop_with_chain(BasicJsonType& d, const Path& path,
                              std::vector<BasicJsonType*>& chain, std::size_t& missing) {
    BasicJsonType* current = &d;
    chain.push_back(current);
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        require_mapping(*current, path);
        auto it = current->find(path[i]);
        if (it == current->end()) {
            missing = i;
            return nullptr;
        }
        current = &*it;
        chain.push_back(current);
    }
    require_mapping(*current, path);
    if (!current->contains(path.back())) {
        missing = path.size() - 1;
        return nullptr;
    }
    return current;
}

} // anonymous namespace

template <typename BasicJsonType>
BasicJsonType pop_path(BasicJsonType& d, const Path& path) {
    if (path.empty()) {
        throw EmptyPathError("pop_path");
    }

    std::vector<BasicJsonType*> chain;
    std::size_t missing = 0;
    BasicJsonType* parent = pop_with_chain(d, path, chain, missing);
    if (parent == nullptr) {
        throw KeyError(join_path(path), path[missing]);
    }

    auto it = parent->find(path.back());
    BasicJsonType value = std::move(*it);
    parent->erase(it);
    prune(chain, path);
    return value;
}

template <typename BasicJsonType>
BasicJsonType pop_path(BasicJsonType& d, const Path& path,
                       detail::non_deduced_t<BasicJsonType> default_val) {
    if (path.empty()) {
        throw EmptyPathError("pop_path");
    }

    std::vector<BasicJsonType*> chain;
    std::size_t missing = 0;
    BasicJsonType* parent = pop_with_chain(d, path, chain, missing);
    if (parent == nullptr) {
        return default_val;
    }

    auto it = parent->find(path.back());
    BasicJsonType value = std::move(*it);
    parent->erase(it);
    prune(chain, path);
    return value;
}

// Explicit instantiations

template const Value& get<Value>(const Value&, const Path&);
template Value& get<Value>(Value&, const Path&);
template Value get<Value>(const Value&, const Path&, const Value&);
template bool has<Value>(const Value&, const Path&);
template Value& set<Value>(Value&, const Path&, Value);
template Value& setdefault<Value>(Value&, const Path&, Value);
template Value pop<Value>(Value&, const Path&);
template Value pop<Value>(Value&, const Path&, Value);
template Value pop_path<Value>(Value&, const Path&);
template Value pop_path<Value>(Value&, const Path&, Value);

template const OrderedValue& get<OrderedValue>(const OrderedValue&, const Path&);
template OrderedValue& get<OrderedValue>(OrderedValue&, const Path&);
template OrderedValue get<OrderedValue>(const OrderedValue&, const Path&, const OrderedValue&);
template bool has<OrderedValue>(const OrderedValue&, const Path&);
template OrderedValue& set<OrderedValue>(OrderedValue&, const Path&, OrderedValue);
template OrderedValue& setdefault<OrderedValue>(OrderedValue&, const Path&, OrderedValue);
template OrderedValue pop<OrderedValue>(OrderedValue&, const Path&);
template OrderedValue pop<OrderedValue>(OrderedValue&, const Path&, OrderedValue);
template OrderedValue pop_path<OrderedValue>(OrderedValue&, const Path&);
template OrderedValue pop_path<OrderedValue>(OrderedValue&, const Path&, OrderedValue);

} // namespace treedict
