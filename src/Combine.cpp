/**
 * @file Combine.cpp
 * @brief Implementation of combine, merge and diff
 */

#include "treedict/Combine.hpp"
#include "treedict/Errors.hpp"
#include "treedict/Path.hpp"

#include <string>
#include <utility>
#include <vector>

namespace treedict {

namespace {

/**
 * @brief One level of the simulated recursion
 *
 * Holds the pair of mappings being combined, the position reached in
 * them, and the partial result for this level. The key of this level in
 * the parent result is the last element of the shared path.
 */
template <typename BasicJsonType>
struct Frame {
    using const_iterator = typename BasicJsonType::const_iterator;

    Frame(const BasicJsonType& lhs_, const BasicJsonType& rhs_)
        : lhs(&lhs_)
        , rhs(&rhs_)
        , it(lhs_.cbegin())
        , result(BasicJsonType::object())
    {}

    const BasicJsonType* lhs;
    const BasicJsonType* rhs;
    const_iterator it;
    bool rhs_pass = false;  // iterating rhs for keys missing from lhs
    BasicJsonType result;
};

template <typename BasicJsonType>
void require_mapping(const BasicJsonType& val, const char* operand) {
    if (!is_mapping(val)) {
        throw TypeError(operand, "object", type_name(val));
    }
}

} // anonymous namespace

template <typename BasicJsonType>
BasicJsonType combine(const BasicJsonType& d0, const BasicJsonType& d1,
                      const detail::non_deduced_t<BasicCombinator<BasicJsonType>>& combinator,
                      Depth depth, bool symmetric) {
    require_mapping(d0, "<lhs>");
    require_mapping(d1, "<rhs>");

    const BasicJsonType& absent = undefined<BasicJsonType>();

    Path path;
    std::vector<Frame<BasicJsonType>> stack;
    stack.emplace_back(d0, d1);

    while (true) {
        auto& frame = stack.back();

        if (!frame.rhs_pass) {
            if (frame.it != frame.lhs->cend()) {
                auto current = frame.it++;
                const auto& key = current.key();
                const BasicJsonType& v0 = current.value();

                auto found = frame.rhs->find(key);
                const BasicJsonType& v1 = found != frame.rhs->cend() ? *found : absent;

                path.push_back(key);

                // stack.size() - 1 levels have been descended so far
                const bool can_descend = !depth || stack.size() - 1 < *depth;
                if (can_descend && is_mapping(v0) && is_mapping(v1)) {
                    stack.emplace_back(v0, v1);  // invalidates frame
                    continue;
                }

                BasicJsonType out = combinator(path, v0, v1);
                if (!is_undefined(out)) {
                    frame.result[key] = std::move(out);
                }
                path.pop_back();
                continue;
            }

            if (symmetric) {
                frame.rhs_pass = true;
                frame.it = frame.rhs->cbegin();
                continue;
            }
        } else if (frame.it != frame.rhs->cend()) {
            auto current = frame.it++;
            const auto& key = current.key();
            if (frame.lhs->contains(key)) {
                continue;
            }

            path.push_back(key);
            BasicJsonType out = combinator(path, absent, current.value());
            if (!is_undefined(out)) {
                frame.result[key] = std::move(out);
            }
            path.pop_back();
            continue;
        }

        // Frame exhausted: splice its result into the parent
        BasicJsonType done = std::move(frame.result);
        stack.pop_back();
        if (stack.empty()) {
            return done;
        }
        if (!done.empty()) {
            stack.back().result[path.back()] = std::move(done);
        }
        path.pop_back();
    }
}

template <typename BasicJsonType>
BasicJsonType merge(const std::vector<BasicJsonType>& sources, Depth depth) {
    BasicJsonType result = BasicJsonType::object();
    for (const auto& source : sources) {
        result = combine<BasicJsonType>(result, source, &merge_value<BasicJsonType>, depth, true);
    }
    return result;
}

template <typename BasicJsonType>
BasicJsonType diff(const BasicJsonType& d0, const BasicJsonType& d1, Depth depth, bool symmetric) {
    if (symmetric) {
        return combine<BasicJsonType>(d0, d1, &symmetric_value_diff<BasicJsonType>, depth, true);
    }
    return combine<BasicJsonType>(d0, d1, &asymmetric_value_diff<BasicJsonType>, depth, false);
}

template Value combine<Value>(const Value&, const Value&, const BasicCombinator<Value>&, Depth, bool);
template OrderedValue combine<OrderedValue>(const OrderedValue&, const OrderedValue&,
                                            const BasicCombinator<OrderedValue>&, Depth, bool);

template Value merge<Value>(const std::vector<Value>&, Depth);
template OrderedValue merge<OrderedValue>(const std::vector<OrderedValue>&, Depth);

template Value diff<Value>(const Value&, const Value&, Depth, bool);
template OrderedValue diff<OrderedValue>(const OrderedValue&, const OrderedValue&, Depth, bool);

} // namespace treedict
