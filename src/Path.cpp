/**
 * @file Path.cpp
 * @brief Implementation of dot-path helpers
 */

#include "treedict/Path.hpp"
#include <algorithm>
#include <sstream>

namespace treedict {

Path split_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    Path segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_path(const Path& path, std::size_t count) {
    const std::size_t n = std::min(count, path.size());
    if (n == 0) {
        return "";
    }

    std::ostringstream oss;
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) oss << '.';
        oss << path[i];
    }
    return oss.str();
}

} // namespace treedict
