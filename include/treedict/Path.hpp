/**
 * @file Path.hpp
 * @brief Dot-notation helpers for key paths
 *
 * A Path is a sequence of keys. These helpers convert between a Path and
 * its dot-separated spelling ("database.host"), which is how paths are
 * given on the command line and reported in error messages.
 */

#ifndef TREEDICT_PATH_HPP
#define TREEDICT_PATH_HPP

#include "treedict/Value.hpp"
#include <string>

namespace treedict {

/**
 * @brief Split a dot-path into keys
 *
 * @param path Dot-separated path like "a.b.c"
 * @return Path {"a", "b", "c"}
 *
 * Empty segments are dropped.
 *
 * Examples:
 * - "database.host" → ["database", "host"]
 * - "a..b" → ["a", "b"]
 * - "" → []
 * - "single" → ["single"]
 */
Path split_path(const std::string& path);

/**
 * @brief Join keys with dots
 *
 * @param path Keys to join
 * @param count Number of leading keys to join (all keys by default)
 * @return Dot-joined path string
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - ["a", "b", "c"], count 2 → "a.b"
 * - [] → ""
 */
std::string join_path(const Path& path, std::size_t count = static_cast<std::size_t>(-1));

} // namespace treedict

#endif // TREEDICT_PATH_HPP
