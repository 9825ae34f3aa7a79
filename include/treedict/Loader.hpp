/**
 * @file Loader.hpp
 * @brief Reading and writing nested mappings as documents
 *
 * Loads nested mappings from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * and writes them back as JSON. Loading into OrderedValue keeps the
 * document's key order.
 */

#ifndef TREEDICT_LOADER_HPP
#define TREEDICT_LOADER_HPP

#include "treedict/Value.hpp"
#include <string>

namespace treedict {

/**
 * @brief Load a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed document
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
template <typename BasicJsonType = Value>
BasicJsonType load_json_file(const std::string& path);

/**
 * @brief Load a TOML file.
 *
 * Tables become mappings, arrays become arrays. Dates and times are
 * converted to their TOML text.
 *
 * @param path Path to the TOML file
 * @return Parsed document
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
template <typename BasicJsonType = Value>
BasicJsonType load_toml_file(const std::string& path);

/**
 * @brief Load a document, choosing the format by extension.
 *
 * ".json" is read as JSON, ".toml" as TOML.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if file has syntax errors
 * @throws TreeDictError if the extension is not .json or .toml
 */
template <typename BasicJsonType = Value>
BasicJsonType load_document(const std::string& path);

/**
 * @brief Write a document as JSON.
 *
 * @param path Target file, replaced if it exists
 * @param doc Document to write
 * @param indent Indentation width
 * @throws TreeDictError if the file cannot be written
 */
template <typename BasicJsonType>
void write_json_file(const std::string& path, const BasicJsonType& doc, int indent = 2);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace treedict

#endif // TREEDICT_LOADER_HPP
