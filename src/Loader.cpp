/**
 * @file Loader.cpp
 * @brief Document loading implementation
 *
 * Implements file loading for:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 */

#include "treedict/Loader.hpp"
#include "treedict/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace treedict {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
std::string to_text(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

/**
 * @brief Convert toml++ node to a nested mapping value.
 */
template <typename BasicJsonType>
BasicJsonType toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return BasicJsonType(node.as_string()->get());

        case toml::node_type::integer:
            return BasicJsonType(node.as_integer()->get());

        case toml::node_type::floating_point:
            return BasicJsonType(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return BasicJsonType(node.as_boolean()->get());

        case toml::node_type::date:
            return BasicJsonType(to_text(node.as_date()->get()));

        case toml::node_type::time:
            return BasicJsonType(to_text(node.as_time()->get()));

        case toml::node_type::date_time:
            return BasicJsonType(to_text(node.as_date_time()->get()));

        case toml::node_type::array: {
            BasicJsonType arr = BasicJsonType::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json<BasicJsonType>(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            BasicJsonType obj = BasicJsonType::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json<BasicJsonType>(val);
            }
            return obj;
        }

        default:
            return BasicJsonType(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

template <typename BasicJsonType>
BasicJsonType load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);

    try {
        return BasicJsonType::parse(content);
    } catch (const typename BasicJsonType::parse_error& e) {
        throw ParseError(path, e.what());
    }
}

template <typename BasicJsonType>
void write_json_file(const std::string& path, const BasicJsonType& doc, int indent) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw TreeDictError("Cannot write file: " + path);
    }
    out << doc.dump(indent) << "\n";
    if (!out) {
        throw TreeDictError("Failed writing file: " + path);
    }
}

// ============================================================================
// TOML
// ============================================================================

template <typename BasicJsonType>
BasicJsonType load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw ParseError(path, details.str());
    }

    return toml_value_to_json<BasicJsonType>(table);
}

// ============================================================================
// Auto-detect
// ============================================================================

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

template <typename BasicJsonType>
BasicJsonType load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file<BasicJsonType>(path);
    }
    if (ext == ".toml") {
        return load_toml_file<BasicJsonType>(path);
    }
    throw TreeDictError("Unsupported document type: '" + ext + "' (expected .json or .toml)");
}

template Value load_json_file<Value>(const std::string&);
template Value load_toml_file<Value>(const std::string&);
template Value load_document<Value>(const std::string&);
template void write_json_file<Value>(const std::string&, const Value&, int);

template OrderedValue load_json_file<OrderedValue>(const std::string&);
template OrderedValue load_toml_file<OrderedValue>(const std::string&);
template OrderedValue load_document<OrderedValue>(const std::string&);
template void write_json_file<OrderedValue>(const std::string&, const OrderedValue&, int);

} // namespace treedict
