/**
 * @file Errors.hpp
 * @brief Exception types for treedict
 *
 * Error taxonomy:
 * - TreeDictError: Base class
 * - KeyError: Path key not found
 * - TypeError: Traversal into a non-mapping
 * - EmptyPathError: Write operation without a key
 * - FileNotFoundError: Document file not found
 * - ParseError: JSON/TOML syntax errors
 */

#ifndef TREEDICT_ERRORS_HPP
#define TREEDICT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace treedict {

/**
 * @brief Base class for all treedict exceptions
 */
class TreeDictError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Key not found during path traversal
 *
 * Raised when a key in a path does not exist and no default was given.
 */
class KeyError : public TreeDictError {
public:
    /**
     * @brief Construct with full path and failing key
     * @param path Full dot-path being accessed (e.g., "database.host")
     * @param segment The specific key that doesn't exist (e.g., "host")
     */
    KeyError(std::string path, std::string segment)
        : TreeDictError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    /**
     * @brief Get the full dot-path that was being accessed
     */
    const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get the specific key that was not found
     */
    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during path traversal
 *
 * Raised when a mapping is required but another type is found
 * (e.g., accessing "scalar_value.sub_key").
 */
class TypeError : public TreeDictError {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Full dot-path being accessed
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : TreeDictError("Cannot traverse into " + actual +
                        " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A write operation was given an empty path
 */
class EmptyPathError : public TreeDictError {
public:
    explicit EmptyPathError(const std::string& operation)
        : TreeDictError(operation + "() requires a non-empty path")
    {}
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public TreeDictError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : TreeDictError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax)
 */
class ParseError : public TreeDictError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ParseError(std::string file, std::string details)
        : TreeDictError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

} // namespace treedict

#endif // TREEDICT_ERRORS_HPP
