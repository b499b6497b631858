/**
 * @file Errors.hpp
 * @brief Exception types for strata configuration errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - ConfigParseError: Structural failure (TOML syntax, unknown field,
 *   wrong value type, settings materialization). Always fatal.
 * - SourceUnavailableError: A document could not be obtained. Only fatal
 *   when no document is available at all.
 * - SchemaError: Typed settings conversion failed at a field path
 * - KeyParseError: Invalid key notation ("C-x", "A-F12", ...)
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 */

#ifndef STRATA_ERRORS_HPP
#define STRATA_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace strata {

/**
 * @brief Base class for all strata exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Structural failure in a configuration document
 *
 * Raised for syntax errors, schema violations found while reading the raw
 * document, and errors found while materializing editor settings.
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with source name and error details
     * @param source Name of the document (usually its path)
     * @param details Detailed error message
     */
    ConfigParseError(std::string source, std::string details)
        : ConfigParseError(std::move(source), 0, 0, std::move(details))
    {}

    /**
     * @brief Construct with a source position
     * @param source Name of the document
     * @param line 1-based line, or 0 when unknown
     * @param column 1-based column, or 0 when unknown
     * @param details Detailed error message
     */
    ConfigParseError(std::string source, int line, int column, std::string details)
        : ConfigError(format_message(source, line, column, details))
        , source_(std::move(source))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept { return source_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string source_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& source, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + source + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) + ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief A configuration source could not be obtained
 *
 * A missing or unreadable file. The resolver treats such a source as
 * contributing nothing and only raises this when both sources are
 * unavailable.
 */
class SourceUnavailableError : public ConfigError {
public:
    SourceUnavailableError(std::string source, std::string cause)
        : ConfigError("Configuration source unavailable: " + source + " (" + cause + ")")
        , source_(std::move(source))
        , cause_(std::move(cause))
    {}

    const std::string& source() const noexcept { return source_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    std::string source_;
    std::string cause_;
};

/**
 * @brief Editor settings do not match the typed schema
 *
 * The path names the offending field in dot notation, e.g.
 * "search.smart-case". An empty path refers to the settings root.
 */
class SchemaError : public ConfigError {
public:
    SchemaError(std::string path, std::string reason)
        : ConfigError(path.empty() ? reason : reason + " (at '" + path + "')")
        , path_(std::move(path))
        , reason_(std::move(reason))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string path_;
    std::string reason_;
};

/**
 * @brief Key notation could not be parsed
 */
class KeyParseError : public ConfigError {
public:
    KeyParseError(std::string notation, std::string reason)
        : ConfigError(reason + ": '" + notation + "'")
        , notation_(std::move(notation))
    {}

    const std::string& notation() const noexcept { return notation_; }

private:
    std::string notation_;
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public ConfigError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "editor.scrolloff")
     * @param segment The specific segment that doesn't exist
     */
    KeyError(std::string path, std::string segment)
        : ConfigError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a non-container type
 * (e.g., "editor.scrolloff.x").
 */
class TypeError : public ConfigError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Cannot traverse into " + actual +
                      " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace strata

#endif // STRATA_ERRORS_HPP
