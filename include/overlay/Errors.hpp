/**
 * @file Errors.hpp
 * @brief Exception types for overlay errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - CycleError: Alias/merge-key resolution re-entered an in-progress node
 * - DecodeError: Malformed YAML/JSON/TOML input
 * - FileNotFoundError: Input file not found
 * - UnsupportedFormatError: Input file extension not recognized
 * - TypeError: Value of the wrong kind where a specific kind is required
 * - PathSyntaxError: Malformed rendered path
 *
 * Kind mismatches between files during the cross-file merge are not errors;
 * the later file wins.
 */

#ifndef OVERLAY_ERRORS_HPP
#define OVERLAY_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace overlay {

/**
 * @brief Base class for all overlay exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Reference cycle found while expanding aliases or merge keys
 *
 * Fatal to the whole merge. The path is where the offending alias was
 * used, rendered as `x.y[0].z`.
 */
class CycleError : public ConfigError {
public:
    /**
     * @brief Construct with the rendered path of the alias use
     * @param path Rendered path where the cycle was detected
     * @param document Name of the document being resolved (may be empty)
     */
    explicit CycleError(std::string path, std::string document = "")
        : ConfigError("cycle detected at path: " + path)
        , path_(std::move(path))
        , document_(std::move(document))
    {}

    /**
     * @brief Get the rendered path at which the cycle was detected
     */
    const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get the name of the document that contains the cycle
     */
    const std::string& document() const noexcept {
        return document_;
    }

private:
    std::string path_;
    std::string document_;
};

/**
 * @brief Input document could not be decoded
 *
 * Line and column are 1-based; 0 means the position is unknown.
 */
class DecodeError : public ConfigError {
public:
    /**
     * @brief Construct with source name, position and error details
     * @param source File path or document name
     * @param line 1-based line (0 if unknown)
     * @param column 1-based column (0 if unknown)
     * @param details Detailed error message from the decoder
     */
    DecodeError(std::string source, int line, int column, std::string details)
        : ConfigError(format_message(source, line, column, details))
        , source_(std::move(source))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& source, int line,
                                      int column, const std::string& details) {
        std::ostringstream oss;
        oss << "Decode error in '" << source << "'";
        if (line > 0) {
            oss << " at line " << line << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public ConfigError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigError("Input file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Input file extension is not one the loader understands
 */
class UnsupportedFormatError : public ConfigError {
public:
    explicit UnsupportedFormatError(std::string path)
        : ConfigError("Unsupported file format (expected .yaml, .yml, .json or .toml): " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Value of the wrong kind
 *
 * Raised when a merge key (`<<`) resolves to a scalar, or when a scalar
 * does not conform to an explicit core-schema tag such as `!!int`.
 */
class TypeError : public ConfigError {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Rendered path of the offending node
     * @param expected Expected type (e.g., "mapping or sequence")
     * @param actual Actual type encountered (e.g., "string")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Expected " + expected + " but found " + actual +
                      " at path '" + path + "'")
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
 * @brief Rendered path text could not be parsed back into a Path
 */
class PathSyntaxError : public ConfigError {
public:
    PathSyntaxError(std::string text, std::string details)
        : ConfigError("Invalid path '" + text + "': " + details)
        , text_(std::move(text))
        , details_(std::move(details))
    {}

    const std::string& text() const noexcept {
        return text_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string text_;
    std::string details_;
};

} // namespace overlay

#endif // OVERLAY_ERRORS_HPP
