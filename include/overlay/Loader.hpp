/**
 * @file Loader.hpp
 * @brief Decoding YAML, JSON and TOML text into Documents
 *
 * Implements loading documents from:
 * - YAML (using yaml-cpp's event parser, keeping anchors, aliases, tags
 *   and scalar style)
 * - JSON (using nlohmann::json)
 * - TOML (using toml++)
 *
 * RULE L1: Only YAML carries anchors, aliases and "!reset"/"!override";
 *          JSON and TOML documents are plain trees.
 * RULE L2: Only the first document of a YAML stream is read; an empty
 *          stream gives an empty Document.
 * RULE L3: Decoder failures become DecodeError with 1-based positions.
 * RULE L4: load_document() picks the format from the file extension.
 */

#ifndef OVERLAY_LOADER_HPP
#define OVERLAY_LOADER_HPP

#include "overlay/Node.hpp"
#include "overlay/Value.hpp"
#include <string>

namespace overlay {

// ============================================================================
// Text decoding (RULE L1-L3)
// ============================================================================

/**
 * @brief Build a Document from YAML text
 *
 * @param text YAML source
 * @param name Document name used in errors (e.g. the file path)
 * @return Document graph with alias links and directives intact
 * @throws DecodeError on YAML syntax errors, non-scalar mapping keys or
 *         aliases to undefined anchors
 *
 * Example:
 * ```cpp
 * Document doc = parse_yaml("networks:\n  test: !reset {}\n", "override.yaml");
 * // doc.root()->entries[0].second->entries[0].second->directive == Directive::Reset
 * ```
 */
Document parse_yaml(const std::string& text, const std::string& name = "(inline)");

/**
 * @brief Build a Document from JSON text
 * @throws DecodeError if JSON syntax is invalid
 */
Document parse_json(const std::string& text, const std::string& name = "(inline)");

/**
 * @brief Build a Document from TOML text
 * @throws DecodeError if TOML syntax is invalid
 */
Document parse_toml(const std::string& text, const std::string& name = "(inline)");

/**
 * @brief Build a Document mirroring an existing Value
 *
 * Strings become quoted scalars; other scalars carry their core-schema tag
 * so they resolve back to exactly the same Value.
 */
Document document_from_value(const Value& value, const std::string& name = "(inline)");

// ============================================================================
// File loading (RULE L4)
// ============================================================================

/**
 * @brief Load a document from file, detecting format by extension
 *
 * .yaml / .yml -> YAML, .json -> JSON, .toml -> TOML (case-insensitive).
 * The Document is named after the path.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws UnsupportedFormatError if the extension is not recognized
 * @throws DecodeError if the file has syntax errors
 */
Document load_document(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".yaml"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace overlay

#endif // OVERLAY_LOADER_HPP
