/**
 * @file Scalar.hpp
 * @brief Scalar text to typed Value resolution
 *
 * Applied by the Directive Resolver when it builds the resolved tree.
 * Plain scalars follow the YAML 1.2 core schema; first match wins:
 * - S1: Null ("", "~", "null", "Null", "NULL")
 * - S2: Boolean ("true", "True", "TRUE", "false", "False", "FALSE")
 * - S3: Integer (decimal, 0x hex, 0o octal)
 * - S4: Float (decimal with fraction and/or exponent, .inf, .nan)
 * - S5: String (fallback)
 *
 * Quoted scalars are always strings. Core-schema tags (!!str, !!int,
 * !!float, !!bool, !!null) force the type. Merge directives and other tags
 * do not affect typing.
 *
 * Placeholders such as "${VAR:-default}" are strings like any other text;
 * nothing is substituted here.
 */

#ifndef OVERLAY_SCALAR_HPP
#define OVERLAY_SCALAR_HPP

#include "overlay/Node.hpp"
#include "overlay/Value.hpp"
#include <string>

namespace overlay {

/**
 * @brief Resolve a scalar to a typed Value
 *
 * @param text Scalar text as written (without quotes)
 * @param style Plain or quoted
 * @param tag Raw tag ("", "?", "!", "tag:yaml.org,2002:int", "!reset", ...)
 * @return Typed value
 * @throws TypeError if a core-schema tag is given and the text does not
 *         conform to it (path is left empty; the resolver rethrows with it)
 *
 * Examples:
 * ```cpp
 * resolve_scalar("42", ScalarStyle::Plain)        // -> 42 (integer)
 * resolve_scalar("42", ScalarStyle::Quoted)       // -> "42" (string)
 * resolve_scalar("0x1F", ScalarStyle::Plain)      // -> 31
 * resolve_scalar("~", ScalarStyle::Plain)         // -> null
 * resolve_scalar("yes", ScalarStyle::Plain)       // -> "yes" (YAML 1.2)
 * resolve_scalar("1", ScalarStyle::Plain, "tag:yaml.org,2002:str") // -> "1"
 * ```
 */
Value resolve_scalar(const std::string& text, ScalarStyle style,
                     const std::string& tag = "");

/**
 * @brief Resolve a scalar node (text, style and tag taken from the node)
 */
Value resolve_scalar(const Node& node);

} // namespace overlay

#endif // OVERLAY_SCALAR_HPP
