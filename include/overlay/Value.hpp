/**
 * @file Value.hpp
 * @brief Value type for resolved documents
 *
 * A resolved tree is an nlohmann::json: YAML mappings become objects,
 * sequences become arrays and scalars become null, bool, int64, double or
 * string according to the core schema (see Scalar.hpp).
 *
 * Objects keep their keys sorted, so two merges of the same inputs always
 * iterate (and print) identically.
 */

#ifndef OVERLAY_VALUE_HPP
#define OVERLAY_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace overlay {

/**
 * @brief JSON-like value type for resolved and merged trees
 *
 * Alias for nlohmann::json. The Directive Resolver produces one per
 * document, and the merge engine folds them into a single accumulated one.
 */
using Value = nlohmann::json;

/**
 * @brief Name of a Value's kind in YAML terms, for error messages
 * @return "null", "bool", "int", "float", "string", "sequence" or "mapping"
 */
inline std::string type_name(const Value& val) {
    switch (val.type()) {
        case Value::value_t::null:            return "null";
        case Value::value_t::boolean:         return "bool";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return "int";
        case Value::value_t::number_float:    return "float";
        case Value::value_t::string:          return "string";
        case Value::value_t::array:           return "sequence";
        case Value::value_t::object:          return "mapping";
        default:                              return "binary";
    }
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace overlay

#endif // OVERLAY_VALUE_HPP
