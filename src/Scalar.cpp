/**
 * @file Scalar.cpp
 * @brief Implementation of scalar resolution
 */

#include "overlay/Scalar.hpp"
#include "overlay/Errors.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <regex>

namespace overlay {

namespace {
    const std::string CORE_PREFIX = "tag:yaml.org,2002:";

    /**
     * @brief Reduce "!!int" and "tag:yaml.org,2002:int" to "int"
     * @return Core type name, or empty for non-core tags
     */
    std::string core_type(const std::string& tag) {
        if (tag.compare(0, CORE_PREFIX.size(), CORE_PREFIX) == 0) {
            return tag.substr(CORE_PREFIX.size());
        }
        if (tag.size() > 2 && tag.compare(0, 2, "!!") == 0) {
            return tag.substr(2);
        }
        return "";
    }

    bool matches_regex(const std::string& str, const std::regex& re) {
        return std::regex_match(str, re);
    }

    const std::regex& decimal_re() {
        static const std::regex re("^[-+]?[0-9]+$");
        return re;
    }

    const std::regex& hex_re() {
        static const std::regex re("^0x[0-9a-fA-F]+$");
        return re;
    }

    const std::regex& octal_re() {
        static const std::regex re("^0o[0-7]+$");
        return re;
    }

    const std::regex& float_re() {
        static const std::regex re("^[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?$");
        return re;
    }

    const std::regex& inf_re() {
        static const std::regex re("^[-+]?(\\.inf|\\.Inf|\\.INF)$");
        return re;
    }

    const std::regex& nan_re() {
        static const std::regex re("^(\\.nan|\\.NaN|\\.NAN)$");
        return re;
    }

    bool is_null_text(const std::string& s) {
        return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
    }

    std::optional<bool> parse_bool(const std::string& s) {
        if (s == "true" || s == "True" || s == "TRUE") return true;
        if (s == "false" || s == "False" || s == "FALSE") return false;
        return std::nullopt;
    }

    std::optional<int64_t> parse_integer(const std::string& s) {
        try {
            size_t pos = 0;
            long long val = 0;
            if (matches_regex(s, decimal_re())) {
                val = std::stoll(s, &pos, 10);
            } else if (matches_regex(s, hex_re())) {
                val = std::stoll(s.substr(2), &pos, 16);
                pos += 2;
            } else if (matches_regex(s, octal_re())) {
                val = std::stoll(s.substr(2), &pos, 8);
                pos += 2;
            } else {
                return std::nullopt;
            }
            if (pos == s.size()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too large for int64; not an integer under this schema
        }
        return std::nullopt;
    }

    std::optional<double> parse_float(const std::string& s) {
        if (matches_regex(s, inf_re())) {
            return s[0] == '-' ? -std::numeric_limits<double>::infinity()
                               : std::numeric_limits<double>::infinity();
        }
        if (matches_regex(s, nan_re())) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (matches_regex(s, float_re())) {
            try {
                size_t pos = 0;
                double val = std::stod(s, &pos);
                if (pos == s.size()) {
                    return val;
                }
            } catch (const std::out_of_range&) {
                // Overflows double; left as string
            }
        }
        return std::nullopt;
    }

    Value resolve_plain(const std::string& text) {
        // S1: Null
        if (is_null_text(text)) {
            return nullptr;
        }

        // S2: Boolean
        if (auto b = parse_bool(text)) {
            return *b;
        }

        // S3: Integer
        if (auto i = parse_integer(text)) {
            return *i;
        }

        // S4: Float
        if (auto f = parse_float(text)) {
            return *f;
        }

        // S5: String
        return text;
    }

    Value resolve_tagged(const std::string& text, const std::string& type) {
        if (type == "str") {
            return text;
        }
        if (type == "null") {
            if (is_null_text(text)) return nullptr;
            throw TypeError("", "null", "'" + text + "'");
        }
        if (type == "bool") {
            if (auto b = parse_bool(text)) return *b;
            throw TypeError("", "bool", "'" + text + "'");
        }
        if (type == "int") {
            if (auto i = parse_integer(text)) return *i;
            throw TypeError("", "int", "'" + text + "'");
        }
        if (type == "float") {
            if (auto i = parse_integer(text)) return static_cast<double>(*i);
            if (auto f = parse_float(text)) return *f;
            throw TypeError("", "float", "'" + text + "'");
        }
        // Other core tags (binary, timestamp, ...) stay textual
        return text;
    }
}

Value resolve_scalar(const std::string& text, ScalarStyle style,
                     const std::string& tag) {
    const std::string type = core_type(tag);
    if (!type.empty()) {
        return resolve_tagged(text, type);
    }

    if (style == ScalarStyle::Quoted) {
        return text;
    }

    return resolve_plain(text);
}

Value resolve_scalar(const Node& node) {
    return resolve_scalar(node.scalar, node.style, node.tag);
}

} // namespace overlay
