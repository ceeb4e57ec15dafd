/**
 * @file Loader.cpp
 * @brief Document loading implementation
 *
 * Implements decoding of:
 * - YAML (using yaml-cpp's EventHandler interface)
 * - JSON (using nlohmann::json)
 * - TOML (using toml++)
 *
 * RULE L1-L4: see Loader.hpp.
 */

#include "overlay/Loader.hpp"
#include "overlay/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <yaml-cpp/eventhandler.h>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/mark.h>
#include <yaml-cpp/parser.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace overlay {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

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

/**
 * @brief Convert toml++ value to nlohmann::json.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

const std::string CORE_PREFIX = "tag:yaml.org,2002:";

Node* node_from_value(Document& doc, const Value& value) {
    switch (value.type()) {
        case Value::value_t::object: {
            Node* node = doc.make_mapping();
            for (auto it = value.begin(); it != value.end(); ++it) {
                node->entries.emplace_back(it.key(), node_from_value(doc, it.value()));
            }
            return node;
        }
        case Value::value_t::array: {
            Node* node = doc.make_sequence();
            for (const auto& elem : value) {
                node->items.push_back(node_from_value(doc, elem));
            }
            return node;
        }
        case Value::value_t::string:
            return doc.make_scalar(value.get<std::string>(), ScalarStyle::Quoted);
        case Value::value_t::boolean: {
            Node* node = doc.make_scalar(value.get<bool>() ? "true" : "false");
            node->tag = CORE_PREFIX + "bool";
            return node;
        }
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: {
            Node* node = doc.make_scalar(value.dump());
            node->tag = CORE_PREFIX + "int";
            return node;
        }
        case Value::value_t::number_float: {
            // dump() writes non-finite numbers as "null"
            double d = value.get<double>();
            std::string text = std::isnan(d) ? ".nan"
                             : std::isinf(d) ? (d < 0 ? "-.inf" : ".inf")
                             : value.dump();
            Node* node = doc.make_scalar(text);
            node->tag = CORE_PREFIX + "float";
            return node;
        }
        default:
            return doc.make_scalar("");
    }
}

/**
 * @brief Builds a Document from yaml-cpp parse events
 *
 * Anchors are registered when their node starts, before any child, so an
 * alias inside the anchored subtree already finds its target.
 */
class DocumentBuilder : public YAML::EventHandler {
public:
    explicit DocumentBuilder(Document& doc) : doc_(doc) {}

    void OnDocumentStart(const YAML::Mark&) override {}
    void OnDocumentEnd() override {}

    void OnNull(const YAML::Mark& mark, YAML::anchor_t anchor) override {
        Node* node = doc_.make_scalar("");
        begin(node, mark, "?", anchor);
    }

    void OnAlias(const YAML::Mark& mark, YAML::anchor_t anchor) override {
        auto it = anchors_.find(anchor);
        if (it == anchors_.end()) {
            throw DecodeError(doc_.name(), mark.line + 1, mark.column + 1,
                              "alias refers to an undefined anchor");
        }
        Node* node = doc_.make_alias(it->second);
        begin(node, mark, "?", YAML::NullAnchor);
    }

    void OnScalar(const YAML::Mark& mark, const std::string& tag,
                  YAML::anchor_t anchor, const std::string& value) override {
        // yaml-cpp reports quoted scalars with the non-specific tag "!"
        Node* node = doc_.make_scalar(value, tag == "!" ? ScalarStyle::Quoted
                                                        : ScalarStyle::Plain);
        begin(node, mark, tag, anchor);
    }

    void OnSequenceStart(const YAML::Mark& mark, const std::string& tag,
                         YAML::anchor_t anchor, YAML::EmitterStyle::value) override {
        Node* node = doc_.make_sequence();
        begin(node, mark, tag, anchor);
        open_.push_back(Frame{node, {}, false});
    }

    void OnSequenceEnd() override {
        open_.pop_back();
    }

    void OnMapStart(const YAML::Mark& mark, const std::string& tag,
                    YAML::anchor_t anchor, YAML::EmitterStyle::value) override {
        Node* node = doc_.make_mapping();
        begin(node, mark, tag, anchor);
        open_.push_back(Frame{node, {}, false});
    }

    void OnMapEnd() override {
        open_.pop_back();
    }

    void OnAnchor(const YAML::Mark&, const std::string& anchor_name) override {
        pending_anchor_ = anchor_name;
    }

private:
    struct Frame {
        Node* node;
        std::string key;
        bool has_key;
    };

    void begin(Node* node, const YAML::Mark& mark, const std::string& tag,
               YAML::anchor_t anchor) {
        node->line = mark.line + 1;
        node->column = mark.column + 1;
        if (tag != "?" && tag != "!") {
            node->tag = tag;
            node->directive = directive_from_tag(tag);
        }
        if (anchor != YAML::NullAnchor) {
            anchors_[anchor] = node;
            node->anchor = pending_anchor_;
        }
        pending_anchor_.clear();
        attach(node);
    }

    void attach(Node* node) {
        if (open_.empty()) {
            if (!doc_.root()) {
                doc_.set_root(node);
            }
            return;
        }

        Frame& parent = open_.back();
        if (parent.node->is_sequence()) {
            parent.node->items.push_back(node);
            return;
        }

        if (!parent.has_key) {
            parent.key = key_text(*node);
            parent.has_key = true;
            return;
        }

        parent.node->entries.emplace_back(parent.key, node);
        parent.key.clear();
        parent.has_key = false;
    }

    std::string key_text(const Node& key) const {
        const Node* k = &key;
        if (k->is_alias() && k->target) {
            k = k->target;
        }
        if (!k->is_scalar()) {
            throw DecodeError(doc_.name(), key.line, key.column,
                              std::string("mapping key must be a scalar, found ") +
                              to_string(k->kind));
        }
        return k->scalar;
    }

    Document& doc_;
    std::vector<Frame> open_;
    std::map<YAML::anchor_t, Node*> anchors_;
    std::string pending_anchor_;
};

} // anonymous namespace

// ============================================================================
// Text decoding
// ============================================================================

Document parse_yaml(const std::string& text, const std::string& name) {
    Document doc(name);
    std::istringstream in(text);

    try {
        YAML::Parser parser(in);
        DocumentBuilder builder(doc);
        // RULE L2: first document only
        parser.HandleNextDocument(builder);
    } catch (const YAML::Exception& e) {
        throw DecodeError(name, e.mark.line + 1, e.mark.column + 1, e.msg);
    }

    return doc;
}

Document parse_json(const std::string& text, const std::string& name) {
    try {
        return document_from_value(nlohmann::json::parse(text), name);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(name, 0, 0, e.what());
    }
}

Document parse_toml(const std::string& text, const std::string& name) {
    toml::table table;
    try {
        table = toml::parse(text, name);
    } catch (const toml::parse_error& e) {
        throw DecodeError(
            name,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return document_from_value(toml_value_to_json(table), name);
}

Document document_from_value(const Value& value, const std::string& name) {
    Document doc(name);
    doc.set_root(node_from_value(doc, value));
    return doc;
}

// ============================================================================
// File loading
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    std::string ext = p.extension().string();
    return to_lower(ext);
}

Document load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext != ".yaml" && ext != ".yml" && ext != ".json" && ext != ".toml") {
        throw UnsupportedFormatError(path);
    }

    std::string content = read_file(path);

    if (ext == ".json") {
        return parse_json(content, path);
    }
    if (ext == ".toml") {
        return parse_toml(content, path);
    }
    return parse_yaml(content, path);
}

} // namespace overlay
