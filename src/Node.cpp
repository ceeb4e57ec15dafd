/**
 * @file Node.cpp
 * @brief Document arena and directive tag mapping
 */

#include "overlay/Node.hpp"

namespace overlay {

Directive directive_from_tag(const std::string& tag) {
    if (tag == RESET_TAG) return Directive::Reset;
    if (tag == OVERRIDE_TAG) return Directive::Override;
    return Directive::None;
}

const char* to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::Scalar: return "scalar";
        case NodeKind::Sequence: return "sequence";
        case NodeKind::Mapping: return "mapping";
        case NodeKind::Alias: return "alias";
    }
    return "unknown";
}

Document::Document(std::string name)
    : name_(std::move(name))
{}

Node* Document::make(NodeKind kind) {
    arena_.push_back(std::make_unique<Node>());
    Node* node = arena_.back().get();
    node->kind = kind;
    return node;
}

Node* Document::make_scalar(std::string text, ScalarStyle style) {
    Node* node = make(NodeKind::Scalar);
    node->scalar = std::move(text);
    node->style = style;
    return node;
}

Node* Document::make_sequence() {
    return make(NodeKind::Sequence);
}

Node* Document::make_mapping() {
    return make(NodeKind::Mapping);
}

Node* Document::make_alias(const Node* target) {
    Node* node = make(NodeKind::Alias);
    node->target = target;
    return node;
}

} // namespace overlay
