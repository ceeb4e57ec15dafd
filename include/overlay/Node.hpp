/**
 * @file Node.hpp
 * @brief Generic document model handed to the Directive Resolver
 *
 * A Document is a graph of Nodes as a format decoder sees them, before any
 * alias is expanded: scalars, sequences, mappings and alias references,
 * each optionally carrying a tag, an anchor name and a merge directive.
 *
 * All nodes of one Document live in its arena. Children and alias targets
 * are non-owning pointers into that arena, so an anchor may be referenced
 * from inside its own subtree without creating an ownership cycle.
 */

#ifndef OVERLAY_NODE_HPP
#define OVERLAY_NODE_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace overlay {

/// Reserved mapping key whose value is folded into its siblings.
constexpr const char* MERGE_KEY = "<<";

/// Tag selecting tombstone deletion of a subtree.
constexpr const char* RESET_TAG = "!reset";

/// Tag selecting wholesale replacement of a subtree by a later file.
constexpr const char* OVERRIDE_TAG = "!override";

enum class NodeKind { Scalar, Sequence, Mapping, Alias };

/**
 * @brief Per-node merge directive
 */
enum class Directive { None, Override, Reset };

/**
 * @brief How a scalar was written; only plain scalars are type-resolved
 */
enum class ScalarStyle { Plain, Quoted };

/**
 * @brief Map a raw tag to its directive ("!reset", "!override", or none)
 */
Directive directive_from_tag(const std::string& tag);

const char* to_string(NodeKind kind);

struct Node;

/// One mapping entry: literal key text and its value node.
using MappingEntry = std::pair<std::string, const Node*>;

/**
 * @brief One node of the document graph
 *
 * Which members are meaningful depends on kind:
 * - Scalar: scalar, style
 * - Sequence: items
 * - Mapping: entries (source order, duplicates allowed, last one wins)
 * - Alias: target
 */
struct Node {
    NodeKind kind = NodeKind::Scalar;
    Directive directive = Directive::None;
    std::string tag;
    std::string anchor;

    std::string scalar;
    ScalarStyle style = ScalarStyle::Plain;

    std::vector<const Node*> items;
    std::vector<MappingEntry> entries;

    const Node* target = nullptr;

    /// 1-based source position, 0 when unknown
    int line = 0;
    int column = 0;

    bool is_scalar() const noexcept { return kind == NodeKind::Scalar; }
    bool is_sequence() const noexcept { return kind == NodeKind::Sequence; }
    bool is_mapping() const noexcept { return kind == NodeKind::Mapping; }
    bool is_alias() const noexcept { return kind == NodeKind::Alias; }
};

/**
 * @brief Arena owning every node of one decoded document
 *
 * Documents are move-only; moving keeps node addresses stable.
 *
 * Example (by hand, equivalent to `a: &x 1` / `b: *x`):
 * ```cpp
 * Document doc("inline");
 * Node* root = doc.make_mapping();
 * Node* one = doc.make_scalar("1");
 * one->anchor = "x";
 * root->entries.emplace_back("a", one);
 * root->entries.emplace_back("b", doc.make_alias(one));
 * doc.set_root(root);
 * ```
 */
class Document {
public:
    explicit Document(std::string name = "");

    Document(Document&&) noexcept = default;
    Document& operator=(Document&&) noexcept = default;
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    const std::string& name() const noexcept { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    /**
     * @brief Root node, or nullptr for an empty document
     */
    const Node* root() const noexcept { return root_; }
    void set_root(const Node* root) noexcept { root_ = root; }
    bool empty() const noexcept { return root_ == nullptr; }

    Node* make(NodeKind kind);
    Node* make_scalar(std::string text, ScalarStyle style = ScalarStyle::Plain);
    Node* make_sequence();
    Node* make_mapping();
    Node* make_alias(const Node* target);

    std::size_t node_count() const noexcept { return arena_.size(); }

private:
    std::string name_;
    std::vector<std::unique_ptr<Node>> arena_;
    const Node* root_ = nullptr;
};

} // namespace overlay

#endif // OVERLAY_NODE_HPP
