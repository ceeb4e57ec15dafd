/**
 * @file Resolver.cpp
 * @brief Implementation of the Directive Resolver
 */

#include "overlay/Resolver.hpp"
#include "overlay/CycleTracker.hpp"
#include "overlay/Errors.hpp"
#include "overlay/Merge.hpp"
#include "overlay/Scalar.hpp"
#include <utility>
#include <vector>

namespace overlay {

namespace {

/**
 * @brief State of one resolve_directives() call
 *
 * Lives only for the duration of that call; nothing is shared between
 * documents.
 */
class DirectiveResolver {
public:
    explicit DirectiveResolver(const Document& document)
        : document_(document)
        , tracker_(document.name())
    {}

    Resolution run() {
        Resolution out;
        if (document_.root()) {
            out.tree = resolve(*document_.root(), Path());
        }
        out.resets = std::move(resets_);
        out.overrides = std::move(overrides_);
        return out;
    }

private:
    std::optional<Value> resolve(const Node& node, const Path& path) {
        // R1: expand at the point of use
        if (node.is_alias()) {
            if (!node.target) {
                throw DecodeError(document_.name(), node.line, node.column,
                                  "alias has no target");
            }
            tracker_.check(*node.target, path);
            return resolve(*node.target, path);
        }

        switch (node.directive) {
            case Directive::Reset:
                // R4
                resets_.insert(path);
                return std::nullopt;
            case Directive::Override:
                // R5
                overrides_.insert(path);
                break;
            case Directive::None:
                break;
        }

        switch (node.kind) {
            case NodeKind::Sequence:
                return resolve_sequence(node, path);
            case NodeKind::Mapping:
                return resolve_mapping(node, path);
            case NodeKind::Scalar:
            case NodeKind::Alias:
                break;
        }
        return resolve_scalar_at(node, path);
    }

    Value resolve_scalar_at(const Node& node, const Path& path) {
        try {
            return resolve_scalar(node);
        } catch (const TypeError& e) {
            throw TypeError(path.render(), e.expected(), e.actual());
        }
    }

    /**
     * @brief Target of an element that gets spliced into its parent (R2)
     */
    static const Node* spliced_sequence(const Node& item) {
        if (!item.is_alias() || !item.target) return nullptr;
        const Node* target = item.target;
        if (!target->is_sequence() || target->directive != Directive::None) {
            return nullptr;
        }
        return target;
    }

    static bool is_reset(const Node& item) {
        const Node* n = item.is_alias() ? item.target : &item;
        return n && n->directive == Directive::Reset;
    }

    /**
     * @brief Resolve the items of seq into out, splicing nested
     *        alias-to-sequence elements at every level (R2)
     *
     * slot counts every element written, including reset ones. A reset
     * element is recorded at its slot; a surviving element is addressed by
     * the index it takes in out.
     */
    void splice_items(const Node& seq, const Path& path, Value& out,
                      std::size_t& slot) {
        for (const Node* item : seq.items) {
            if (const Node* inner = spliced_sequence(*item)) {
                tracker_.check(*inner, path.descend(out.size()));
                auto inner_guard = tracker_.enter(*inner, path);
                splice_items(*inner, path, out, slot);
                continue;
            }

            const std::size_t index = is_reset(*item) ? slot : out.size();
            ++slot;
            auto value = resolve(*item, path.descend(index));
            if (value) {
                out.push_back(std::move(*value));
            }
        }
    }

    Value resolve_sequence(const Node& node, const Path& path) {
        auto guard = tracker_.enter(node, path);
        Value out = Value::array();
        std::size_t slot = 0;
        splice_items(node, path, out, slot);
        return out;
    }

    Value resolve_mapping(const Node& node, const Path& path) {
        auto guard = tracker_.enter(node, path);
        Value fields = Value::object();
        std::vector<Value> sources;

        for (const auto& entry : node.entries) {
            const std::string& key = entry.first;
            const Node& child = *entry.second;

            if (key == MERGE_KEY) {
                // R3: resolved where the mapping itself lives
                auto merged = resolve(child, path);
                if (merged) {
                    collect_merge_sources(std::move(*merged), path, sources);
                }
                continue;
            }

            auto value = resolve(child, path.descend(key));
            if (value) {
                fields[key] = std::move(*value);
            }
        }

        for (const auto& source : sources) {
            fold_merge_source(fields, source);
        }

        return fields;
    }

    static void collect_merge_sources(Value merged, const Path& path,
                                      std::vector<Value>& sources) {
        if (merged.is_null()) {
            return;
        }
        if (merged.is_object()) {
            sources.push_back(std::move(merged));
            return;
        }
        if (merged.is_array()) {
            for (auto& element : merged) {
                if (!element.is_object()) {
                    throw TypeError(path.render(), "mapping", type_name(element));
                }
                sources.push_back(std::move(element));
            }
            return;
        }
        throw TypeError(path.render(), "mapping or sequence", type_name(merged));
    }

    const Document& document_;
    CycleTracker tracker_;
    PathSet resets_;
    PathSet overrides_;
};

} // anonymous namespace

void fold_merge_source(Value& fields, const Value& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& incoming = it.value();

        auto found = fields.find(key);
        if (found == fields.end()) {
            // M1
            fields[key] = incoming;
            continue;
        }

        Value& existing = *found;
        if (existing.is_array() && incoming.is_array()) {
            // M2
            append_unique(existing, incoming);
        } else if (!is_container(existing) && !is_container(incoming)) {
            // M3: the merge source wins over the local field
            existing = incoming;
        }
        // M4: left as written locally
    }
}

Resolution resolve_directives(const Document& document) {
    DirectiveResolver resolver(document);
    return resolver.run();
}

} // namespace overlay
