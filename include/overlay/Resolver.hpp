/**
 * @file Resolver.hpp
 * @brief Directive Resolver: one document graph to one directive-free tree
 *
 * Walks a Document depth-first, tracking the Path of every node, and builds
 * a fresh Value tree. The input graph is never modified.
 *
 * Rules:
 * - R1: An alias is resolved by resolving its target at the alias's own
 *       Path, so directives and cycle checks apply where the alias is used
 * - R2: A sequence element that is an alias to a sequence is replaced by
 *       that sequence's elements, recursively, so "*b" contributes exactly
 *       the resolved value of b with no extra nesting
 * - R3: The value of a "<<" key is resolved at the enclosing mapping's Path
 *       and folded into the sibling fields once they are all resolved
 *       (see fold_merge_source)
 * - R4: "!reset" records the Path in resets and yields no value; the key or
 *       element holding it is dropped. A reset sequence element is recorded
 *       at its position among all written elements, so two adjacent resets
 *       in [!reset a, !reset b, c] record [0] and [1]
 * - R5: "!override" records the Path in overrides; the value passes through
 * - R6: Re-entering a node that is still being resolved throws CycleError
 */

#ifndef OVERLAY_RESOLVER_HPP
#define OVERLAY_RESOLVER_HPP

#include "overlay/Node.hpp"
#include "overlay/Path.hpp"
#include "overlay/Value.hpp"
#include <optional>

namespace overlay {

/**
 * @brief Result of resolving one document
 */
struct Resolution {
    /// Resolved tree; absent for an empty document or a reset root
    std::optional<Value> tree;

    /// Paths tagged "!reset"; applied once, after every file is merged
    PathSet resets;

    /// Paths tagged "!override"; consulted while this document is merged
    PathSet overrides;
};

/**
 * @brief Resolve aliases, merge keys and directives of one document
 *
 * @param document Decoded document graph
 * @return Directive-free tree plus the recorded reset and override Paths
 * @throws CycleError if an alias or merge key refers back into a node that
 *         is still being resolved
 * @throws TypeError if a merge key resolves to a scalar, or a scalar does
 *         not conform to its core-schema tag
 *
 * Example:
 * ```cpp
 * // x-base: &base {image: alpine}
 * // web: {<<: *base, ports: !override [80]}
 * Resolution r = resolve_directives(doc);
 * // r.tree:      {"x-base": {"image": "alpine"},
 * //               "web": {"image": "alpine", "ports": [80]}}
 * // r.overrides: {web.ports}
 * ```
 */
Resolution resolve_directives(const Document& document);

/**
 * @brief Fold a merge source into the ordinary fields of one mapping level
 *
 * For each key of source:
 * - M1: missing in fields: added
 * - M2: both sequences: source elements appended, skipping elements equal
 *       to one already present
 * - M3: both scalars: source value overwrites the field
 * - M4: any mapping involved, or sequence against scalar: field untouched
 *
 * @param fields Resolved ordinary fields (object, modified in place)
 * @param source Resolved merge-key mapping
 */
void fold_merge_source(Value& fields, const Value& source);

} // namespace overlay

#endif // OVERLAY_RESOLVER_HPP
