/**
 * @file Merge.hpp
 * @brief Cross-file merge engine
 *
 * Folds resolved documents, in file order, into one accumulated tree.
 * Precedence rules, applied recursively at matching Paths:
 * - P1: Path tagged "!override" in the incoming document: incoming value
 *       replaces the accumulated one wholesale
 * - P2: Both objects: deep merge (one-sided keys kept, shared keys recurse)
 * - P3: Both arrays: incoming replaces (SequencePolicy::Replace), or its new
 *       elements are appended (SequencePolicy::AppendUnique)
 * - P4: Anything else, including mismatched kinds: incoming replaces
 * - P5: A reset sequence element is applied when its document is folded,
 *       to the accumulated sequence at the element's position, before the
 *       document's own sequence is merged in
 *
 * Reset Paths of mapping keys are collected across files and only applied
 * by finish(), so a reset in a later file also removes what earlier files
 * contributed. Element positions shift from file to file, so element
 * resets are not carried forward to later files.
 */

#ifndef OVERLAY_MERGE_HPP
#define OVERLAY_MERGE_HPP

#include "overlay/Path.hpp"
#include "overlay/Resolver.hpp"
#include "overlay/Value.hpp"

namespace overlay {

/**
 * @brief How two sequences at the same Path combine across files
 */
enum class SequencePolicy {
    Replace,      ///< later file's sequence wins
    AppendUnique  ///< later file's elements appended unless already present
};

/**
 * @brief Options for one merge
 */
struct MergeOptions {
    SequencePolicy sequences = SequencePolicy::Replace;

    /// Apply recorded resets (P5 and finish()); when false they are only reported
    bool apply_resets = true;
};

/**
 * @brief Outcome of a full merge
 */
struct MergeResult {
    /// Merged tree (resets already removed when MergeOptions::apply_resets)
    Value tree = Value::object();

    /// Every reset Path recorded by any document, element resets included
    PathSet resets;
};

/**
 * @brief Append elements of extra not already present in target
 *
 * Equality is Value equality. Order: target's elements first, then the new
 * ones in extra's order.
 *
 * Example:
 * ```cpp
 * Value f = {"a", "b"};
 * append_unique(f, Value{"b", "c", "a", "d"});
 * // f == ["a", "b", "c", "d"]
 * ```
 */
void append_unique(Value& target, const Value& extra);

/**
 * @brief Merge one incoming tree into the accumulated tree
 *
 * @param accumulated Tree built so far (modified in place)
 * @param incoming Next document's resolved tree
 * @param overrides Override Paths recorded for the incoming document
 * @param options Sequence policy
 *
 * Examples:
 * ```cpp
 * // P2: nested objects are merged
 * Value acc = {{"db", {{"host", "a"}, {"port", 1}}}};
 * merge_into(acc, {{"db", {{"port", 2}}}}, {});
 * // acc: {"db": {"host": "a", "port": 2}}
 *
 * // P1: override replaces the whole subtree
 * merge_into(acc, {{"db", {{"port", 3}}}}, {Path::parse("db")});
 * // acc: {"db": {"port": 3}}
 * ```
 */
void merge_into(Value& accumulated, const Value& incoming,
                const PathSet& overrides, const MergeOptions& options = {});

/**
 * @brief Accumulates resolved documents in file order
 *
 * Usage:
 * ```cpp
 * MergeEngine engine;
 * for (const auto& doc : documents) {
 *     engine.fold(resolve_directives(doc));
 * }
 * MergeResult result = engine.finish();
 * ```
 */
class MergeEngine {
public:
    explicit MergeEngine(MergeOptions options = {});

    /**
     * @brief Fold the next document
     *
     * Its mapping-key resets join the set applied by finish(); its sequence
     * element resets are applied to the accumulated tree right away (P5).
     */
    void fold(const Resolution& resolution);

    /**
     * @brief Fold a plain tree (no directives recorded)
     */
    void fold(const Value& tree, const PathSet& overrides = {});

    /**
     * @brief Tree accumulated so far, before resets
     */
    const Value& tree() const noexcept { return tree_; }
    const PathSet& resets() const noexcept { return resets_; }
    std::size_t folded() const noexcept { return folded_; }

    /**
     * @brief Hand the result over; the engine is left empty
     */
    MergeResult finish();

private:
    MergeOptions options_;
    Value tree_;
    PathSet resets_;      // every recorded reset, for reporting
    PathSet tombstones_;  // mapping-key resets pending until finish()
    std::size_t folded_ = 0;
};

} // namespace overlay

#endif // OVERLAY_MERGE_HPP
