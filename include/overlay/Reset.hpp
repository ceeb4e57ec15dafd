/**
 * @file Reset.hpp
 * @brief Reset Applier: tombstone deletion after all files are merged
 */

#ifndef OVERLAY_RESET_HPP
#define OVERLAY_RESET_HPP

#include "overlay/Path.hpp"
#include "overlay/Value.hpp"

namespace overlay {

/**
 * @brief Remove every key or element whose Path is in resets
 *
 * Matching is exact: a recorded Path removes the node at that address and,
 * with it, everything below; a descendant is never matched through its
 * parent's Path. Sequence elements are addressed by the index they had
 * before any removal in the same sequence. A reset of the root Path clears
 * the tree to an empty object.
 *
 * @param tree Merged tree (modified in place)
 * @param resets Reset Paths collected from every document
 * @return Number of keys/elements removed
 *
 * Example:
 * ```cpp
 * Value t = {{"networks", {{"test", {{"external", true}}}, {"front", {}}}}};
 * apply_resets(t, {Path::parse("networks.test")});
 * // t: {"networks": {"front": {}}}
 * ```
 */
std::size_t apply_resets(Value& tree, const PathSet& resets);

} // namespace overlay

#endif // OVERLAY_RESET_HPP
