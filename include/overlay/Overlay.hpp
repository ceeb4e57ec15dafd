/**
 * @file Overlay.hpp
 * @brief Top-level entry points: load, resolve and merge a list of files
 */

#ifndef OVERLAY_OVERLAY_HPP
#define OVERLAY_OVERLAY_HPP

#include "overlay/Merge.hpp"
#include "overlay/Node.hpp"
#include <string>
#include <vector>

namespace overlay {

/**
 * @brief Options for merging a list of files.
 */
struct LoadOptions {
    std::vector<std::string> files; // lowest precedence first
    MergeOptions merge;
};

/**
 * @brief Resolve each document and fold it, in order; later documents win
 *
 * @param documents Parsed documents, lowest precedence first
 * @param options Sequence policy and reset handling
 * @return Merged tree plus every recorded reset Path
 * @throws CycleError if any document contains a reference cycle
 */
MergeResult merge_documents(const std::vector<Document>& documents,
                            const MergeOptions& options = {});

/**
 * @brief Load every file (format by extension), then merge_documents()
 *
 * A file that fails to load aborts the whole merge.
 *
 * @throws FileNotFoundError, UnsupportedFormatError, DecodeError, CycleError
 */
MergeResult load_and_merge(const LoadOptions& opts);

} // namespace overlay

#endif // OVERLAY_OVERLAY_HPP
