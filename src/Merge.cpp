/**
 * @file Merge.cpp
 * @brief Implementation of the cross-file merge engine
 */

#include "overlay/Merge.hpp"
#include "overlay/Reset.hpp"
#include <algorithm>

namespace overlay {

namespace {

void merge_at(Value& accumulated, const Value& incoming, const Path& path,
              const PathSet& overrides, const MergeOptions& options) {
    // RULE P1: override stops the recursion here
    if (overrides.count(path) != 0) {
        accumulated = incoming;
        return;
    }

    // RULE P2: Both are objects → recursive merge
    if (accumulated.is_object() && incoming.is_object()) {
        for (auto it = incoming.begin(); it != incoming.end(); ++it) {
            const auto& key = it.key();
            auto found = accumulated.find(key);
            if (found != accumulated.end()) {
                merge_at(*found, it.value(), path.descend(key), overrides, options);
            } else {
                accumulated[key] = it.value();
            }
        }
        return;
    }

    // RULE P3: Both are arrays
    if (accumulated.is_array() && incoming.is_array()
        && options.sequences == SequencePolicy::AppendUnique) {
        append_unique(accumulated, incoming);
        return;
    }

    // RULE P3/P4: Incoming replaces
    accumulated = incoming;
}

/**
 * @brief True for a Path addressing a sequence element
 */
bool is_element_path(const Path& path) {
    return !path.empty() && path.segments().back().is_index();
}

} // anonymous namespace

void append_unique(Value& target, const Value& extra) {
    const size_t original = target.size();
    for (const auto& element : extra) {
        auto begin = target.begin();
        auto end = begin + static_cast<std::ptrdiff_t>(original);
        if (std::find(begin, end, element) == end) {
            target.push_back(element);
        }
    }
}

void merge_into(Value& accumulated, const Value& incoming,
                const PathSet& overrides, const MergeOptions& options) {
    merge_at(accumulated, incoming, Path(), overrides, options);
}

MergeEngine::MergeEngine(MergeOptions options)
    : options_(options)
{}

void MergeEngine::fold(const Resolution& resolution) {
    PathSet elements;
    for (const auto& path : resolution.resets) {
        resets_.insert(path);
        if (is_element_path(path)) {
            elements.insert(path);
        } else {
            tombstones_.insert(path);
        }
    }

    // RULE P5: the document already dropped these elements itself; only
    // what earlier files contributed at those positions is removed
    if (options_.apply_resets && !elements.empty()) {
        apply_resets(tree_, elements);
    }

    if (resolution.tree) {
        fold(*resolution.tree, resolution.overrides);
    }
}

void MergeEngine::fold(const Value& tree, const PathSet& overrides) {
    merge_into(tree_, tree, overrides, options_);
    ++folded_;
}

MergeResult MergeEngine::finish() {
    MergeResult result;
    if (!tree_.is_null()) {
        result.tree = std::move(tree_);
    }
    result.resets = std::move(resets_);

    if (options_.apply_resets) {
        apply_resets(result.tree, tombstones_);
    }

    tree_ = Value();
    resets_.clear();
    tombstones_.clear();
    folded_ = 0;
    return result;
}

} // namespace overlay
