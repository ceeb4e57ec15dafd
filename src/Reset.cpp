/**
 * @file Reset.cpp
 * @brief Implementation of the Reset Applier
 */

#include "overlay/Reset.hpp"
#include <string>
#include <vector>

namespace overlay {

namespace {

std::size_t remove_matching(Value& node, const Path& path, const PathSet& resets) {
    std::size_t removed = 0;

    if (node.is_object()) {
        std::vector<std::string> doomed;
        for (auto it = node.begin(); it != node.end(); ++it) {
            Path next = path.descend(it.key());
            if (resets.count(next) != 0) {
                doomed.push_back(it.key());
                continue;
            }
            removed += remove_matching(it.value(), next, resets);
        }
        for (const auto& key : doomed) {
            node.erase(key);
        }
        removed += doomed.size();
    } else if (node.is_array()) {
        // Survivors are collected so that indices stay those of the input
        Value kept = Value::array();
        for (std::size_t i = 0; i < node.size(); ++i) {
            Path next = path.descend(i);
            if (resets.count(next) != 0) {
                ++removed;
                continue;
            }
            removed += remove_matching(node[i], next, resets);
            kept.push_back(std::move(node[i]));
        }
        node = std::move(kept);
    }

    return removed;
}

} // anonymous namespace

std::size_t apply_resets(Value& tree, const PathSet& resets) {
    if (resets.empty()) {
        return 0;
    }
    if (resets.count(Path()) != 0) {
        tree = Value::object();
        return 1;
    }
    return remove_matching(tree, Path(), resets);
}

} // namespace overlay
