/**
 * @file CycleTracker.cpp
 * @brief Implementation of the in-progress resolution stack
 */

#include "overlay/CycleTracker.hpp"
#include "overlay/Errors.hpp"
#include <algorithm>

namespace overlay {

CycleTracker::Guard CycleTracker::enter(const Node& node, const Path& path) {
    frames_.push_back(Frame{&node, path});
    return Guard(*this);
}

void CycleTracker::leave() {
    if (!frames_.empty()) {
        frames_.pop_back();
    }
}

bool CycleTracker::in_progress(const Node& node) const {
    return std::any_of(frames_.begin(), frames_.end(),
                       [&node](const Frame& f) { return f.node == &node; });
}

void CycleTracker::check(const Node& target, const Path& path) const {
    if (in_progress(target)) {
        throw CycleError(path.render(), document_);
    }
}

} // namespace overlay
