/**
 * @file CycleTracker.hpp
 * @brief In-progress stack guarding alias and merge-key expansion
 *
 * Every container node the resolver is currently inside is pushed as a
 * frame (node identity plus the Path it is being resolved at). Before an
 * alias target is entered, check() looks for that node on the stack: if it
 * is already in progress the alias is a back-edge and expanding it would
 * never terminate.
 *
 * Frames are matched by node identity, never by value or anchor name, and
 * a cycle is reported at the Path of the alias that closes it.
 *
 * Frames are popped by the guard returned from enter(), including when an
 * exception unwinds, so only the active call chain is ever inspected. Two
 * sibling aliases to the same anchor are therefore never reported.
 */

#ifndef OVERLAY_CYCLE_TRACKER_HPP
#define OVERLAY_CYCLE_TRACKER_HPP

#include "overlay/Node.hpp"
#include "overlay/Path.hpp"
#include <string>
#include <utility>
#include <vector>

namespace overlay {

class CycleTracker {
public:
    /**
     * @brief One entry of the active resolution stack
     */
    struct Frame {
        const Node* node;
        Path path;
    };

    /**
     * @brief Pops its frame when it goes out of scope
     */
    class Guard {
    public:
        explicit Guard(CycleTracker& tracker) : tracker_(&tracker) {}
        ~Guard() {
            if (tracker_) tracker_->leave();
        }

        Guard(Guard&& other) noexcept : tracker_(other.tracker_) {
            other.tracker_ = nullptr;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

    private:
        CycleTracker* tracker_;
    };

    /**
     * @param document Name reported in CycleError
     */
    explicit CycleTracker(std::string document = "")
        : document_(std::move(document)) {}

    /**
     * @brief Push a frame for the node being resolved at path
     */
    [[nodiscard]] Guard enter(const Node& node, const Path& path);

    /**
     * @brief Fail if target is already being resolved
     *
     * @param target Alias target about to be expanded
     * @param path Path of the alias use
     * @throws CycleError carrying path.render()
     */
    void check(const Node& target, const Path& path) const;

    bool in_progress(const Node& node) const;

    std::size_t depth() const noexcept { return frames_.size(); }
    const std::vector<Frame>& frames() const noexcept { return frames_; }

private:
    void leave();

    std::string document_;
    std::vector<Frame> frames_;
};

} // namespace overlay

#endif // OVERLAY_CYCLE_TRACKER_HPP
