/**
 * @file Path.hpp
 * @brief Canonical addresses of nodes inside a document tree
 *
 * A Path is a sequence of segments, each either a field name or a sequence
 * index. It renders as dot-separated fields with bracketed indices, e.g.
 * "services.web.ports[1].target".
 *
 * Rules:
 * - Paths are values: descend() returns a new Path, the receiver is untouched
 * - Two Paths are equal iff their segment sequences are identical
 * - matches() is exact equality; recorded patterns are never wildcards
 * - find_at() and contains_at() never throw: a missing segment or a
 *   traversal into a scalar simply yields nullptr / false
 */

#ifndef OVERLAY_PATH_HPP
#define OVERLAY_PATH_HPP

#include "overlay/Value.hpp"
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace overlay {

/**
 * @brief One step of a Path: a mapping key or a sequence index
 */
struct PathSegment {
    enum class Kind { Key, Index };

    Kind kind = Kind::Key;
    std::string key;
    std::size_t index = 0;

    static PathSegment field(std::string name) {
        PathSegment s;
        s.kind = Kind::Key;
        s.key = std::move(name);
        return s;
    }

    static PathSegment at(std::size_t i) {
        PathSegment s;
        s.kind = Kind::Index;
        s.index = i;
        return s;
    }

    bool is_index() const noexcept { return kind == Kind::Index; }
};

bool operator==(const PathSegment& a, const PathSegment& b);
bool operator<(const PathSegment& a, const PathSegment& b);

/**
 * @brief Immutable hierarchical address of a node
 *
 * Examples:
 * ```cpp
 * Path root;                                  // renders as ""
 * Path p = root.descend("a").descend("b");    // "a.b"
 * Path q = p.descend(2).descend("c");         // "a.b[2].c"
 * Path r = Path::parse("a.b[2].c");           // r == q
 * ```
 */
class Path {
public:
    Path() = default;
    explicit Path(std::vector<PathSegment> segments)
        : segments_(std::move(segments)) {}

    /**
     * @brief Parse a rendered path back into segments
     *
     * Accepts exactly what render() produces. The empty string is the root.
     *
     * @throws PathSyntaxError on empty fields, unbalanced brackets or
     *         non-numeric indices
     */
    static Path parse(const std::string& text);

    Path descend(const std::string& key) const;
    Path descend(std::size_t index) const;

    /**
     * @brief Path of the enclosing container (root stays root)
     */
    Path parent() const;

    const std::vector<PathSegment>& segments() const noexcept { return segments_; }
    std::size_t size() const noexcept { return segments_.size(); }
    bool empty() const noexcept { return segments_.empty(); }

    /**
     * @brief Canonical string form: "a.b[2].c"
     */
    std::string render() const;

    /**
     * @brief Exact match against a recorded directive location
     */
    bool matches(const Path& pattern) const { return *this == pattern; }

    friend bool operator==(const Path& a, const Path& b) {
        return a.segments_ == b.segments_;
    }
    friend bool operator!=(const Path& a, const Path& b) {
        return !(a == b);
    }
    friend bool operator<(const Path& a, const Path& b) {
        return a.segments_ < b.segments_;
    }

private:
    std::vector<PathSegment> segments_;
};

/**
 * @brief Set of recorded directive locations (reset or override)
 */
using PathSet = std::set<Path>;

/**
 * @brief Render every path of a set, in set order
 */
std::vector<std::string> render_all(const PathSet& paths);

/**
 * @brief Look up the value at a path inside a resolved tree
 *
 * @return Pointer into @p tree, or nullptr when any segment is missing or
 *         a segment of the wrong kind is applied (key on array, index on
 *         object, anything on a scalar)
 */
const Value* find_at(const Value& tree, const Path& path);

/**
 * @brief Check whether a path resolves inside a tree
 */
bool contains_at(const Value& tree, const Path& path);

} // namespace overlay

#endif // OVERLAY_PATH_HPP
