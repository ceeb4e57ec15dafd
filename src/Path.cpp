/**
 * @file Path.cpp
 * @brief Implementation of node paths
 */

#include "overlay/Path.hpp"
#include "overlay/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace overlay {

bool operator==(const PathSegment& a, const PathSegment& b) {
    if (a.kind != b.kind) return false;
    return a.is_index() ? a.index == b.index : a.key == b.key;
}

bool operator<(const PathSegment& a, const PathSegment& b) {
    if (a.kind != b.kind) return a.kind < b.kind;
    return a.is_index() ? a.index < b.index : a.key < b.key;
}

namespace {
    /**
     * @brief Check if text is a valid non-negative decimal index
     */
    bool is_array_index(const std::string& text) {
        if (text.empty()) return false;
        if (text[0] == '0' && text.size() > 1) return false;
        return std::all_of(text.begin(), text.end(),
                           [](unsigned char c) { return std::isdigit(c); });
    }
}

Path Path::parse(const std::string& text) {
    std::vector<PathSegment> segments;
    std::string current;
    // True right after "]" so that "a[0]" followed by ".b" or "[1]" is legal
    bool after_index = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '.') {
            if (current.empty() && !after_index) {
                throw PathSyntaxError(text, "empty field at offset " + std::to_string(i));
            }
            if (!current.empty()) {
                segments.push_back(PathSegment::field(current));
                current.clear();
            }
            after_index = false;
        } else if (c == '[') {
            if (!current.empty()) {
                segments.push_back(PathSegment::field(current));
                current.clear();
            }
            auto close = text.find(']', i);
            if (close == std::string::npos) {
                throw PathSyntaxError(text, "unbalanced '['");
            }
            std::string digits = text.substr(i + 1, close - i - 1);
            if (!is_array_index(digits)) {
                throw PathSyntaxError(text, "'" + digits + "' is not a valid index");
            }
            segments.push_back(PathSegment::at(std::stoull(digits)));
            i = close;
            after_index = true;
        } else if (c == ']') {
            throw PathSyntaxError(text, "unbalanced ']'");
        } else {
            if (after_index) {
                throw PathSyntaxError(text, "missing '.' after index");
            }
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(PathSegment::field(current));
    } else if (!text.empty() && !after_index) {
        throw PathSyntaxError(text, "trailing '.'");
    }

    return Path(std::move(segments));
}

Path Path::descend(const std::string& key) const {
    Path next(*this);
    next.segments_.push_back(PathSegment::field(key));
    return next;
}

Path Path::descend(std::size_t index) const {
    Path next(*this);
    next.segments_.push_back(PathSegment::at(index));
    return next;
}

Path Path::parent() const {
    if (segments_.empty()) {
        return *this;
    }
    return Path(std::vector<PathSegment>(segments_.begin(), segments_.end() - 1));
}

std::string Path::render() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : segments_) {
        if (seg.is_index()) {
            oss << '[' << seg.index << ']';
        } else {
            if (!first) oss << '.';
            oss << seg.key;
        }
        first = false;
    }
    return oss.str();
}

std::vector<std::string> render_all(const PathSet& paths) {
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        out.push_back(p.render());
    }
    return out;
}

const Value* find_at(const Value& tree, const Path& path) {
    const Value* current = &tree;

    for (const auto& seg : path.segments()) {
        if (seg.is_index()) {
            if (!current->is_array() || seg.index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[seg.index];
        } else {
            if (!current->is_object()) {
                return nullptr;
            }
            auto it = current->find(seg.key);
            if (it == current->end()) {
                return nullptr;
            }
            current = &(*it);
        }
    }

    return current;
}

bool contains_at(const Value& tree, const Path& path) {
    return find_at(tree, path) != nullptr;
}

} // namespace overlay
