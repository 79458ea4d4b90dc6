#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tfs::fs::model {

/// Slash-delimited path as an ordered list of opaque names.
/// Empty segments are dropped, so "a//b/", "/a/b" and "a/b" are the same path.
struct Path {
    std::vector<std::string> segments{};

    Path() = default;
    explicit Path(const std::string& text);
    explicit Path(std::vector<std::string> segs) : segments(std::move(segs)) {}

    [[nodiscard]] static Path parse(const std::string& text) { return Path(text); }

    /// Drops the last n segments; dropping more than there are yields the root.
    [[nodiscard]] Path truncate(std::size_t n) const;
    [[nodiscard]] Path parent() const { return truncate(1); }
    [[nodiscard]] Path child(const std::string& name) const;

    /// Last segment, or "/" for the root.
    [[nodiscard]] std::string tail() const;

    [[nodiscard]] bool isRoot() const;
    [[nodiscard]] bool empty() const { return segments.empty(); }
    [[nodiscard]] std::size_t size() const { return segments.size(); }

    /// "a/b/c", without a leading slash.
    [[nodiscard]] std::string join() const;
    /// "/a/b/c", or "/" for the root.
    [[nodiscard]] std::string toAbsolute() const;

    [[nodiscard]] bool operator==(const Path& other) const = default;
};

}
