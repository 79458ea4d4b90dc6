#include "fs/model/Path.hpp"
#include "fs/model/Folder.hpp"

using namespace tfs::fs::model;

Path::Path(const std::string& text) {
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('/', start);
        if (end == std::string::npos) end = text.size();
        if (end > start) segments.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
}

Path Path::truncate(const std::size_t n) const {
    if (n >= segments.size()) return {};
    return Path(std::vector(segments.begin(), segments.end() - static_cast<std::ptrdiff_t>(n)));
}

Path Path::child(const std::string& name) const {
    auto segs = segments;
    segs.push_back(name);
    return Path(std::move(segs));
}

std::string Path::tail() const {
    if (segments.empty()) return ROOT_ID;
    return segments.back();
}

bool Path::isRoot() const {
    return segments.empty() || (segments.size() == 1 && segments.front() == ROOT_ID);
}

std::string Path::join() const {
    std::string out;
    for (const auto& s : segments) {
        if (!out.empty()) out += '/';
        out += s;
    }
    return out;
}

std::string Path::toAbsolute() const { return "/" + join(); }
