#include "fs/model/Listing.hpp"
#include "fs/model/Path.hpp"
#include "fs/errors.hpp"

#include <algorithm>
#include <unordered_set>

using namespace tfs::fs;
using namespace tfs::fs::model;

namespace {
const std::vector<std::string> NONE;
}

void Listing::link() {
    subFolders.clear();
    folderFiles.clear();

    for (const auto& [id, folder] : folders)
        if (!folder.isRoot()) subFolders[folder.parent_id].push_back(id);
    for (const auto& [id, file] : files) folderFiles[file.parent_id].push_back(id);

    for (auto& [_, ids] : subFolders)
        std::ranges::sort(ids, {}, [this](const std::string& id) { return folders.at(id).name; });
    for (auto& [_, ids] : folderFiles)
        std::ranges::sort(ids, {}, [this](const std::string& id) { return files.at(id).name; });
}

const std::vector<std::string>& Listing::childrenOf(const std::string& folderId) const {
    const auto it = subFolders.find(folderId);
    return it == subFolders.end() ? NONE : it->second;
}

const std::vector<std::string>& Listing::filesOf(const std::string& folderId) const {
    const auto it = folderFiles.find(folderId);
    return it == folderFiles.end() ? NONE : it->second;
}

std::vector<std::string> Listing::ancestry(const std::string& folderId) const {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;

    auto current = folderId;
    while (current != ROOT_ID) {
        if (!seen.insert(current).second)
            throw DataCorruptionError("Folder cycle detected at " + current);
        const auto it = folders.find(current);
        if (it == folders.end() || it->second.isRoot()) break;
        names.push_back(it->second.name);
        current = it->second.parent_id;
    }

    std::ranges::reverse(names);
    return names;
}

std::string Listing::folderPath(const std::string& folderId) const {
    return Path(ancestry(folderId)).toAbsolute();
}

std::string Listing::buildPath(const File& file) const {
    return Path(ancestry(file.parent_id)).child(file.name).toAbsolute();
}
