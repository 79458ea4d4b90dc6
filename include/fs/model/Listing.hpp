#pragma once

#include "fs/model/File.hpp"
#include "fs/model/Folder.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace tfs::fs::model {

/// Whole tree loaded in one snapshot. Records are kept by id; parent links are plain ids.
struct Listing {
    std::unordered_map<std::string, Folder> folders;
    std::unordered_map<std::string, File> files;
    std::unordered_map<std::string, std::vector<std::string>> subFolders;  // folder id -> child folder ids
    std::unordered_map<std::string, std::vector<std::string>> folderFiles; // folder id -> file ids

    void link();

    [[nodiscard]] const std::vector<std::string>& childrenOf(const std::string& folderId) const;
    [[nodiscard]] const std::vector<std::string>& filesOf(const std::string& folderId) const;

    /// Absolute path of a folder, walking ancestors up to the root.
    /// A missing ancestor ends the walk; a parent cycle throws DataCorruptionError.
    [[nodiscard]] std::string folderPath(const std::string& folderId) const;
    [[nodiscard]] std::string buildPath(const File& file) const;

private:
    [[nodiscard]] std::vector<std::string> ancestry(const std::string& folderId) const;
};

}
