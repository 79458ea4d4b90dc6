#include "fs/TreeOps.hpp"
#include "fs/FileLocator.hpp"
#include "fs/FolderResolver.hpp"
#include "fs/VersionManager.hpp"
#include "fs/errors.hpp"
#include "db/Session.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

using namespace tfs::fs;
using namespace tfs::fs::model;

namespace {

// Strictly below: a path is not beneath itself.
bool isBeneath(const Path& candidate, const Path& ancestor) {
    return candidate.size() > ancestor.size() &&
           std::equal(ancestor.segments.begin(), ancestor.segments.end(), candidate.segments.begin());
}

}

void TreeOps::moveFile(db::Txn& txn, const std::optional<std::string>& fileId, const Path& oldPath,
                       const Path& newPath, id::Generator& ids) {
    if (newPath.isRoot()) throw std::invalid_argument("Cannot move a file onto the root path");

    std::optional<File> file;
    if (fileId) file = FileLocator::byId(txn, *fileId);
    if (!file) file = FileLocator::byPath(txn, oldPath);
    if (!file) throw NotFoundError("File not found: " + (fileId ? *fileId : oldPath.toAbsolute()));

    const auto folder = FolderResolver::materialize(txn, newPath.parent(), ids);
    const auto name = newPath.tail();

    if (const auto existing = txn.findFile(folder.id, name); existing && existing->id != file->id)
        throw AlreadyExistsError("File already exists: " + newPath.toAbsolute());

    file->parent_id = folder.id;
    file->name = name;
    txn.updateFile(*file);

    log::Registry::fs()->debug("[TreeOps::moveFile] {} -> {}", file->id, newPath.toAbsolute());
}

void TreeOps::moveFolder(db::Txn& txn, const Path& oldPath, const Path& newPath, id::Generator& ids) {
    if (oldPath.isRoot()) throw std::invalid_argument("Cannot move the root folder");
    if (newPath.isRoot()) throw std::invalid_argument("Cannot move a folder onto the root path");
    if (newPath.segments == oldPath.segments) {
        if (!FolderResolver::resolve(txn, oldPath)) throw NotFoundError("Folder not found: " + oldPath.toAbsolute());
        return;
    }
    if (isBeneath(newPath, oldPath))
        throw std::invalid_argument("Cannot move " + oldPath.toAbsolute() + " beneath itself");

    auto folder = FolderResolver::resolve(txn, oldPath);
    if (!folder) throw NotFoundError("Folder not found: " + oldPath.toAbsolute());

    const auto container = FolderResolver::materialize(txn, newPath.parent(), ids);
    const auto name = newPath.tail();

    if (const auto existing = txn.findFolder(container.id, name); existing && existing->id != folder->id)
        throw AlreadyExistsError("Folder already exists: " + newPath.toAbsolute());

    folder->parent_id = container.id;
    folder->name = name;
    txn.updateFolder(*folder);

    log::Registry::fs()->debug("[TreeOps::moveFolder] {} -> {}", oldPath.toAbsolute(), newPath.toAbsolute());
}

bool TreeOps::removeFile(db::Txn& txn, const std::optional<std::string>& fileId, const std::optional<Path>& path) {
    // A given id is authoritative: the path only reports a miss, it never picks another file.
    std::optional<File> file;
    if (fileId) file = FileLocator::byId(txn, *fileId);
    else if (path) file = FileLocator::byPath(txn, *path);

    if (!file) {
        if (path) throw NotFoundError("File not found: " + (fileId ? *fileId : path->toAbsolute()));
        return false;
    }

    VersionManager::purge(txn, file->id);
    txn.deleteFile(file->id);

    log::Registry::fs()->debug("[TreeOps::removeFile] Removed {} ({})", file->name, file->id);
    return true;
}

Subtree TreeOps::collect(db::Txn& txn, const Folder& top) {
    Subtree out;
    std::vector<std::string> stack{top.id};
    std::unordered_set<std::string> seen;

    while (!stack.empty()) {
        const auto current = std::move(stack.back());
        stack.pop_back();
        if (!seen.insert(current).second) throw DataCorruptionError("Folder cycle detected at " + current);

        out.folderIds.push_back(current);
        for (auto& fileId : txn.listFileIds(current)) out.fileIds.push_back(std::move(fileId));
        for (const auto& child : txn.listSubFolders(current)) stack.push_back(child.id);
    }
    return out;
}

void TreeOps::deleteFolders(db::Txn& txn, const std::vector<std::string>& folderIds) {
    std::vector<std::string> ids;
    ids.reserve(folderIds.size());
    std::ranges::copy_if(folderIds, std::back_inserter(ids), [](const std::string& id) { return id != ROOT_ID; });
    if (ids.empty()) return;
    txn.deleteFolders(ids);
}
