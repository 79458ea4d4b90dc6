#include "fs/FileLocator.hpp"
#include "fs/FolderResolver.hpp"
#include "fs/errors.hpp"
#include "db/Session.hpp"

using namespace tfs::fs;
using namespace tfs::fs::model;

std::optional<File> FileLocator::byId(db::Txn& txn, const std::string& fileId) {
    return txn.getFile(fileId);
}

std::optional<File> FileLocator::byName(db::Txn& txn, const std::string& parentId, const std::string& name) {
    return txn.findFile(parentId, name);
}

std::optional<File> FileLocator::byPath(db::Txn& txn, const Path& path) {
    if (path.isRoot()) return std::nullopt;
    const auto folder = FolderResolver::resolve(txn, path.parent());
    if (!folder) return std::nullopt;
    return byName(txn, folder->id, path.tail());
}

File FileLocator::require(db::Txn& txn, const std::optional<std::string>& fileId, const Path& path) {
    if (fileId) {
        if (auto file = byId(txn, *fileId)) return *file;
        throw NotFoundError("File not found: " + *fileId);
    }
    if (auto file = byPath(txn, path)) return *file;
    throw NotFoundError("File not found: " + path.toAbsolute());
}
