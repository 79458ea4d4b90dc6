#include "fs/FolderResolver.hpp"
#include "fs/id/Generator.hpp"
#include "db/Session.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace tfs::fs;
using namespace tfs::fs::model;

std::optional<Folder> FolderResolver::resolve(db::Txn& txn, const Path& path) {
    auto current = Folder::root();
    if (path.isRoot()) return current;

    for (const auto& name : path.segments) {
        auto next = txn.findFolder(current.id, name);
        if (!next) return std::nullopt;
        current = std::move(*next);
    }
    return current;
}

Folder FolderResolver::materialize(db::Txn& txn, const Path& path, id::Generator& ids) {
    auto current = Folder::root();
    if (path.isRoot()) return current;

    for (const auto& name : path.segments) {
        if (auto next = txn.findFolder(current.id, name)) {
            current = std::move(*next);
            continue;
        }

        Folder folder{ids.next(), current.id, name};
        if (folder.id == folder.parent_id || folder.id == ROOT_ID)
            throw std::invalid_argument("Folder id '" + folder.id + "' collides with its parent");

        txn.insertFolder(folder);
        log::Registry::fs()->debug("[FolderResolver] Created folder '{}' ({}) under {}", name, folder.id, folder.parent_id);
        current = std::move(folder);
    }
    return current;
}
