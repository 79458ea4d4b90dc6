#include "fs/Filesystem.hpp"
#include "fs/BlobStore.hpp"
#include "fs/FileLocator.hpp"
#include "fs/FolderResolver.hpp"
#include "fs/TreeLister.hpp"
#include "fs/TreeOps.hpp"
#include "fs/errors.hpp"
#include "fs/id/Generator.hpp"
#include "fs/model/Path.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"

using namespace tfs::db;
using namespace tfs::fs;
using namespace tfs::fs::model;

Listing Filesystem::listAll() {
    return Transactions::read("Filesystem::listAll", [](Txn& txn) { return TreeLister::load(txn); });
}

std::optional<Filesystem::Bytes> Filesystem::read(const std::string& fileId, const std::optional<std::string>& versionId) {
    const auto chunks = Transactions::read("Filesystem::read", [&](Txn& txn) -> std::optional<BlobStore::Chunks> {
        const auto version = VersionManager::select(txn, fileId, versionId);
        if (!version) return std::nullopt;
        return BlobStore::fetch(txn, version->blob_id);
    });

    if (!chunks) {
        log::Registry::fs()->debug("[Filesystem::read] Nothing to read for {} ({})", fileId, versionId.value_or("current"));
        return std::nullopt;
    }
    return BlobStore::reconstruct(*chunks);
}

SaveResult Filesystem::save(const std::optional<std::string>& fileId, const std::string& path,
                            const std::string& author, const Bytes& content,
                            const std::optional<std::string>& requestKey) {
    const auto chunks = BlobStore::chunk(content);
    const Path target(path);

    const auto result = Transactions::exec("Filesystem::save", [&](Txn& txn) {
        id::Generator ids(requestKey);
        return VersionManager::save(txn, fileId, target, author, chunks, ids);
    });

    log::Registry::fs()->info("[Filesystem::save] {} {} ({} bytes in {} chunks)",
                              result.outcome == SaveOutcome::Created ? "Created" : "Overwrote",
                              target.toAbsolute(), content.size(), chunks.size());
    return result;
}

void Filesystem::moveFile(const std::optional<std::string>& fileId, const std::string& oldPath,
                          const std::string& newPath, const std::optional<std::string>& requestKey) {
    Transactions::exec("Filesystem::moveFile", [&](Txn& txn) {
        id::Generator ids(requestKey);
        TreeOps::moveFile(txn, fileId, Path(oldPath), Path(newPath), ids);
    });
    log::Registry::fs()->info("[Filesystem::moveFile] Moved {} to {}", fileId.value_or(oldPath), newPath);
}

void Filesystem::moveFolder(const std::string& oldPath, const std::string& newPath,
                            const std::optional<std::string>& requestKey) {
    Transactions::exec("Filesystem::moveFolder", [&](Txn& txn) {
        id::Generator ids(requestKey);
        TreeOps::moveFolder(txn, Path(oldPath), Path(newPath), ids);
    });
    log::Registry::fs()->info("[Filesystem::moveFolder] Moved {} to {}", oldPath, newPath);
}

bool Filesystem::removeFile(const std::optional<std::string>& fileId, const std::optional<std::string>& path) {
    std::optional<Path> target;
    if (path) target = Path(*path);

    const auto removed = Transactions::exec("Filesystem::removeFile", [&](Txn& txn) {
        return TreeOps::removeFile(txn, fileId, target);
    });

    if (removed) log::Registry::fs()->info("[Filesystem::removeFile] Removed {}", fileId.value_or(path.value_or("")));
    return removed;
}

void Filesystem::removeFolder(const std::string& path) {
    const Path target(path);

    const auto subtree = Transactions::read("Filesystem::removeFolder/collect", [&](Txn& txn) {
        const auto folder = FolderResolver::resolve(txn, target);
        if (!folder) throw NotFoundError("Folder not found: " + target.toAbsolute());
        return TreeOps::collect(txn, *folder);
    });

    log::Registry::fs()->debug("[Filesystem::removeFolder] {} holds {} folders and {} files",
                               target.toAbsolute(), subtree.folderIds.size(), subtree.fileIds.size());

    for (const auto& fileId : subtree.fileIds)
        Transactions::exec("Filesystem::removeFolder/file", [&](Txn& txn) { TreeOps::removeFile(txn, fileId); });

    Transactions::exec("Filesystem::removeFolder/folders", [&](Txn& txn) {
        TreeOps::deleteFolders(txn, subtree.folderIds);
    });

    log::Registry::fs()->info("[Filesystem::removeFolder] Removed {}", target.toAbsolute());
}

std::string Filesystem::checkpoint(const std::optional<std::string>& fileId, const std::string& path,
                                   const std::string& message, const std::string& author,
                                   const std::time_t timestamp, const std::optional<std::string>& requestKey) {
    const Path target(path);
    const auto versionId = Transactions::exec("Filesystem::checkpoint", [&](Txn& txn) {
        id::Generator ids(requestKey);
        return VersionManager::checkpoint(txn, fileId, target, message, author, timestamp, ids);
    });

    log::Registry::fs()->info("[Filesystem::checkpoint] {} is now at frozen version {}",
                              fileId.value_or(target.toAbsolute()), versionId);
    return versionId;
}

std::vector<Version> Filesystem::history(const std::string& fileId) {
    return Transactions::read("Filesystem::history", [&](Txn& txn) { return VersionManager::history(txn, fileId); });
}

std::optional<File> Filesystem::locateFile(const std::string& fileId) {
    return Transactions::read("Filesystem::locateFile", [&](Txn& txn) { return FileLocator::byId(txn, fileId); });
}

std::optional<File> Filesystem::locateFileByPath(const std::string& path) {
    const Path target(path);
    return Transactions::read("Filesystem::locateFileByPath", [&](Txn& txn) { return FileLocator::byPath(txn, target); });
}

std::optional<Folder> Filesystem::locateFolder(const std::string& path) {
    const Path target(path);
    return Transactions::read("Filesystem::locateFolder", [&](Txn& txn) { return FolderResolver::resolve(txn, target); });
}

std::string Filesystem::newId() { return id::Generator::random(); }
