#include "fs/VersionManager.hpp"
#include "fs/FileLocator.hpp"
#include "fs/FolderResolver.hpp"
#include "fs/id/Generator.hpp"
#include "fs/errors.hpp"
#include "db/Session.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace tfs::fs;
using namespace tfs::fs::model;

namespace {

constexpr auto SAVE_MESSAGE = "-";

Version currentVersion(tfs::db::Txn& txn, const File& file) {
    auto version = txn.getVersion(file.id, file.version_id);
    if (!version)
        throw DataCorruptionError("File " + file.id + " points at missing version " + file.version_id);
    return *version;
}

}

SaveResult VersionManager::save(db::Txn& txn, const std::optional<std::string>& fileId, const Path& path,
                                const std::string& author, const BlobStore::Chunks& chunks, id::Generator& ids) {
    const auto file = fileId ? FileLocator::byId(txn, *fileId) : FileLocator::byPath(txn, path);
    if (!file) return create(txn, fileId, path, author, chunks, ids);

    auto version = currentVersion(txn, *file);

    if (!version.frozen) {
        BlobStore::remove(txn, version.blob_id);
        version.blob_id = ids.next();
        version.author = author;
        version.created_at = std::time(nullptr);
        BlobStore::store(txn, version.blob_id, chunks);
        txn.upsertVersion(version);

        log::Registry::fs()->debug("[VersionManager::save] Replaced mutable version {} of {}", version.id, file->id);
        return {SaveOutcome::Overwritten, file->id, version.id};
    }

    Version next;
    next.file_id = file->id;
    next.id = ids.next();
    next.blob_id = ids.next();
    next.frozen = false;
    next.created_at = std::time(nullptr);
    next.author = author;
    next.message = SAVE_MESSAGE;

    BlobStore::store(txn, next.blob_id, chunks);
    txn.upsertVersion(next);

    auto updated = *file;
    updated.version_id = next.id;
    txn.updateFile(updated);

    log::Registry::fs()->debug("[VersionManager::save] Branched version {} of {} from frozen {}", next.id, file->id, version.id);
    return {SaveOutcome::Overwritten, file->id, next.id};
}

SaveResult VersionManager::create(db::Txn& txn, const std::optional<std::string>& fileId, const Path& path,
                                  const std::string& author, const BlobStore::Chunks& chunks, id::Generator& ids) {
    if (path.isRoot()) throw std::invalid_argument("Cannot save a file at the root path");

    const auto folder = FolderResolver::materialize(txn, path.parent(), ids);
    const auto name = path.tail();
    if (txn.findFile(folder.id, name)) throw AlreadyExistsError("File already exists: " + path.toAbsolute());

    File file;
    file.id = fileId ? *fileId : ids.next();
    file.parent_id = folder.id;
    file.name = name;

    Version version;
    version.file_id = file.id;
    version.id = ids.next();
    version.blob_id = ids.next();
    version.frozen = false;
    version.created_at = std::time(nullptr);
    version.author = author;
    version.message = SAVE_MESSAGE;

    file.version_id = version.id;

    txn.insertFile(file);
    txn.upsertVersion(version);
    BlobStore::store(txn, version.blob_id, chunks);

    log::Registry::fs()->debug("[VersionManager::create] Created {} as {} (version {})", path.toAbsolute(), file.id, version.id);
    return {SaveOutcome::Created, file.id, version.id};
}

std::string VersionManager::checkpoint(db::Txn& txn, const std::optional<std::string>& fileId, const Path& path,
                                       const std::string& message, const std::string& author,
                                       const std::time_t timestamp, id::Generator& ids) {
    const auto file = FileLocator::require(txn, fileId, path);
    auto version = currentVersion(txn, file);

    if (!version.frozen) {
        version.frozen = true;
        version.message = message;
        version.author = author;
        version.created_at = timestamp;
        txn.upsertVersion(version);

        log::Registry::fs()->debug("[VersionManager::checkpoint] Froze version {} of {}", version.id, file.id);
        return version.id;
    }

    // Replay of a keyed checkpoint that already committed: the head carries this exact stamp.
    if (ids.keyed() && version.message == message && version.author == author && version.created_at == timestamp) {
        log::Registry::fs()->debug("[VersionManager::checkpoint] Version {} of {} already carries this checkpoint",
                                   version.id, file.id);
        return version.id;
    }

    Version stamp;
    stamp.file_id = file.id;
    stamp.id = ids.next();
    stamp.blob_id = version.blob_id;
    stamp.frozen = true;
    stamp.created_at = timestamp;
    stamp.author = author;
    stamp.message = message;
    txn.upsertVersion(stamp);

    auto updated = file;
    updated.version_id = stamp.id;
    txn.updateFile(updated);

    log::Registry::fs()->debug("[VersionManager::checkpoint] Stamped version {} of {} over blob {}", stamp.id, file.id, stamp.blob_id);
    return stamp.id;
}

std::optional<Version> VersionManager::select(db::Txn& txn, const std::string& fileId,
                                              const std::optional<std::string>& versionId) {
    if (versionId) return txn.getVersion(fileId, *versionId);
    const auto file = FileLocator::byId(txn, fileId);
    if (!file) return std::nullopt;
    return txn.getVersion(file->id, file->version_id);
}

std::vector<Version> VersionManager::history(db::Txn& txn, const std::string& fileId) {
    if (!FileLocator::byId(txn, fileId)) throw NotFoundError("File not found: " + fileId);

    auto versions = txn.listVersions(fileId);
    std::ranges::sort(versions, [](const Version& a, const Version& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        if (a.frozen != b.frozen) return a.frozen;
        return a.id < b.id;
    });
    return versions;
}

void VersionManager::purge(db::Txn& txn, const std::string& fileId) {
    std::set<std::string> blobs;
    for (const auto& v : txn.listVersions(fileId)) blobs.insert(v.blob_id);
    for (const auto& blob : blobs) BlobStore::remove(txn, blob);
    txn.deleteVersions(fileId);
}
