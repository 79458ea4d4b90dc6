#pragma once

#include "fs/model/Chunk.hpp"
#include "fs/model/File.hpp"
#include "fs/model/Folder.hpp"
#include "fs/model/Version.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tfs::db {

enum class TxMode {
    ReadOnly,   // snapshot-consistent, never committed
    ReadWrite   // serializable, committed explicitly
};

/// One open transaction against the table store.
///
/// Every row-level access the engine performs goes through this interface. Implementations
/// translate their native contention/session failures into db::TransientError and unique key
/// violations into db::ConstraintError. Destroying a Txn without commit() rolls it back.
class Txn {
public:
    using Folder = fs::model::Folder;
    using File = fs::model::File;
    using Version = fs::model::Version;
    using Chunk = fs::model::Chunk;

    virtual ~Txn() = default;

    [[nodiscard]] virtual TxMode mode() const = 0;

    // folders: primary key id, unique (parent_id, name)
    virtual std::optional<Folder> findFolder(const std::string& parentId, const std::string& name) = 0;
    virtual std::optional<Folder> getFolder(const std::string& id) = 0;
    virtual std::vector<Folder> listSubFolders(const std::string& parentId) = 0;
    virtual void insertFolder(const Folder& folder) = 0;
    virtual void updateFolder(const Folder& folder) = 0;
    virtual void deleteFolders(const std::vector<std::string>& ids) = 0;
    virtual std::vector<Folder> scanFolders() = 0;

    // files: primary key id, unique (parent_id, name); frozen is read from the current version
    virtual std::optional<File> getFile(const std::string& id) = 0;
    virtual std::optional<File> findFile(const std::string& parentId, const std::string& name) = 0;
    virtual std::vector<std::string> listFileIds(const std::string& folderId) = 0;
    virtual void insertFile(const File& file) = 0;
    virtual void updateFile(const File& file) = 0;
    virtual void deleteFile(const std::string& id) = 0;
    virtual std::vector<File> scanFiles() = 0;

    // versions: primary key (file_id, id)
    virtual std::optional<Version> getVersion(const std::string& fileId, const std::string& versionId) = 0;
    virtual std::vector<Version> listVersions(const std::string& fileId) = 0;
    virtual void upsertVersion(const Version& version) = 0;
    virtual void deleteVersions(const std::string& fileId) = 0;

    // blob chunks: primary key (blob_id, pos)
    virtual void insertChunk(const std::string& blobId, int32_t pos, const std::vector<uint8_t>& data) = 0;
    virtual std::vector<Chunk> readChunks(const std::string& blobId, int32_t afterPos, unsigned int limit) = 0;
    virtual void deleteChunks(const std::string& blobId) = 0;
    [[nodiscard]] virtual std::size_t countChunks(const std::string& blobId) = 0;

    virtual void commit() = 0;
};

class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    /// Opens a fresh transaction. May throw TransientError when no session can be obtained.
    virtual std::unique_ptr<Txn> begin(TxMode mode) = 0;
};

}
