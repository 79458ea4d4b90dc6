#pragma once

#include "fs/VersionManager.hpp"
#include "fs/model/File.hpp"
#include "fs/model/Folder.hpp"
#include "fs/model/Listing.hpp"
#include "fs/model/Version.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace tfs::fs {

/// Host-facing surface of the engine. Each operation runs as one or more retried transactions
/// through db::Transactions, which must be initialized first.
///
/// Operations that create rows take an optional request key. With a key, every id created by a
/// retried attempt is the same as the one the first attempt created, and replaying a checkpoint
/// that already committed returns the version it produced instead of stamping another.
class Filesystem {
public:
    using Bytes = std::vector<uint8_t>;

    [[nodiscard]] static model::Listing listAll();

    /// Content of the current version, or of versionId when given. nullopt when either is missing.
    [[nodiscard]] static std::optional<Bytes> read(const std::string& fileId,
                                                   const std::optional<std::string>& versionId = std::nullopt);

    static SaveResult save(const std::optional<std::string>& fileId, const std::string& path,
                           const std::string& author, const Bytes& content,
                           const std::optional<std::string>& requestKey = std::nullopt);

    static void moveFile(const std::optional<std::string>& fileId, const std::string& oldPath, const std::string& newPath,
                         const std::optional<std::string>& requestKey = std::nullopt);

    static void moveFolder(const std::string& oldPath, const std::string& newPath,
                           const std::optional<std::string>& requestKey = std::nullopt);

    static bool removeFile(const std::optional<std::string>& fileId, const std::optional<std::string>& path = std::nullopt);

    /// Not atomic: files are removed one transaction each, then the folder rows in one batch.
    /// Re-running after a failure finishes the job. Removing "/" empties the tree but keeps the root.
    static void removeFolder(const std::string& path);

    static std::string checkpoint(const std::optional<std::string>& fileId, const std::string& path,
                                  const std::string& message, const std::string& author,
                                  std::time_t timestamp = std::time(nullptr),
                                  const std::optional<std::string>& requestKey = std::nullopt);

    [[nodiscard]] static std::vector<model::Version> history(const std::string& fileId);

    [[nodiscard]] static std::optional<model::File> locateFile(const std::string& fileId);
    [[nodiscard]] static std::optional<model::File> locateFileByPath(const std::string& path);
    [[nodiscard]] static std::optional<model::Folder> locateFolder(const std::string& path);

    [[nodiscard]] static std::string newId();
};

}
