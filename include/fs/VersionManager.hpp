#pragma once

#include "fs/BlobStore.hpp"
#include "fs/model/Path.hpp"
#include "fs/model/Version.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace tfs::db { class Txn; }
namespace tfs::fs::id { class Generator; }

namespace tfs::fs {

enum class SaveOutcome { Created, Overwritten };

struct SaveResult {
    SaveOutcome outcome;
    std::string file_id, version_id;
};

/// Version lifecycle of a file.
///
/// Between checkpoints the head version is mutable and a save replaces its blob in place.
/// A checkpoint freezes the mutable head, or stamps a new frozen version sharing the frozen
/// head's blob when nothing was saved since the last checkpoint. A save on a frozen head
/// branches a new mutable version.
class VersionManager {
public:
    /// fileId alone identifies an existing file; without it the file is looked up by path.
    /// A missing file is created at path, under fileId when one was supplied.
    static SaveResult save(db::Txn& txn, const std::optional<std::string>& fileId, const model::Path& path,
                           const std::string& author, const BlobStore::Chunks& chunks, id::Generator& ids);

    /// Returns the id of the version that is frozen as a result.
    static std::string checkpoint(db::Txn& txn, const std::optional<std::string>& fileId, const model::Path& path,
                                  const std::string& message, const std::string& author, std::time_t timestamp,
                                  id::Generator& ids);

    /// Current version when versionId is empty.
    [[nodiscard]] static std::optional<model::Version> select(db::Txn& txn, const std::string& fileId,
                                                              const std::optional<std::string>& versionId);

    /// All versions ordered by timestamp, ties broken by version id.
    [[nodiscard]] static std::vector<model::Version> history(db::Txn& txn, const std::string& fileId);

    /// Deletes every version row of the file together with the chunks of every blob they reference.
    static void purge(db::Txn& txn, const std::string& fileId);

private:
    static SaveResult create(db::Txn& txn, const std::optional<std::string>& fileId, const model::Path& path,
                             const std::string& author, const BlobStore::Chunks& chunks, id::Generator& ids);
};

}
