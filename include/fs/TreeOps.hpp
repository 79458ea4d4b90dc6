#pragma once

#include "fs/model/Folder.hpp"
#include "fs/model/Path.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tfs::db { class Txn; }
namespace tfs::fs::id { class Generator; }

namespace tfs::fs {

struct Subtree {
    std::vector<std::string> folderIds, fileIds;
};

class TreeOps {
public:
    /// Locates the file by id, falling back to oldPath, and relinks it under newPath.
    static void moveFile(db::Txn& txn, const std::optional<std::string>& fileId, const model::Path& oldPath,
                         const model::Path& newPath, id::Generator& ids);

    /// Relinks only the folder row; everything beneath follows through its parent id.
    /// Moving a folder onto its own path changes nothing.
    static void moveFolder(db::Txn& txn, const model::Path& oldPath, const model::Path& newPath, id::Generator& ids);

    /// A given id alone identifies the file; the path is used only when no id is given.
    /// Returns false when the file does not exist and no path was given.
    static bool removeFile(db::Txn& txn, const std::optional<std::string>& fileId,
                           const std::optional<model::Path>& path = std::nullopt);

    /// Every folder (top included) and file beneath top, found with an explicit work stack.
    [[nodiscard]] static Subtree collect(db::Txn& txn, const model::Folder& top);

    /// Batched delete of folder rows. The root is skipped.
    static void deleteFolders(db::Txn& txn, const std::vector<std::string>& folderIds);
};

}
