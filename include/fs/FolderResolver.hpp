#pragma once

#include "fs/model/Folder.hpp"
#include "fs/model/Path.hpp"

#include <optional>

namespace tfs::db { class Txn; }
namespace tfs::fs::id { class Generator; }

namespace tfs::fs {

class FolderResolver {
public:
    /// Walks path from the root through the folder name index. Stops at the first missing segment.
    [[nodiscard]] static std::optional<model::Folder> resolve(db::Txn& txn, const model::Path& path);

    /// Same walk, creating a folder row for every missing segment.
    static model::Folder materialize(db::Txn& txn, const model::Path& path, id::Generator& ids);
};

}
