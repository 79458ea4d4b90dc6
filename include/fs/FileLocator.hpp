#pragma once

#include "fs/model/File.hpp"
#include "fs/model/Path.hpp"

#include <optional>
#include <string>

namespace tfs::db { class Txn; }

namespace tfs::fs {

// Every lookup yields the current version id and its frozen flag alongside the file row.
class FileLocator {
public:
    [[nodiscard]] static std::optional<model::File> byId(db::Txn& txn, const std::string& fileId);
    [[nodiscard]] static std::optional<model::File> byName(db::Txn& txn, const std::string& parentId, const std::string& name);
    [[nodiscard]] static std::optional<model::File> byPath(db::Txn& txn, const model::Path& path);

    /// Looks up by id when one is given, otherwise by path. Throws NotFoundError.
    [[nodiscard]] static model::File require(db::Txn& txn, const std::optional<std::string>& fileId, const model::Path& path);
};

}
