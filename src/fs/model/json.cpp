#include "fs/model/json.hpp"
#include "fs/model/File.hpp"
#include "fs/model/Folder.hpp"
#include "fs/model/Listing.hpp"
#include "fs/model/Version.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

using namespace tfs::fs::model;

void tfs::fs::model::to_json(nlohmann::json& j, const Folder& folder) {
    j = {
        {"id", folder.id},
        {"parent_id", folder.parent_id},
        {"name", folder.name}
    };
}

void tfs::fs::model::to_json(nlohmann::json& j, const File& file) {
    j = {
        {"id", file.id},
        {"parent_id", file.parent_id},
        {"name", file.name},
        {"version_id", file.version_id},
        {"frozen", file.frozen}
    };
}

void tfs::fs::model::to_json(nlohmann::json& j, const Version& version) {
    j = {
        {"file_id", version.file_id},
        {"id", version.id},
        {"blob_id", version.blob_id},
        {"frozen", version.frozen},
        {"created_at", util::timestampToString(version.created_at)},
        {"author", version.author},
        {"message", version.message}
    };
}

void tfs::fs::model::to_json(nlohmann::json& j, const Listing& listing) {
    std::vector<std::pair<std::string, nlohmann::json>> folders, files;

    for (const auto& [id, folder] : listing.folders) folders.emplace_back(listing.folderPath(id), folder);
    for (const auto& [id, file] : listing.files) files.emplace_back(listing.buildPath(file), file);

    const auto toArray = [](auto& records) {
        std::ranges::sort(records, {}, &std::pair<std::string, nlohmann::json>::first);
        auto out = nlohmann::json::array();
        for (auto& [path, record] : records) {
            record["path"] = path;
            out.push_back(std::move(record));
        }
        return out;
    };

    j = {{"folders", toArray(folders)}, {"files", toArray(files)}};
}
