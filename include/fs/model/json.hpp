#pragma once

#include <nlohmann/json_fwd.hpp>

namespace tfs::fs::model {

struct Folder;
struct File;
struct Version;
struct Listing;

void to_json(nlohmann::json& j, const Folder& folder);
void to_json(nlohmann::json& j, const File& file);
void to_json(nlohmann::json& j, const Version& version);

// Flat {"folders": [...], "files": [...]} with an absolute "path" on every record, ordered by path.
void to_json(nlohmann::json& j, const Listing& listing);

}
