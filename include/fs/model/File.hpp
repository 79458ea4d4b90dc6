#pragma once

#include <string>

namespace tfs::fs::model {

// A file row joined with the frozen flag of its current version.
struct File {
    std::string id{}, parent_id{}, name{}, version_id{};
    bool frozen{false};

    [[nodiscard]] bool operator==(const File& other) const = default;
};

}
