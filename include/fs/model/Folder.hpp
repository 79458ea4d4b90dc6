#pragma once

#include <string>

namespace tfs::fs::model {

inline constexpr auto ROOT_ID = "/";

struct Folder {
    std::string id{}, parent_id{}, name{};

    [[nodiscard]] bool isRoot() const { return id == ROOT_ID || id == parent_id; }

    [[nodiscard]] static Folder root() { return {ROOT_ID, ROOT_ID, ROOT_ID}; }

    [[nodiscard]] bool operator==(const Folder& other) const = default;
};

}
