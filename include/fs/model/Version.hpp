#pragma once

#include <ctime>
#include <string>

namespace tfs::fs::model {

struct Version {
    std::string file_id{}, id{}, blob_id{};
    bool frozen{false};
    std::time_t created_at{};
    std::string author{}, message{};
};

}
