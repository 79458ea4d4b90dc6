#pragma once

#include <cstdint>
#include <vector>

namespace tfs::fs::model {

// One compressed fragment of a blob.
struct Chunk {
    int32_t pos{};
    std::vector<uint8_t> data{};
};

}
