#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace tfs::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& absPath, const std::vector<uint8_t>& content);

// Names starting with a dot are skipped on import.
bool isHidden(const std::filesystem::path& path);

}
