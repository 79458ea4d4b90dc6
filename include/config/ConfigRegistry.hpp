#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace tfs::config {

inline constexpr auto DEFAULT_CONFIG_PATH = "/etc/tablefs/config.yaml";

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static const Config& get();
    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace tfs::config
