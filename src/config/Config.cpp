#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace tfs::config {

template <typename T>
static void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Invalid configuration section: " + key);
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    decodeSection(root, "database", cfg.database);
    decodeSection(root, "storage", cfg.storage);
    decodeSection(root, "retry", cfg.retry);
    decodeSection(root, "logging", cfg.logging);

    return cfg;
}

} // namespace tfs::config
