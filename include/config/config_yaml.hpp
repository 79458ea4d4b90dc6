#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tfs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password_env"] = rhs.password_env;
        node["schema"] = rhs.schema;
        node["pool_size"] = rhs.pool_size;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("tablefs");
        rhs.user = node["user"].as<std::string>("tablefs");
        rhs.password_env = node["password_env"].as<std::string>("TABLEFS_DB_PASSWORD");
        rhs.schema = node["schema"].as<std::string>("tablefs");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(10);
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["chunk_size_kb"] = rhs.chunk_size_kb;
        node["compression_level"] = rhs.compression_level;
        node["read_page_size"] = rhs.read_page_size;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunk_size_kb = node["chunk_size_kb"].as<unsigned int>(DEFAULT_CHUNK_SIZE_KB);
        rhs.compression_level = node["compression_level"].as<int>(9);
        rhs.read_page_size = node["read_page_size"].as<unsigned int>(DEFAULT_READ_PAGE_SIZE);
        if (rhs.chunk_size_kb == 0 || rhs.read_page_size == 0) return false;
        if (rhs.compression_level < 0 || rhs.compression_level > 9) return false;
        return true;
    }
};

template<>
struct convert<RetryConfig> {
    static Node encode(const RetryConfig& rhs) {
        Node node;
        node["max_attempts"] = rhs.max_attempts;
        node["initial_backoff_ms"] = rhs.initial_backoff_ms;
        node["max_backoff_ms"] = rhs.max_backoff_ms;
        return node;
    }

    static bool decode(const Node& node, RetryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(10);
        rhs.initial_backoff_ms = node["initial_backoff_ms"].as<unsigned int>(10);
        rhs.max_backoff_ms = node["max_backoff_ms"].as<unsigned int>(1000);
        return rhs.max_attempts > 0;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["tablefs"] = to_std_string(spdlog::level::to_string_view(rhs.tablefs));
        node["db"]      = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["fs"]      = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cli"]     = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tablefs = spdlog::level::from_str(node["tablefs"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("warn"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.cli = spdlog::level::from_str(node["cli"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) return convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/tablefs");
        if (const auto levels = node["log_levels"]) return convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

} // namespace YAML
