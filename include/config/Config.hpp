#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace tfs::config {

constexpr static unsigned int DEFAULT_CHUNK_SIZE_KB = 256;
constexpr static unsigned int DEFAULT_READ_PAGE_SIZE = 10;

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "tablefs";
    std::string user = "tablefs";
    std::string password_env = "TABLEFS_DB_PASSWORD"; // password is never stored in the config file
    std::string schema = "tablefs";
    unsigned int pool_size = 4;
    unsigned int connect_timeout_seconds = 10;
};

struct StorageConfig {
    unsigned int chunk_size_kb = DEFAULT_CHUNK_SIZE_KB;
    int compression_level = 9;                       // zlib level, 0..9
    unsigned int read_page_size = DEFAULT_READ_PAGE_SIZE;

    [[nodiscard]] std::size_t chunkSizeBytes() const { return static_cast<std::size_t>(chunk_size_kb) * 1024; }
};

struct RetryConfig {
    unsigned int max_attempts = 10;
    unsigned int initial_backoff_ms = 10;
    unsigned int max_backoff_ms = 1000;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum tablefs = spdlog::level::info;   // Startup, shutdown, top-level failures
    spdlog::level::level_enum db      = spdlog::level::warn;   // Retries, exhausted transactions, lost sessions
    spdlog::level::level_enum fs      = spdlog::level::info;   // Creates, moves, deletes, checkpoints
    spdlog::level::level_enum storage = spdlog::level::warn;   // Chunk corruption
    spdlog::level::level_enum cli     = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/tablefs";
    LogLevelsConfig levels;
};

struct Config {
    DatabaseConfig database;
    StorageConfig storage;
    RetryConfig retry;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

} // namespace tfs::config
