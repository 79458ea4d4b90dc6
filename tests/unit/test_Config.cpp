#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <fstream>
#include <yaml-cpp/yaml.h>

using namespace tfs::config;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path tmp;

    void SetUp() override {
        tmp = fs::temp_directory_path() / ("tablefs-config-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".yaml");
    }

    void TearDown() override { fs::remove(tmp); }

    void write(const std::string& yaml) const {
        std::ofstream out(tmp);
        out << yaml;
    }
};

TEST_F(ConfigTest, TestConfigIsLoaded) {
    const auto& cnf = ConfigRegistry::get();
    EXPECT_EQ(cnf.storage.chunk_size_kb, 4u);
    EXPECT_EQ(cnf.storage.chunkSizeBytes(), 4096u);
    EXPECT_EQ(cnf.storage.read_page_size, 3u);
    EXPECT_EQ(cnf.retry.max_attempts, 4u);
    EXPECT_EQ(cnf.retry.initial_backoff_ms, 0u);
    EXPECT_EQ(cnf.logging.levels.subsystem_levels.db, spdlog::level::debug);
}

TEST_F(ConfigTest, MissingKeysTakeDefaults) {
    write("storage:\n  compression_level: 1\n");
    const auto cnf = loadConfig(tmp);

    EXPECT_EQ(cnf.storage.compression_level, 1);
    EXPECT_EQ(cnf.storage.chunk_size_kb, DEFAULT_CHUNK_SIZE_KB);
    EXPECT_EQ(cnf.storage.read_page_size, DEFAULT_READ_PAGE_SIZE);
    EXPECT_EQ(cnf.database.host, "localhost");
    EXPECT_EQ(cnf.database.port, 5432);
    EXPECT_EQ(cnf.database.schema, "tablefs");
    EXPECT_EQ(cnf.database.password_env, "TABLEFS_DB_PASSWORD");
    EXPECT_EQ(cnf.retry.max_attempts, 10u);
    EXPECT_EQ(cnf.logging.log_dir, fs::path("/var/log/tablefs"));
}

TEST_F(ConfigTest, DatabaseSectionIsRead) {
    write("database:\n  host: db.internal\n  port: 6432\n  name: notes\n  pool_size: 8\n");
    const auto cnf = loadConfig(tmp);

    EXPECT_EQ(cnf.database.host, "db.internal");
    EXPECT_EQ(cnf.database.port, 6432);
    EXPECT_EQ(cnf.database.name, "notes");
    EXPECT_EQ(cnf.database.pool_size, 8u);
    EXPECT_EQ(cnf.database.user, "tablefs");
}

TEST_F(ConfigTest, MalformedSectionIsRejected) {
    write("retry: [1, 2, 3]\n");
    EXPECT_THROW((void)loadConfig(tmp), std::runtime_error);
}

TEST_F(ConfigTest, MissingFileIsRejected) {
    EXPECT_THROW((void)loadConfig(tmp / "absent.yaml"), YAML::BadFile);
}
