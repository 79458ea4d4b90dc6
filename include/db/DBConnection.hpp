#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace tfs::config { struct DatabaseConfig; }

namespace tfs::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cnf);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;
    [[nodiscard]] bool isOpen() const;

    /// Drops the current session, if any, and opens a new one with all statements prepared.
    void reconnect();

  private:
    std::string DB_CONNECTION_STR;
    std::unique_ptr<pqxx::connection> conn_;

    void initPrepared() const;
    void initPreparedFolders() const;
    void initPreparedFiles() const;
    void initPreparedVersions() const;
    void initPreparedChunks() const;
};

// Connection string in libpq key/value form, password read from the configured environment variable.
std::string connectionString(const config::DatabaseConfig& cnf);

}
