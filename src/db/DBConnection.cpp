#include "db/DBConnection.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace tfs::db {

static std::string quoteValue(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    return out + "'";
}

std::string connectionString(const config::DatabaseConfig& cnf) {
    std::string conn = "host=" + quoteValue(cnf.host) +
                       " port=" + std::to_string(cnf.port) +
                       " dbname=" + quoteValue(cnf.name) +
                       " user=" + quoteValue(cnf.user) +
                       " connect_timeout=" + std::to_string(cnf.connect_timeout_seconds) +
                       " options=" + quoteValue("-c search_path=" + cnf.schema);

    if (!cnf.password_env.empty()) {
        if (const char* password = std::getenv(cnf.password_env.c_str()))
            conn += " password=" + quoteValue(password);
        else
            log::Registry::db()->debug("[DBConnection] {} is not set, connecting without a password", cnf.password_env);
    }

    return conn;
}

DBConnection::DBConnection(const config::DatabaseConfig& cnf) : DB_CONNECTION_STR(connectionString(cnf)) {
    reconnect();
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const {
    if (!conn_) throw std::runtime_error("Database connection is not open");
    return *conn_;
}

bool DBConnection::isOpen() const { return conn_ && conn_->is_open(); }

void DBConnection::reconnect() {
    if (conn_ && conn_->is_open()) conn_->close();
    conn_.reset();
    conn_ = std::make_unique<pqxx::connection>(DB_CONNECTION_STR);
    initPrepared();
    log::Registry::db()->debug("[DBConnection] Connected to {}", conn_->dbname());
}

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedFolders();
    initPreparedFiles();
    initPreparedVersions();
    initPreparedChunks();
}

}
