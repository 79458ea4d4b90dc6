#pragma once

#include "db/Session.hpp"

#include <memory>

namespace tfs::config { struct DatabaseConfig; }

namespace tfs::db {

class DBPool;

/// PostgreSQL store over a fixed pool of libpqxx connections.
///
/// Read-write transactions run SERIALIZABLE, read-only ones REPEATABLE READ READ ONLY. Each
/// transaction leases one connection for its lifetime; a lost connection is reopened on its next
/// lease. Failing to open the initial connections throws from the constructor.
class PgSessionFactory final : public SessionFactory {
public:
    explicit PgSessionFactory(const config::DatabaseConfig& cnf);
    ~PgSessionFactory() override;

    std::unique_ptr<Txn> begin(TxMode mode) override;

private:
    std::unique_ptr<DBPool> pool_;
};

}
