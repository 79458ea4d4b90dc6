#pragma once

#include "db/DBConnection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace tfs::db {

class DBPool {
  public:
    // Returns the connection to the pool when it goes out of scope.
    class Lease {
      public:
        explicit Lease(DBPool& pool) : pool_(pool), conn_(pool.acquire()) {}
        ~Lease() { if (conn_) pool_.release(std::move(conn_)); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        DBConnection& operator*() const { return *conn_; }
        DBConnection* operator->() const { return conn_.get(); }

      private:
        DBPool& pool_;
        std::unique_ptr<DBConnection> conn_;
    };

    DBPool(const config::DatabaseConfig& cnf, const size_t size) {
        for (size_t i = 0; i < size; ++i) {
            pool_.push(std::make_unique<DBConnection>(cnf));
        }
    }

    std::unique_ptr<DBConnection> acquire() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [&]() { return !pool_.empty(); });
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        std::lock_guard lock(mtx_);
        pool_.push(std::move(conn));
        cv_.notify_one();
    }

  private:
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

}
