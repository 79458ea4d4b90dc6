#include "db/PgSession.hpp"
#include "db/DBPool.hpp"
#include "db/errors.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <pqxx/pqxx>
#include <cstddef>
#include <stdexcept>

using namespace tfs::db;
using namespace tfs::fs::model;

namespace {

bool isTransientState(const std::string& sqlstate) {
    return sqlstate == "40001"    // serialization_failure
        || sqlstate == "40P01"    // deadlock_detected
        || sqlstate == "57014"    // query_canceled, raised by statement_timeout
        || sqlstate == "55P03";   // lock_not_available
}

// Must be called from a catch block.
[[noreturn]] void translate(const std::string& op) {
    try {
        throw;
    } catch (const pqxx::transaction_rollback& e) {
        throw TransientError(op + ": " + e.what());
    } catch (const pqxx::unique_violation& e) {
        throw ConstraintError(op + ": " + e.what());
    } catch (const pqxx::sql_error& e) {
        if (isTransientState(e.sqlstate())) throw TransientError(op + ": " + e.what());
        throw;
    } catch (const pqxx::broken_connection& e) {
        throw TransientError(op + ": connection lost: " + e.what());
    } catch (const pqxx::in_doubt_error& e) {
        throw TransientError(op + ": commit outcome unknown: " + e.what());
    }
}

template <typename Func>
auto guarded(const std::string& op, Func&& func) -> decltype(func()) {
    try {
        return func();
    } catch (const pqxx::failure&) {
        translate(op);
    }
}

// Chunk payloads bind as binary bytea parameters and come back through pqxx's bytea parser.
pqxx::bytes toBytea(const std::vector<uint8_t>& data) {
    const auto* first = reinterpret_cast<const std::byte*>(data.data());
    return pqxx::bytes(first, first + data.size());
}

std::vector<uint8_t> fromBytea(const pqxx::field& field) {
    const auto raw = field.as<pqxx::bytes>();
    const auto* first = reinterpret_cast<const uint8_t*>(raw.data());
    return {first, first + raw.size()};
}

Folder toFolder(const pqxx::row& row) {
    return {row["id"].as<std::string>(), row["parent_id"].as<std::string>(), row["name"].as<std::string>()};
}

File toFile(const pqxx::row& row) {
    File file;
    file.id = row["id"].as<std::string>();
    file.parent_id = row["parent_id"].as<std::string>();
    file.name = row["name"].as<std::string>();
    file.version_id = row["version_id"].as<std::string>();
    file.frozen = row["frozen"].as<bool>();
    return file;
}

Version toVersion(const pqxx::row& row) {
    Version v;
    v.file_id = row["file_id"].as<std::string>();
    v.id = row["id"].as<std::string>();
    v.blob_id = row["blob_id"].as<std::string>();
    v.frozen = row["frozen"].as<bool>();
    v.created_at = static_cast<std::time_t>(row["created_at"].as<int64_t>());
    v.author = row["author"].as<std::string>();
    v.message = row["message"].as<std::string>();
    return v;
}

}

namespace tfs::db {

class PgTxn final : public Txn {
public:
    PgTxn(DBPool& pool, const TxMode mode) : lease_(pool), mode_(mode) {
        if (!lease_->isOpen()) {
            log::Registry::db()->warn("[PgTxn] Leased connection is closed, reconnecting");
            lease_->reconnect();
        }

        if (mode_ == TxMode::ReadWrite)
            txn_ = std::make_unique<pqxx::transaction<pqxx::isolation_level::serializable>>(lease_->get());
        else
            txn_ = std::make_unique<pqxx::transaction<pqxx::isolation_level::repeatable_read,
                                                      pqxx::write_policy::read_only>>(lease_->get());
    }

    [[nodiscard]] TxMode mode() const override { return mode_; }

    std::optional<Folder> findFolder(const std::string& parentId, const std::string& name) override {
        const auto res = run("find_folder", pqxx::params{parentId, name});
        if (res.empty()) return std::nullopt;
        return toFolder(res.one_row());
    }

    std::optional<Folder> getFolder(const std::string& id) override {
        const auto res = run("get_folder", pqxx::params{id});
        if (res.empty()) return std::nullopt;
        return toFolder(res.one_row());
    }

    std::vector<Folder> listSubFolders(const std::string& parentId) override {
        std::vector<Folder> out;
        for (const auto& row : run("list_sub_folders", pqxx::params{parentId})) out.push_back(toFolder(row));
        return out;
    }

    void insertFolder(const Folder& folder) override {
        requireWritable();
        run("insert_folder", pqxx::params{folder.id, folder.parent_id, folder.name});
    }

    void updateFolder(const Folder& folder) override {
        requireWritable();
        run("update_folder", pqxx::params{folder.id, folder.parent_id, folder.name});
    }

    void deleteFolders(const std::vector<std::string>& ids) override {
        requireWritable();
        run("delete_folders", pqxx::params{ids});
    }

    std::vector<Folder> scanFolders() override {
        std::vector<Folder> out;
        for (const auto& row : run("scan_folders", pqxx::params{})) out.push_back(toFolder(row));
        return out;
    }

    std::optional<File> getFile(const std::string& id) override {
        const auto res = run("get_file", pqxx::params{id});
        if (res.empty()) return std::nullopt;
        return toFile(res.one_row());
    }

    std::optional<File> findFile(const std::string& parentId, const std::string& name) override {
        const auto res = run("find_file", pqxx::params{parentId, name});
        if (res.empty()) return std::nullopt;
        return toFile(res.one_row());
    }

    std::vector<std::string> listFileIds(const std::string& folderId) override {
        std::vector<std::string> out;
        for (const auto& row : run("list_file_ids", pqxx::params{folderId})) out.push_back(row["id"].as<std::string>());
        return out;
    }

    void insertFile(const File& file) override {
        requireWritable();
        run("insert_file", pqxx::params{file.id, file.parent_id, file.name, file.version_id});
    }

    void updateFile(const File& file) override {
        requireWritable();
        run("update_file", pqxx::params{file.id, file.parent_id, file.name, file.version_id});
    }

    void deleteFile(const std::string& id) override {
        requireWritable();
        run("delete_file", pqxx::params{id});
    }

    std::vector<File> scanFiles() override {
        std::vector<File> out;
        for (const auto& row : run("scan_files", pqxx::params{})) out.push_back(toFile(row));
        return out;
    }

    std::optional<Version> getVersion(const std::string& fileId, const std::string& versionId) override {
        const auto res = run("get_version", pqxx::params{fileId, versionId});
        if (res.empty()) return std::nullopt;
        return toVersion(res.one_row());
    }

    std::vector<Version> listVersions(const std::string& fileId) override {
        std::vector<Version> out;
        for (const auto& row : run("list_versions", pqxx::params{fileId})) out.push_back(toVersion(row));
        return out;
    }

    void upsertVersion(const Version& v) override {
        requireWritable();
        pqxx::params p;
        p.append(v.file_id);
        p.append(v.id);
        p.append(v.blob_id);
        p.append(v.frozen);
        p.append(static_cast<int64_t>(v.created_at));
        p.append(v.author);
        p.append(v.message);
        run("upsert_version", p);
    }

    void deleteVersions(const std::string& fileId) override {
        requireWritable();
        run("delete_versions", pqxx::params{fileId});
    }

    void insertChunk(const std::string& blobId, const int32_t pos, const std::vector<uint8_t>& data) override {
        requireWritable();
        run("insert_chunk", pqxx::params{blobId, pos, toBytea(data)});
    }

    std::vector<Chunk> readChunks(const std::string& blobId, const int32_t afterPos, const unsigned int limit) override {
        std::vector<Chunk> out;
        for (const auto& row : run("read_chunks", pqxx::params{blobId, afterPos, static_cast<int64_t>(limit)}))
            out.push_back({row["pos"].as<int32_t>(), fromBytea(row["data"])});
        return out;
    }

    void deleteChunks(const std::string& blobId) override {
        requireWritable();
        run("delete_chunks", pqxx::params{blobId});
    }

    std::size_t countChunks(const std::string& blobId) override {
        return static_cast<std::size_t>(run("count_chunks", pqxx::params{blobId}).one_field().as<int64_t>());
    }

    void commit() override {
        if (mode_ != TxMode::ReadWrite) throw std::logic_error("Cannot commit a read-only transaction");
        guarded("commit", [&] { txn_->commit(); });
    }

private:
    DBPool::Lease lease_;
    TxMode mode_;
    std::unique_ptr<pqxx::transaction_base> txn_;

    pqxx::result run(const std::string& stmt, const pqxx::params& p) {
        return guarded(stmt, [&] { return txn_->exec(pqxx::prepped{stmt}, p); });
    }

    void requireWritable() const {
        if (mode_ != TxMode::ReadWrite) throw std::logic_error("Write attempted in a read-only transaction");
    }
};

}

PgSessionFactory::PgSessionFactory(const config::DatabaseConfig& cnf)
    : pool_(std::make_unique<DBPool>(cnf, cnf.pool_size)) {
    log::Registry::db()->info("[PgSessionFactory] Opened {} connections to {}:{}/{}", cnf.pool_size, cnf.host, cnf.port, cnf.name);
}

PgSessionFactory::~PgSessionFactory() = default;

std::unique_ptr<Txn> PgSessionFactory::begin(const TxMode mode) {
    return guarded("begin", [&]() -> std::unique_ptr<Txn> { return std::make_unique<PgTxn>(*pool_, mode); });
}
