#include "db/DBConnection.hpp"

void tfs::db::DBConnection::initPreparedVersions() const {
    conn_->prepare("get_version",
                   "SELECT file_id, id, blob_id, frozen, EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at, "
                   "author, message FROM versions WHERE file_id = $1 AND id = $2");

    conn_->prepare("list_versions",
                   "SELECT file_id, id, blob_id, frozen, EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at, "
                   "author, message FROM versions WHERE file_id = $1");

    conn_->prepare("upsert_version",
                   R"SQL(
    INSERT INTO versions (file_id, id, blob_id, frozen, created_at, author, message)
    VALUES ($1, $2, $3, $4, to_timestamp($5::DOUBLE PRECISION), $6, $7)
    ON CONFLICT (file_id, id) DO UPDATE
    SET blob_id    = EXCLUDED.blob_id,
        frozen     = EXCLUDED.frozen,
        created_at = EXCLUDED.created_at,
        author     = EXCLUDED.author,
        message    = EXCLUDED.message
    )SQL");

    conn_->prepare("delete_versions", "DELETE FROM versions WHERE file_id = $1");
}
