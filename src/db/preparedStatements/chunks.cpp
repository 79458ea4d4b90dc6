#include "db/DBConnection.hpp"

void tfs::db::DBConnection::initPreparedChunks() const {
    conn_->prepare("insert_chunk", "INSERT INTO chunks (blob_id, pos, data) VALUES ($1, $2, $3)");

    conn_->prepare("read_chunks",
                   "SELECT pos, data FROM chunks WHERE blob_id = $1 AND pos > $2 ORDER BY pos LIMIT $3");

    conn_->prepare("delete_chunks", "DELETE FROM chunks WHERE blob_id = $1");

    conn_->prepare("count_chunks", "SELECT COUNT(*) FROM chunks WHERE blob_id = $1");
}
