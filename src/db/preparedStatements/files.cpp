#include "db/DBConnection.hpp"

void tfs::db::DBConnection::initPreparedFiles() const {
    conn_->prepare("get_file",
                   "SELECT f.id, f.parent_id, f.name, f.version_id, COALESCE(v.frozen, FALSE) AS frozen "
                   "FROM files f LEFT JOIN versions v ON v.file_id = f.id AND v.id = f.version_id "
                   "WHERE f.id = $1");

    conn_->prepare("find_file",
                   "SELECT f.id, f.parent_id, f.name, f.version_id, COALESCE(v.frozen, FALSE) AS frozen "
                   "FROM files f LEFT JOIN versions v ON v.file_id = f.id AND v.id = f.version_id "
                   "WHERE f.parent_id = $1 AND f.name = $2");

    conn_->prepare("list_file_ids", "SELECT id FROM files WHERE parent_id = $1");

    conn_->prepare("insert_file", "INSERT INTO files (id, parent_id, name, version_id) VALUES ($1, $2, $3, $4)");

    conn_->prepare("update_file", "UPDATE files SET parent_id = $2, name = $3, version_id = $4 WHERE id = $1");

    conn_->prepare("delete_file", "DELETE FROM files WHERE id = $1");

    conn_->prepare("scan_files",
                   "SELECT f.id, f.parent_id, f.name, f.version_id, COALESCE(v.frozen, FALSE) AS frozen "
                   "FROM files f LEFT JOIN versions v ON v.file_id = f.id AND v.id = f.version_id");
}
