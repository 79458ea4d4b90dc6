#include "db/DBConnection.hpp"

void tfs::db::DBConnection::initPreparedFolders() const {
    conn_->prepare("find_folder", "SELECT id, parent_id, name FROM folders WHERE parent_id = $1 AND name = $2");

    conn_->prepare("get_folder", "SELECT id, parent_id, name FROM folders WHERE id = $1");

    conn_->prepare("list_sub_folders",
                   "SELECT id, parent_id, name FROM folders WHERE parent_id = $1 AND id <> parent_id");

    conn_->prepare("insert_folder", "INSERT INTO folders (id, parent_id, name) VALUES ($1, $2, $3)");

    conn_->prepare("update_folder", "UPDATE folders SET parent_id = $2, name = $3 WHERE id = $1");

    conn_->prepare("delete_folders", "DELETE FROM folders WHERE id = ANY($1::TEXT[]) AND id <> parent_id");

    conn_->prepare("scan_folders", "SELECT id, parent_id, name FROM folders");
}
