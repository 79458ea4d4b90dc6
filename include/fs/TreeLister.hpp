#pragma once

#include "fs/model/Listing.hpp"

namespace tfs::db { class Txn; }

namespace tfs::fs {

class TreeLister {
public:
    [[nodiscard]] static model::Listing load(db::Txn& txn);
};

}
