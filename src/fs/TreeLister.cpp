#include "fs/TreeLister.hpp"
#include "db/Session.hpp"
#include "log/Registry.hpp"

using namespace tfs::fs;
using namespace tfs::fs::model;

Listing TreeLister::load(db::Txn& txn) {
    Listing listing;
    for (auto& folder : txn.scanFolders()) listing.folders.emplace(folder.id, std::move(folder));
    for (auto& file : txn.scanFiles()) listing.files.emplace(file.id, std::move(file));
    listing.link();

    log::Registry::fs()->debug("[TreeLister] Loaded {} folders and {} files", listing.folders.size(), listing.files.size());
    return listing;
}
