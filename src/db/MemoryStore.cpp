#include "db/MemoryStore.hpp"
#include "db/errors.hpp"

#include <limits>
#include <stdexcept>

using namespace tfs::db;
using namespace tfs::fs::model;

namespace tfs::db {

class MemoryTxn final : public Txn {
public:
    MemoryTxn(std::shared_ptr<MemoryStore> store, const TxMode mode)
        : store_(std::move(store)), mode_(mode) {
        if (mode_ == TxMode::ReadWrite) writer_ = std::unique_lock(store_->writer_mtx_);
        base_ = store_->snapshot();
    }

    [[nodiscard]] TxMode mode() const override { return mode_; }

    std::optional<Folder> findFolder(const std::string& parentId, const std::string& name) override {
        const auto& t = tables();
        const auto it = t.folderNames.find({parentId, name});
        if (it == t.folderNames.end()) return std::nullopt;
        return t.folders.at(it->second);
    }

    std::optional<Folder> getFolder(const std::string& id) override {
        const auto& t = tables();
        const auto it = t.folders.find(id);
        if (it == t.folders.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Folder> listSubFolders(const std::string& parentId) override {
        std::vector<Folder> out;
        for (const auto& [id, folder] : tables().folders)
            if (folder.parent_id == parentId && !folder.isRoot()) out.push_back(folder);
        return out;
    }

    void insertFolder(const Folder& folder) override {
        auto& t = writable();
        if (t.folders.contains(folder.id)) throw ConstraintError("Duplicate folder id: " + folder.id);
        if (t.folderNames.contains({folder.parent_id, folder.name}))
            throw ConstraintError("Duplicate folder name '" + folder.name + "' in " + folder.parent_id);
        t.folders[folder.id] = folder;
        t.folderNames[{folder.parent_id, folder.name}] = folder.id;
    }

    void updateFolder(const Folder& folder) override {
        auto& t = writable();
        const auto it = t.folders.find(folder.id);
        if (it == t.folders.end()) return;
        const auto existing = t.folderNames.find({folder.parent_id, folder.name});
        if (existing != t.folderNames.end() && existing->second != folder.id)
            throw ConstraintError("Duplicate folder name '" + folder.name + "' in " + folder.parent_id);
        t.folderNames.erase({it->second.parent_id, it->second.name});
        it->second = folder;
        t.folderNames[{folder.parent_id, folder.name}] = folder.id;
    }

    void deleteFolders(const std::vector<std::string>& ids) override {
        auto& t = writable();
        for (const auto& id : ids) {
            const auto it = t.folders.find(id);
            if (it == t.folders.end() || it->second.isRoot()) continue;
            t.folderNames.erase({it->second.parent_id, it->second.name});
            t.folders.erase(it);
        }
    }

    std::vector<Folder> scanFolders() override {
        std::vector<Folder> out;
        for (const auto& [id, folder] : tables().folders) out.push_back(folder);
        return out;
    }

    std::optional<File> getFile(const std::string& id) override {
        const auto& t = tables();
        const auto it = t.files.find(id);
        if (it == t.files.end()) return std::nullopt;
        return withFrozen(t, it->second);
    }

    std::optional<File> findFile(const std::string& parentId, const std::string& name) override {
        const auto& t = tables();
        const auto it = t.fileNames.find({parentId, name});
        if (it == t.fileNames.end()) return std::nullopt;
        return withFrozen(t, t.files.at(it->second));
    }

    std::vector<std::string> listFileIds(const std::string& folderId) override {
        std::vector<std::string> out;
        for (const auto& [id, file] : tables().files)
            if (file.parent_id == folderId) out.push_back(id);
        return out;
    }

    void insertFile(const File& file) override {
        auto& t = writable();
        if (t.files.contains(file.id)) throw ConstraintError("Duplicate file id: " + file.id);
        if (t.fileNames.contains({file.parent_id, file.name}))
            throw ConstraintError("Duplicate file name '" + file.name + "' in " + file.parent_id);
        auto row = file;
        row.frozen = false;
        t.files[file.id] = row;
        t.fileNames[{file.parent_id, file.name}] = file.id;
    }

    void updateFile(const File& file) override {
        auto& t = writable();
        const auto it = t.files.find(file.id);
        if (it == t.files.end()) return;
        const auto existing = t.fileNames.find({file.parent_id, file.name});
        if (existing != t.fileNames.end() && existing->second != file.id)
            throw ConstraintError("Duplicate file name '" + file.name + "' in " + file.parent_id);
        t.fileNames.erase({it->second.parent_id, it->second.name});
        it->second = file;
        it->second.frozen = false;
        t.fileNames[{file.parent_id, file.name}] = file.id;
    }

    void deleteFile(const std::string& id) override {
        auto& t = writable();
        const auto it = t.files.find(id);
        if (it == t.files.end()) return;
        t.fileNames.erase({it->second.parent_id, it->second.name});
        t.files.erase(it);
    }

    std::vector<File> scanFiles() override {
        const auto& t = tables();
        std::vector<File> out;
        for (const auto& [id, file] : t.files) out.push_back(withFrozen(t, file));
        return out;
    }

    std::optional<Version> getVersion(const std::string& fileId, const std::string& versionId) override {
        const auto& t = tables();
        const auto it = t.versions.find({fileId, versionId});
        if (it == t.versions.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Version> listVersions(const std::string& fileId) override {
        const auto& t = tables();
        std::vector<Version> out;
        for (auto it = t.versions.lower_bound({fileId, ""}); it != t.versions.end() && it->first.first == fileId; ++it)
            out.push_back(it->second);
        return out;
    }

    void upsertVersion(const Version& version) override {
        writable().versions[{version.file_id, version.id}] = version;
    }

    void deleteVersions(const std::string& fileId) override {
        auto& t = writable();
        auto it = t.versions.lower_bound({fileId, ""});
        while (it != t.versions.end() && it->first.first == fileId) it = t.versions.erase(it);
    }

    void insertChunk(const std::string& blobId, const int32_t pos, const std::vector<uint8_t>& data) override {
        writable().chunks[{blobId, pos}] = std::make_shared<const std::vector<uint8_t>>(data);
    }

    std::vector<Chunk> readChunks(const std::string& blobId, const int32_t afterPos, const unsigned int limit) override {
        const auto& t = tables();
        std::vector<Chunk> out;
        for (auto it = t.chunks.upper_bound({blobId, afterPos});
             it != t.chunks.end() && it->first.first == blobId && out.size() < limit; ++it)
            out.push_back({it->first.second, *it->second});
        return out;
    }

    void deleteChunks(const std::string& blobId) override {
        auto& t = writable();
        auto it = t.chunks.lower_bound({blobId, std::numeric_limits<int32_t>::min()});
        while (it != t.chunks.end() && it->first.first == blobId) it = t.chunks.erase(it);
    }

    std::size_t countChunks(const std::string& blobId) override {
        const auto& t = tables();
        std::size_t n = 0;
        for (auto it = t.chunks.lower_bound({blobId, std::numeric_limits<int32_t>::min()});
             it != t.chunks.end() && it->first.first == blobId; ++it) ++n;
        return n;
    }

    void commit() override {
        if (mode_ != TxMode::ReadWrite) throw std::logic_error("Cannot commit a read-only transaction");
        if (committed_) throw std::logic_error("Transaction already committed");
        if (store_->consumeFault(store_->failCommits_))
            throw TransientError("Injected commit failure");
        if (work_) store_->publish(std::move(*work_));
        committed_ = true;
    }

private:
    std::shared_ptr<MemoryStore> store_;
    TxMode mode_;
    std::unique_lock<std::mutex> writer_;
    std::shared_ptr<const MemoryStore::Tables> base_;
    std::optional<MemoryStore::Tables> work_;
    bool committed_ = false;

    [[nodiscard]] const MemoryStore::Tables& tables() const { return work_ ? *work_ : *base_; }

    MemoryStore::Tables& writable() {
        if (mode_ != TxMode::ReadWrite) throw std::logic_error("Write attempted in a read-only transaction");
        if (committed_) throw std::logic_error("Write attempted after commit");
        if (!work_) work_ = *base_;
        return *work_;
    }

    static File withFrozen(const MemoryStore::Tables& t, const File& row) {
        auto file = row;
        const auto v = t.versions.find({row.id, row.version_id});
        file.frozen = v != t.versions.end() && v->second.frozen;
        return file;
    }
};

}

MemoryStore::MemoryStore() {
    Tables t;
    const auto root = Folder::root();
    t.folders[root.id] = root;
    state_ = std::make_shared<const Tables>(std::move(t));
}

std::unique_ptr<Txn> MemoryStore::begin(const TxMode mode) {
    if (consumeFault(failBegins_)) throw TransientError("Injected session failure");
    return std::make_unique<MemoryTxn>(shared_from_this(), mode);
}

void MemoryStore::failNextBegins(const unsigned int n) {
    std::lock_guard lock(state_mtx_);
    failBegins_ = n;
}

void MemoryStore::failNextCommits(const unsigned int n) {
    std::lock_guard lock(state_mtx_);
    failCommits_ = n;
}

unsigned int MemoryStore::commits() const {
    std::lock_guard lock(state_mtx_);
    return commits_;
}

std::size_t MemoryStore::totalChunks() const { return snapshot()->chunks.size(); }

std::size_t MemoryStore::totalFolders() const { return snapshot()->folders.size(); }

std::size_t MemoryStore::totalVersions() const { return snapshot()->versions.size(); }

std::shared_ptr<const MemoryStore::Tables> MemoryStore::snapshot() const {
    std::lock_guard lock(state_mtx_);
    return state_;
}

void MemoryStore::publish(Tables&& tables) {
    auto next = std::make_shared<const Tables>(std::move(tables));
    std::lock_guard lock(state_mtx_);
    state_ = std::move(next);
    ++commits_;
}

bool MemoryStore::consumeFault(unsigned int& counter) {
    std::lock_guard lock(state_mtx_);
    if (counter == 0) return false;
    --counter;
    return true;
}
