#pragma once

#include "db/Session.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace tfs::db {

/// In-process table store.
///
/// Read-write transactions are serialized by a single writer lock and work on a private copy of
/// the tables that replaces the published state on commit. Read-only transactions read the state
/// published when they began. Chunk payloads are shared between copies, never duplicated.
class MemoryStore final : public SessionFactory, public std::enable_shared_from_this<MemoryStore> {
public:
    struct Tables {
        using Key = std::pair<std::string, std::string>;

        std::map<std::string, fs::model::Folder> folders;
        std::map<Key, std::string> folderNames;
        std::map<std::string, fs::model::File> files;
        std::map<Key, std::string> fileNames;
        std::map<Key, fs::model::Version> versions;
        std::map<std::pair<std::string, int32_t>, std::shared_ptr<const std::vector<uint8_t>>> chunks;
    };

    MemoryStore();

    std::unique_ptr<Txn> begin(TxMode mode) override;

    // Fault injection: the next n begin()/commit() calls throw TransientError.
    void failNextBegins(unsigned int n);
    void failNextCommits(unsigned int n);

    [[nodiscard]] unsigned int commits() const;
    [[nodiscard]] std::size_t totalChunks() const;
    [[nodiscard]] std::size_t totalFolders() const;
    [[nodiscard]] std::size_t totalVersions() const;

private:
    friend class MemoryTxn;

    [[nodiscard]] std::shared_ptr<const Tables> snapshot() const;
    void publish(Tables&& tables);
    bool consumeFault(unsigned int& counter);

    mutable std::mutex state_mtx_;
    std::mutex writer_mtx_;
    std::shared_ptr<const Tables> state_;
    unsigned int failBegins_ = 0, failCommits_ = 0, commits_ = 0;
};

}
