#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tfs::db { class Txn; }

namespace tfs::fs {

/// Chunked, per-chunk deflate-compressed payload storage.
///
/// chunk() and reconstruct() are pure CPU work and are meant to run outside the transaction;
/// store(), fetch() and remove() touch rows and run inside it.
class BlobStore {
public:
    using Bytes = std::vector<uint8_t>;
    using Chunks = std::vector<Bytes>;

    /// Splits payload into pieces of at most maxChunkSize bytes and compresses each one.
    /// An empty payload yields no chunks.
    [[nodiscard]] static Chunks chunk(const Bytes& payload);
    [[nodiscard]] static Chunks chunk(const Bytes& payload, std::size_t maxChunkSize, int level);

    /// Inflates every chunk independently and concatenates the results in order.
    /// Throws DataCorruptionError when a chunk does not inflate cleanly.
    [[nodiscard]] static Bytes reconstruct(const Chunks& chunks);

    /// Writes chunks as rows (blobId, 0..n-1).
    static void store(db::Txn& txn, const std::string& blobId, const Chunks& chunks);

    /// Reads all chunk rows of blobId in position order, pageSize rows per round trip.
    [[nodiscard]] static Chunks fetch(db::Txn& txn, const std::string& blobId);
    [[nodiscard]] static Chunks fetch(db::Txn& txn, const std::string& blobId, unsigned int pageSize);

    static void remove(db::Txn& txn, const std::string& blobId);

private:
    static Bytes compress(const uint8_t* data, std::size_t size, int level);
    static void decompress(const Bytes& chunk, std::size_t index, Bytes& out);
};

}
