#include "fs/BlobStore.hpp"
#include "fs/errors.hpp"
#include "db/Session.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <zlib.h>

using namespace tfs::fs;
using namespace tfs::config;

namespace {

constexpr std::size_t INFLATE_BUFFER_SIZE = 64 * 1024;

struct InflateStream {
    z_stream zs{};
    bool open = false;

    InflateStream() {
        if (inflateInit(&zs) != Z_OK) throw std::runtime_error("inflateInit failed");
        open = true;
    }

    ~InflateStream() { if (open) inflateEnd(&zs); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

}

BlobStore::Chunks BlobStore::chunk(const Bytes& payload) {
    const auto& cnf = ConfigRegistry::get().storage;
    return chunk(payload, cnf.chunkSizeBytes(), cnf.compression_level);
}

BlobStore::Chunks BlobStore::chunk(const Bytes& payload, const std::size_t maxChunkSize, const int level) {
    if (maxChunkSize == 0) throw std::invalid_argument("Chunk size must be positive");

    Chunks chunks;
    chunks.reserve(payload.size() / maxChunkSize + 1);
    for (std::size_t offset = 0; offset < payload.size(); offset += maxChunkSize) {
        const auto portion = std::min(maxChunkSize, payload.size() - offset);
        chunks.push_back(compress(payload.data() + offset, portion, level));
    }
    return chunks;
}

BlobStore::Bytes BlobStore::reconstruct(const Chunks& chunks) {
    Bytes out;
    for (std::size_t i = 0; i < chunks.size(); ++i) decompress(chunks[i], i, out);
    return out;
}

void BlobStore::store(db::Txn& txn, const std::string& blobId, const Chunks& chunks) {
    int32_t pos = 0;
    for (const auto& c : chunks) txn.insertChunk(blobId, pos++, c);
}

BlobStore::Chunks BlobStore::fetch(db::Txn& txn, const std::string& blobId) {
    return fetch(txn, blobId, ConfigRegistry::get().storage.read_page_size);
}

BlobStore::Chunks BlobStore::fetch(db::Txn& txn, const std::string& blobId, const unsigned int pageSize) {
    if (pageSize == 0) throw std::invalid_argument("Page size must be positive");

    Chunks chunks;
    int32_t cursor = -1;
    std::size_t count = 0;
    do {
        auto page = txn.readChunks(blobId, cursor, pageSize);
        count = page.size();
        for (auto& c : page) {
            if (c.pos != static_cast<int32_t>(chunks.size()))
                throw DataCorruptionError("Blob " + blobId + " is missing chunk " + std::to_string(chunks.size()));
            cursor = c.pos;
            chunks.push_back(std::move(c.data));
        }
    } while (count >= pageSize);
    return chunks;
}

void BlobStore::remove(db::Txn& txn, const std::string& blobId) { txn.deleteChunks(blobId); }

BlobStore::Bytes BlobStore::compress(const uint8_t* data, const std::size_t size, const int level) {
    uLongf destLen = compressBound(static_cast<uLong>(size));
    Bytes out(destLen);
    const auto rc = compress2(out.data(), &destLen, data, static_cast<uLong>(size), level);
    if (rc != Z_OK) throw std::runtime_error("compress2 failed with code " + std::to_string(rc));
    out.resize(destLen);
    return out;
}

void BlobStore::decompress(const Bytes& chunk, const std::size_t index, Bytes& out) {
    if (chunk.empty()) return;

    const auto corrupt = [&](const std::string& why) {
        log::Registry::storage()->error("[BlobStore] Chunk {} failed to inflate: {}", index, why);
        return DataCorruptionError("Decompression failed at chunk " + std::to_string(index) + ": " + why);
    };

    InflateStream stream;
    auto& zs = stream.zs;
    zs.next_in = const_cast<Bytef*>(chunk.data());
    zs.avail_in = static_cast<uInt>(chunk.size());

    Bytes buffer(INFLATE_BUFFER_SIZE);
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        switch (rc) {
        case Z_OK:
        case Z_STREAM_END:
            break;
        case Z_BUF_ERROR:
            throw corrupt("truncated stream");
        default:
            throw corrupt(zs.msg ? zs.msg : "inflate error " + std::to_string(rc));
        }
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(buffer.size() - zs.avail_out));
    }

    if (zs.avail_in != 0) throw corrupt("trailing bytes after end of stream");
}
