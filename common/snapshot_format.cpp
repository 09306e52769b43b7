// ============================================================
// snapshot_format.cpp -- Snapshot container encode/validate
// ============================================================

#include "snapshot_format.hpp"
#include "protocol_io.hpp"
#include "compress.hpp"
#include <cstring>

namespace {

void encode_snapshot_header(SnapshotHeader& h) {
    h.magic       = proto::hton32(h.magic);
    h.raw_size    = proto::hton64(h.raw_size);
    h.stored_size = proto::hton64(h.stored_size);
}

void decode_snapshot_header(SnapshotHeader& h) {
    h.magic       = proto::ntoh32(h.magic);
    h.raw_size    = proto::ntoh64(h.raw_size);
    h.stored_size = proto::ntoh64(h.stored_size);
}

} // namespace

namespace snapshot {

SnapshotInfo validate(const void* data, size_t len) {
    if (len == 0) {
        throw SnapshotError("snapshot is empty");
    }
    if (len < sizeof(SnapshotHeader)) {
        throw SnapshotError("snapshot truncated: " + std::to_string(len) +
                            " bytes, header needs " + std::to_string(sizeof(SnapshotHeader)));
    }

    SnapshotHeader h{};
    std::memcpy(&h, data, sizeof(h));
    decode_snapshot_header(h);

    if (h.magic != SNAPSHOT_MAGIC) {
        throw SnapshotError("bad snapshot magic");
    }
    if (h.version != SNAPSHOT_VERSION) {
        throw SnapshotError("unsupported snapshot version " + std::to_string(h.version));
    }

    const u8* payload = static_cast<const u8*>(data) + sizeof(SnapshotHeader);
    u64 payload_len   = (u64)len - sizeof(SnapshotHeader);
    if (h.stored_size != payload_len) {
        throw SnapshotError("snapshot length mismatch: header says " +
                            std::to_string(h.stored_size) + " bytes, got " +
                            std::to_string(payload_len));
    }

    SnapshotInfo info;
    info.raw_size    = h.raw_size;
    info.stored_size = h.stored_size;

    hash::StreamHasher128 hasher;
    switch (static_cast<CompressAlgo>(h.compress_algo)) {
        case CompressAlgo::NONE:
            if (h.raw_size != h.stored_size) {
                throw SnapshotError("uncompressed snapshot with raw_size != stored_size");
            }
            info.algo = CompressAlgo::NONE;
            hasher.update(payload, (size_t)payload_len);
            break;

        case CompressAlgo::ZSTD: {
            if (payload_len == 0) {
                throw SnapshotError("compressed snapshot has no payload");
            }
            info.algo = CompressAlgo::ZSTD;
            u64 produced = 0;
            u64 seen     = 0;
            try {
                produced = compress::decompress_stream(payload, (size_t)payload_len,
                    [&](const u8* p, size_t n) {
                        seen += n;
                        if (seen > h.raw_size) {
                            throw std::runtime_error("payload inflates past raw_size");
                        }
                        hasher.update(p, n);
                    });
            } catch (const std::runtime_error& e) {
                throw SnapshotError(std::string("corrupt snapshot payload: ") + e.what());
            }
            if (produced != h.raw_size) {
                throw SnapshotError("decompressed size " + std::to_string(produced) +
                                    " does not match header " + std::to_string(h.raw_size));
            }
            break;
        }

        default:
            throw SnapshotError("unknown snapshot compression " +
                                std::to_string(h.compress_algo));
    }

    info.digest = hasher.digest();
    if (info.digest != hash::from_bytes(h.xxh3_128)) {
        throw SnapshotError("snapshot digest mismatch");
    }
    return info;
}

std::vector<u8> build(const void* payload, size_t len, CompressAlgo algo) {
    std::vector<u8> body;
    if (algo == CompressAlgo::ZSTD) {
        body = compress::compress_to_vec(payload, len);
    } else if (len > 0) {
        const u8* p = static_cast<const u8*>(payload);
        body.assign(p, p + len);
    }

    SnapshotHeader h{};
    h.magic         = SNAPSHOT_MAGIC;
    h.version       = SNAPSHOT_VERSION;
    h.compress_algo = static_cast<u8>(algo);
    h.raw_size      = len;
    h.stored_size   = body.size();
    hash::to_bytes(hash::xxh3_128(payload, len), h.xxh3_128);
    encode_snapshot_header(h);

    std::vector<u8> out(sizeof(h) + body.size());
    std::memcpy(out.data(), &h, sizeof(h));
    if (!body.empty()) {
        std::memcpy(out.data() + sizeof(h), body.data(), body.size());
    }
    return out;
}

} // namespace snapshot
