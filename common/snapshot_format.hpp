#pragma once

// ============================================================
// snapshot_format.hpp -- Snapshot container header + validation
//
// A snapshot is opaque to the restore protocol. Before the server
// swaps it in as its persisted state it must pass validate():
//
//   [SnapshotHeader 48 bytes, big-endian][payload stored_size bytes]
//
// The digest covers the raw (decompressed) payload.
// ============================================================

#include "platform.hpp"
#include "hash.hpp"
#include <string>
#include <vector>
#include <stdexcept>

// Magic number: "SNPS"
static constexpr u32 SNAPSHOT_MAGIC   = 0x534E5053u;
static constexpr u8  SNAPSHOT_VERSION = 1;

// ---- Compress algo ----
enum class CompressAlgo : u8 {
    NONE = 0,
    ZSTD = 1,
};

#pragma pack(push, 1)

// SnapshotHeader: 48 bytes
struct SnapshotHeader {
    u32 magic;
    u8  version;
    u8  compress_algo;
    u8  pad[2];
    u64 raw_size;       // payload size after decompression
    u64 stored_size;    // bytes following the header
    u8  xxh3_128[16];   // digest of the raw payload
    u8  pad2[8];
};
static_assert(sizeof(SnapshotHeader) == 48, "SnapshotHeader size mismatch");

#pragma pack(pop)

// Thrown by snapshot::validate() with a description of the first defect
class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& msg) : std::runtime_error(msg) {}
};

namespace snapshot {

// What a successful validation learned about the container
struct SnapshotInfo {
    CompressAlgo  algo{CompressAlgo::NONE};
    u64           raw_size{0};
    u64           stored_size{0};
    hash::Hash128 digest{};
};

// Validate a complete snapshot image. Throws SnapshotError.
SnapshotInfo validate(const void* data, size_t len);

// Build a snapshot image around 'payload'
std::vector<u8> build(const void* payload, size_t len,
                      CompressAlgo algo = CompressAlgo::NONE);

inline std::vector<u8> build(const std::string& payload,
                             CompressAlgo algo = CompressAlgo::NONE) {
    return build(payload.data(), payload.size(), algo);
}

inline std::vector<u8> build(const std::vector<u8>& payload,
                             CompressAlgo algo = CompressAlgo::NONE) {
    return build(payload.data(), payload.size(), algo);
}

} // namespace snapshot
