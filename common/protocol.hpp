#pragma once

// protocol.hpp -- Wire protocol definitions for snapcp restore sessions

#include "platform.hpp"
#include <cstring>
#include <string>

static constexpr u8  SNAPCP_PROTOCOL_VERSION = 1;

// Client-side frame ceiling: each CHUNK carries at most this many bytes.
static constexpr u32 RESTORE_CHUNK_SIZE = 1024u;
// Server-side ceiling on any single frame payload. Larger client chunk sizes
// are accepted up to this limit; anything above is a protocol violation.
static constexpr u32 MAX_CHUNK_PAYLOAD  = 4u * 1024u * 1024u;
// Upper bound on the error text carried in a RESULT frame.
static constexpr u32 MAX_RESULT_MESSAGE = 4096u;

static constexpr u16 DEFAULT_SERVER_PORT = 9701;

// ---- Message Types (all prefixed MT_ to avoid Windows macro collisions) ----
enum class MsgType : u16 {
    MT_RESTORE_OPEN   = 0x0001,  // client→server: start of session, no payload
    MT_RESTORE_CHUNK  = 0x0002,  // client→server: next slice of the snapshot
    MT_RESTORE_END    = 0x0003,  // client→server: half-close marker, no payload

    MT_RESTORE_RESULT = 0x0010,  // server→client: ResultHdr + message
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ---- Terminal status of a restore session ----
enum class RestoreStatus : u32 {
    OK                   = 0,
    ERR_PROTOCOL         = 1,
    ERR_INVALID_SNAPSHOT = 2,
    ERR_APPLY            = 3,
    ERR_TOO_LARGE        = 4,
    ERR_INTERNAL         = 5,
};

inline const char* restore_status_str(RestoreStatus s) {
    switch (s) {
        case RestoreStatus::OK:                   return "ok";
        case RestoreStatus::ERR_PROTOCOL:         return "protocol violation";
        case RestoreStatus::ERR_INVALID_SNAPSHOT: return "invalid snapshot";
        case RestoreStatus::ERR_APPLY:            return "apply failed";
        case RestoreStatus::ERR_TOO_LARGE:        return "snapshot too large";
        case RestoreStatus::ERR_INTERNAL:         return "internal error";
    }
    return "unknown status";
}

// Decoded RESULT frame
struct RestoreResult {
    RestoreStatus status{RestoreStatus::OK};
    std::string   message;

    bool ok() const { return status == RestoreStatus::OK; }

    static RestoreResult success() { return RestoreResult{}; }
    static RestoreResult failure(RestoreStatus st, std::string msg) {
        RestoreResult r;
        r.status  = st;
        r.message = std::move(msg);
        return r;
    }
};

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// ResultHdr: 8 bytes fixed + message
struct ResultHdr {
    u32 status;
    u32 msg_len;
};
static_assert(sizeof(ResultHdr) == 8, "ResultHdr size mismatch");

#pragma pack(pop)

// Thrown when the peer sends frames out of the session order.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};
