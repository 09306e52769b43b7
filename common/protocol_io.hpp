#pragma once

// ============================================================
// protocol_io.hpp -- Frame and RESULT encoding with byte-order handling
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <stdexcept>
#include <algorithm>

// Linux: htobe16/32/64 and be16/32/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- RESULT payload ----

// Build the RESULT payload: ResultHdr followed by the (truncated) message.
inline std::vector<u8> encode_result(const RestoreResult& r) {
    u32 msg_len = (u32)std::min<size_t>(r.message.size(), MAX_RESULT_MESSAGE);
    ResultHdr h{};
    h.status  = hton32(static_cast<u32>(r.status));
    h.msg_len = hton32(msg_len);

    std::vector<u8> out(sizeof(ResultHdr) + msg_len);
    std::memcpy(out.data(), &h, sizeof(h));
    if (msg_len > 0) {
        std::memcpy(out.data() + sizeof(h), r.message.data(), msg_len);
    }
    return out;
}

// Parse a RESULT payload; throws ProtocolError on a malformed payload.
inline RestoreResult decode_result(const std::vector<u8>& payload) {
    if (payload.size() < sizeof(ResultHdr)) {
        throw ProtocolError("RESULT payload too short: " + std::to_string(payload.size()));
    }
    ResultHdr h{};
    std::memcpy(&h, payload.data(), sizeof(h));
    u32 status  = ntoh32(h.status);
    u32 msg_len = ntoh32(h.msg_len);
    if (msg_len > MAX_RESULT_MESSAGE || sizeof(ResultHdr) + msg_len != payload.size()) {
        throw ProtocolError("RESULT message length mismatch");
    }
    if (status > static_cast<u32>(RestoreStatus::ERR_INTERNAL)) {
        throw ProtocolError("RESULT carries unknown status " + std::to_string(status));
    }

    RestoreResult r;
    r.status = static_cast<RestoreStatus>(status);
    r.message.assign(reinterpret_cast<const char*>(payload.data()) + sizeof(ResultHdr), msg_len);
    return r;
}

} // namespace proto
