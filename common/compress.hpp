#pragma once

// ============================================================
// compress.hpp -- zstd wrapper for snapshot payloads
// ============================================================

#include "platform.hpp"
#include <vector>
#include <string>
#include <stdexcept>
#include <functional>

#include <zstd.h>

namespace compress {

static constexpr int ZSTD_LEVEL = 3;

// Returns the maximum compressed size for a given input size
inline size_t max_compressed_size(size_t input_size) {
    return ZSTD_compressBound(input_size);
}

// Compress to a resizable buffer; returns compressed data
inline std::vector<u8> compress_to_vec(const void* src, size_t src_len) {
    size_t cap = max_compressed_size(src_len);
    std::vector<u8> buf(cap);
    size_t result = ZSTD_compress(buf.data(), cap, src, src_len, ZSTD_LEVEL);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(result));
    }
    buf.resize(result);
    return buf;
}

// Streaming decompression: 'sink' receives each decompressed block in
// order. Memory stays bounded regardless of the decompressed size.
// Returns the total number of decompressed bytes. Throws on corrupt or
// truncated input.
inline u64 decompress_stream(const void* src, size_t src_len,
                             const std::function<void(const u8*, size_t)>& sink) {
    ZSTD_DCtx* dctx = ZSTD_createDCtx();
    if (!dctx) throw std::runtime_error("ZSTD_createDCtx failed");

    std::vector<u8> out_buf(ZSTD_DStreamOutSize());
    ZSTD_inBuffer in{src, src_len, 0};
    u64 total = 0;
    size_t last_ret = 0;

    try {
        while (in.pos < in.size) {
            ZSTD_outBuffer out{out_buf.data(), out_buf.size(), 0};
            last_ret = ZSTD_decompressStream(dctx, &out, &in);
            if (ZSTD_isError(last_ret)) {
                throw std::runtime_error(std::string("ZSTD decompress error: ") +
                                         ZSTD_getErrorName(last_ret));
            }
            if (out.pos > 0) {
                sink(out_buf.data(), out.pos);
                total += out.pos;
            }
        }
        // Flush whatever the decoder still holds once input is consumed
        while (last_ret != 0) {
            ZSTD_outBuffer out{out_buf.data(), out_buf.size(), 0};
            last_ret = ZSTD_decompressStream(dctx, &out, &in);
            if (ZSTD_isError(last_ret)) {
                throw std::runtime_error(std::string("ZSTD decompress error: ") +
                                         ZSTD_getErrorName(last_ret));
            }
            if (out.pos == 0) break;
            sink(out_buf.data(), out.pos);
            total += out.pos;
        }
    } catch (...) {
        ZSTD_freeDCtx(dctx);
        throw;
    }
    ZSTD_freeDCtx(dctx);

    if (last_ret != 0) {
        throw std::runtime_error("ZSTD stream truncated");
    }
    return total;
}

} // namespace compress
