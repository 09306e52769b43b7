#pragma once

// ============================================================
// restore_client.hpp -- snapcp client: upload one snapshot
//
//   OPEN -> CHUNK* (read-fully batches) -> END + half-close
//        -> wait for RESULT
//
// A failure at any stage ends the attempt. Nothing is retried: chunks
// are not acknowledged, so a new attempt has to start from byte 0.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/file_io.hpp"
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>

// Upper bound for the RESULT wait (--timeout), in seconds
static constexpr int MAX_RESULT_TIMEOUT_S = 86400;

// Stage-tagged failure of a restore attempt ("failed to connect: ...")
class RestoreError : public std::runtime_error {
public:
    explicit RestoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// The client's half of a session channel
class RestoreStream {
public:
    virtual ~RestoreStream() = default;

    virtual void send_open() = 0;
    virtual void send_chunk(const void* data, size_t len) = 0;

    // END marker followed by a write-side shutdown
    virtual void send_end() = 0;

    // Blocks for the terminal RESULT
    virtual RestoreResult recv_result() = 0;

    // After a failed send the server may already have answered (e.g. a
    // size limit). Returns true if a RESULT could still be read.
    virtual bool try_recv_result(RestoreResult& /*out*/) { return false; }
};

// RestoreStream over one TCP connection
class TcpRestoreStream : public RestoreStream {
public:
    // Connects immediately; throws std::runtime_error on failure.
    // timeout_s bounds the wait for RESULT (0 = wait forever) and must be
    // within 0..MAX_RESULT_TIMEOUT_S, else std::invalid_argument.
    TcpRestoreStream(const std::string& host, u16 port, int timeout_s = 0);

    void send_open() override;
    void send_chunk(const void* data, size_t len) override;
    void send_end() override;
    RestoreResult recv_result() override;
    bool try_recv_result(RestoreResult& out) override;

private:
    TcpSocket sock_;
};

// Pick the snapshot source from the positional arguments:
//   <path>  open the file
//   -       standard input, even if it is a terminal
//   (none)  standard input, refused if it is a terminal
// Throws RestoreError.
file_io::ByteSource select_source(const std::vector<std::string>& args,
                                  bool stdin_is_terminal);
file_io::ByteSource select_source(const std::vector<std::string>& args);

// Server to connect to: addr_opt if given, else SNAPCP_SERVER_ADDR, else
// 127.0.0.1:DEFAULT_SERVER_PORT. Throws RestoreError when the deployment
// disables the server or the address is malformed. 'lookup' defaults to
// the process environment.
void resolve_server(const std::string& addr_opt, std::string& host, u16& port,
                    const std::function<const char*(const char*)>& lookup = nullptr);

class RestoreClient {
public:
    explicit RestoreClient(size_t chunk_size = RESTORE_CHUNK_SIZE);

    // Drive one session from src over stream. Returns the server's
    // RESULT, which may be a rejection; throws RestoreError when the
    // attempt fails before a RESULT arrives.
    RestoreResult run(file_io::ByteSource& src, RestoreStream& stream);

    u64 bytes_sent() const { return bytes_sent_; }
    u64 chunks_sent() const { return chunks_sent_; }

private:
    size_t chunk_size_;
    u64    bytes_sent_{0};
    u64    chunks_sent_{0};

    // A send failed at 'stage'; prefer the server's own verdict if any
    RestoreResult send_failed(RestoreStream& stream, const std::string& stage,
                              const std::exception& e);
};
