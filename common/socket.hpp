#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote (IPv4 literal or resolvable host name)
    void connect(const std::string& host, u16 port);

    // Server: bind + listen. port 0 picks an ephemeral port (see local_port()).
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close or timeout
    bool recv_all(void* buf, size_t len);

    // Read and drop incoming bytes until the peer closes or 'ms' elapse.
    // Returns the number of bytes dropped.
    size_t discard_input(int ms);

    // Send a complete frame (header + payload)
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len);

    // Read next frame: fills header, resizes payload_buf and reads payload.
    // Returns false on close, timeout or a frame truncated by the peer.
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    // Half-close: no more data from this side, peer sees EOF
    void shutdown_send();

    // Wake any thread blocked in accept()/recv() on this socket
    void shutdown_both();

    // Apply TCP performance tuning
    void tune();

    socket_t native() const { return fd_; }

    void close();

    // Get peer address as string
    std::string peer_addr() const;

    // Port this socket is bound to (0 if unknown)
    u16 local_port() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

    // True if the last failed recv_all() ended on SO_RCVTIMEO
    bool timed_out() const { return timed_out_; }

private:
    socket_t fd_{INVALID_SOCKET_VAL};
    bool     timed_out_{false};

    void apply_socket_opts();
};
