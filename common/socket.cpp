// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <climits>
#include <chrono>

#ifndef _WIN32
#  include <sys/uio.h>
#  include <sys/time.h>
#endif

// Socket buffers are kept modest: frames are small and the sender must
// feel backpressure from the receiver rather than queue megabytes.
static constexpr int SOCKET_BUF_SIZE = 256 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_), timed_out_(o.timed_out_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        timed_out_ = o.timed_out_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;

#ifdef _WIN32
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  (const char*)&nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    (const char*)&sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    (const char*)&rcvbuf,    sizeof(rcvbuf));
#else
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
#endif
}

void TcpSocket::connect(const std::string& host, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        // Not a literal: resolve the first IPv4 address for the name
        addrinfo hints{};
        hints.ai_family   = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
        if (rc != 0 || !res) {
            throw std::runtime_error("Cannot resolve host '" + host + "': " +
                                     std::string(gai_strerror(rc)));
        }
        addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
        freeaddrinfo(res);
    }

    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("connect() to " + host + ":" + std::to_string(port) +
                                 " failed: " + socket_error_str(last_socket_error()));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
#ifdef _WIN32
    int peer_len = sizeof(peer);
#else
    socklen_t peer_len = sizeof(peer);
#endif
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent <= 0) {
            if (sent == 0) {
                throw std::runtime_error("Connection closed during send");
            }
            int err = last_socket_error();
#ifndef _WIN32
            if (err == EINTR) continue;
#endif
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    timed_out_ = false;
    while (remaining > 0) {
#ifdef _WIN32
        int received = ::recv(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, p, remaining, 0);
#endif
        if (received == 0) return false; // clean close
        if (received < 0) {
            int err = last_socket_error();
#ifndef _WIN32
            if (err == EINTR) continue;
#endif
            if (would_block(err)) {
                // SO_RCVTIMEO expired
                timed_out_ = true;
                return false;
            }
            if (connection_reset(err)) return false; // peer vanished
            throw std::runtime_error("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

size_t TcpSocket::discard_input(int ms) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(ms);
    set_recv_timeout_ms(ms);

    char scratch[16 * 1024];
    size_t total = 0;
    while (clock::now() < deadline) {
#ifdef _WIN32
        int n = ::recv(fd_, scratch, (int)sizeof(scratch), 0);
#else
        ssize_t n = ::recv(fd_, scratch, sizeof(scratch), 0);
#endif
#ifndef _WIN32
        if (n < 0 && last_socket_error() == EINTR) continue;
#endif
        if (n <= 0) break; // close, timeout, reset
        total += static_cast<size_t>(n);
    }
    return total;
}

void TcpSocket::write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len) {
    u8 hdr_buf[8];
    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = flags;
    hdr.payload_len = payload_len;
    proto::encode_header(hdr, hdr_buf);

    if (payload_len == 0 || !payload) {
        send_all(hdr_buf, 8);
        return;
    }

#ifdef _WIN32
    // Small frames: coalesce header + payload so each frame is one send()
    std::vector<char> merged(8 + (size_t)payload_len);
    std::memcpy(merged.data(), hdr_buf, 8);
    std::memcpy(merged.data() + 8, payload, payload_len);
    send_all(merged.data(), merged.size());
#else
    // sendmsg: merge header + payload into one syscall, handle partial sends
    size_t total = 8 + payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        struct iovec cur[2];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 2; ++i) {
            size_t seg_len = (i == 0) ? 8 : (size_t)payload_len;
            const char* seg_base = (i == 0) ? reinterpret_cast<const char*>(hdr_buf)
                                             : static_cast<const char*>(payload);
            if (skip >= seg_len) { skip -= seg_len; continue; }
            cur[cur_cnt].iov_base = const_cast<char*>(seg_base + skip);
            cur[cur_cnt].iov_len  = seg_len - skip;
            skip = 0;
            ++cur_cnt;
        }
        msghdr msg{};
        msg.msg_iov    = cur;
        msg.msg_iovlen = (size_t)cur_cnt;
        ssize_t n = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("sendmsg failed: " + socket_error_str(errno));
        }
        sent_total += (size_t)n;
    }
#endif
}

bool TcpSocket::read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf) {
    u8 hdr_buf[8];
    if (!recv_all(hdr_buf, 8)) return false;
    hdr = proto::decode_header(hdr_buf);
    if (hdr.payload_len > MAX_CHUNK_PAYLOAD) {
        throw ProtocolError("Frame payload too large: " + std::to_string(hdr.payload_len));
    }
    payload_buf.resize(hdr.payload_len);
    if (hdr.payload_len > 0) {
        if (!recv_all(payload_buf.data(), hdr.payload_len)) return false;
    }
    return true;
}

void TcpSocket::shutdown_send() {
    if (fd_ == INVALID_SOCKET_VAL) return;
    if (::shutdown(fd_, SHUTDOWN_SEND) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("shutdown() failed: " + socket_error_str(last_socket_error()));
    }
}

void TcpSocket::shutdown_both() {
    if (fd_ != INVALID_SOCKET_VAL) {
        ::shutdown(fd_, SHUTDOWN_BOTH);
    }
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in self{};
#ifdef _WIN32
    int len = sizeof(self);
#else
    socklen_t len = sizeof(self);
#endif
    if (getsockname(fd_, (sockaddr*)&self, &len) == 0) {
        return ntohs(self.sin_port);
    }
    return 0;
}

void TcpSocket::set_recv_timeout_ms(int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}
