// ============================================================
// server_app.cpp -- snapcp server daemon implementation
// ============================================================

#include "server_app.hpp"
#include "restore_session.hpp"
#include "../common/protocol_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <algorithm>
#include <iterator>
#include <filesystem>

// How long a rejected client's remaining input is drained after RESULT
static constexpr int RESULT_DRAIN_MS = 2000;

ServerApp::ServerApp(ServerConfig config)
    : config_(std::move(config))
    , store_(config_.state_dir)
{}

ServerApp::~ServerApp() {
    stop();
    reap_workers(true);
}

void ServerApp::listen() {
    if (listening_.load()) return;

    store_.init();
    Logger::get().set_audit_file(
        (std::filesystem::path(config_.state_dir) / "restore_audit.log").string());

    listen_sock_.bind_and_listen(config_.listen_ip, config_.listen_port);
    bound_port_ = listen_sock_.local_port();
    listening_.store(true);
    running_.store(true);

    LOG_INFO("snapcp server listening on " + config_.listen_ip + ":" +
             std::to_string(bound_port_) + "  (state_dir=" + config_.state_dir + ")");
}

int ServerApp::run() {
    listen();
    accept_loop();

    // Listener is down; let in-flight sessions finish or be cut off by stop()
    reap_workers(true);
    listen_sock_.close();
    LOG_INFO("snapcp server stopped");
    return 0;
}

void ServerApp::stop() {
    running_.store(false);
    listen_sock_.shutdown_both();

    std::lock_guard<std::mutex> lk(active_mutex_);
    for (auto& kv : active_) {
        kv.second->shutdown_both();
    }
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop. Each accepted socket gets its own thread,
//   so a slow uploader never blocks other clients.
// ---------------------------------------------------------------
void ServerApp::accept_loop() {
    while (running_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            if (!running_.load()) break;
            sock.tune();
            LOG_DEBUG("Accepted connection from " + sock.peer_addr());

            auto done = std::make_shared<std::atomic<bool>>(false);
            {
                std::lock_guard<std::mutex> lk(workers_mutex_);
                workers_.push_back(Worker{
                    std::thread([this, done, s = std::move(sock)]() mutable {
                        handle_connection(std::move(s));
                        done->store(true);
                    }),
                    done});
            }

            reap_workers(false);

        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
    }
}

void ServerApp::handle_connection(TcpSocket sock) {
    const u64 sid = utils::generate_session_id();
    {
        std::lock_guard<std::mutex> lk(active_mutex_);
        active_[sid] = &sock;
    }
    // stop() may have run between accept() and registration
    if (!running_.load()) sock.shutdown_both();

    try {
        serve_session(sock, sid);
    } catch (const std::exception& e) {
        LOG_ERROR("session " + std::to_string(sid) + ": " + e.what());
    }

    std::lock_guard<std::mutex> lk(active_mutex_);
    active_.erase(sid);
}

// ---------------------------------------------------------------
// serve_session
//   Reads frames in order and feeds the RestoreSession. Exactly one
//   RESULT is sent if the client reaches END or commits a protocol
//   violation; a connection that ends early is an abort and gets no
//   reply (the RestoreSession destructor discards its data).
// ---------------------------------------------------------------
void ServerApp::serve_session(TcpSocket& sock, u64 session_id) {
    const std::string peer = sock.peer_addr();
    RestoreSession session(store_, session_id, config_.max_snapshot_bytes);

    if (config_.idle_timeout_s > 0) {
        sock.set_recv_timeout_ms(config_.idle_timeout_s * 1000);
    }

    auto t0 = std::chrono::steady_clock::now();
    FrameHeader hdr{};
    std::vector<u8> payload;

    try {
        for (;;) {
            if (!sock.read_frame(hdr, payload)) {
                session.abort(sock.timed_out()
                    ? "no data for " + std::to_string(config_.idle_timeout_s) + "s from " + peer
                    : "connection from " + peer + " closed before end of stream");
                return;
            }

            switch (static_cast<MsgType>(hdr.msg_type)) {
                case MsgType::MT_RESTORE_OPEN:
                    if (!payload.empty()) {
                        throw ProtocolError("OPEN carries a payload");
                    }
                    if (hdr.flags != SNAPCP_PROTOCOL_VERSION) {
                        throw ProtocolError("unsupported protocol version " +
                                            std::to_string(hdr.flags));
                    }
                    session.open();
                    LOG_INFO("session " + std::to_string(session_id) +
                             ": restore started by " + peer);
                    break;

                case MsgType::MT_RESTORE_CHUNK:
                    session.append(payload.data(), payload.size());
                    break;

                case MsgType::MT_RESTORE_END: {
                    RestoreResult r = session.finish();
                    double secs = std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - t0).count();
                    LOG_INFO("session " + std::to_string(session_id) + ": " +
                             utils::format_bytes(session.bytes_received()) + " in " +
                             std::to_string(session.chunks_received()) + " chunk(s), " +
                             utils::format_speed(secs > 0 ? session.bytes_received() / secs : 0.0) +
                             " -> " + restore_status_str(r.status));
                    send_result(sock, r, session_id);
                    return;
                }

                default:
                    throw ProtocolError("unexpected message type " +
                                        std::to_string(hdr.msg_type));
            }
        }
    } catch (const ProtocolError& e) {
        session.abort(e.what());
        LOG_WARN("session " + std::to_string(session_id) + ": protocol violation from " +
                 peer + ": " + e.what());
        send_result(sock, RestoreResult::failure(RestoreStatus::ERR_PROTOCOL, e.what()),
                    session_id);
    } catch (const SnapshotTooLarge& e) {
        send_result(sock, RestoreResult::failure(RestoreStatus::ERR_TOO_LARGE, e.what()),
                    session_id);
    } catch (const std::exception& e) {
        // Staging I/O failure or a socket error mid-stream
        session.abort(e.what());
        LOG_ERROR("session " + std::to_string(session_id) + ": " + e.what());
        send_result(sock, RestoreResult::failure(RestoreStatus::ERR_INTERNAL, e.what()),
                    session_id);
    }
}

void ServerApp::send_result(TcpSocket& sock, const RestoreResult& r, u64 session_id) {
    std::vector<u8> body = proto::encode_result(r);
    try {
        sock.write_frame(MsgType::MT_RESTORE_RESULT, 0, body.data(), (u32)body.size());
        sock.shutdown_send();
    } catch (const std::exception& e) {
        LOG_WARN("session " + std::to_string(session_id) + ": cannot deliver result: " +
                 e.what());
        return;
    }
    if (!r.ok()) drain_input(sock);
}

// A client rejected mid-stream is still sending. Closing with unread
// input would reset the connection and could destroy the RESULT before
// the client reads it, so swallow input for a bounded time first.
void ServerApp::drain_input(TcpSocket& sock) {
    size_t dropped = sock.discard_input(RESULT_DRAIN_MS);
    if (dropped > 0) {
        LOG_DEBUG("Drained " + utils::format_bytes(dropped) + " after result");
    }
}

void ServerApp::reap_workers(bool wait_all) {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        auto split = std::partition(workers_.begin(), workers_.end(),
            [wait_all](const Worker& w) { return !wait_all && !w.done->load(); });
        std::move(split, workers_.end(), std::back_inserter(finished));
        workers_.erase(split, workers_.end());
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}
