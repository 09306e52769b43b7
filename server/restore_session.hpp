#pragma once

// ============================================================
// restore_session.hpp -- Server side of one restore attempt
//
//   IDLE --open()--> OPENED --append()*--> RECEIVING
//        --finish()--> APPLYING --> DONE(success|error)
//
// Any state except DONE may abort() (connection lost, timeout,
// protocol violation); the staged bytes are discarded and the
// persisted state is never touched. Events out of order throw
// ProtocolError and leave the session aborted.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/file_io.hpp"
#include "state_store.hpp"
#include <string>

enum class SessionState : u8 {
    IDLE      = 0,
    OPENED    = 1,
    RECEIVING = 2,
    APPLYING  = 3,
    DONE      = 4,
};

const char* session_state_str(SessionState s);

// Upload exceeded the server's configured size bound
class SnapshotTooLarge : public std::runtime_error {
public:
    explicit SnapshotTooLarge(const std::string& msg) : std::runtime_error(msg) {}
};

class RestoreSession {
public:
    // max_bytes: reject uploads larger than this (0 = unbounded)
    RestoreSession(StateStore& store, u64 session_id, u64 max_bytes = 0);
    ~RestoreSession();

    RestoreSession(const RestoreSession&) = delete;
    RestoreSession& operator=(const RestoreSession&) = delete;

    // IDLE -> OPENED. Creates the staging file.
    void open();

    // OPENED/RECEIVING -> RECEIVING. Appends in arrival order.
    // Throws ProtocolError, SnapshotTooLarge, or std::runtime_error on a
    // staging I/O failure; the session is aborted in every case.
    void append(const void* data, size_t len);

    // OPENED/RECEIVING -> APPLYING -> DONE. Returns the terminal result.
    // Throws ProtocolError if called before open() or twice.
    RestoreResult finish();

    // Discard everything received so far. No-op once DONE.
    void abort(const std::string& reason);

    SessionState state() const { return state_; }
    u64 session_id() const { return session_id_; }
    u64 bytes_received() const { return bytes_received_; }
    u64 chunks_received() const { return chunks_received_; }
    bool aborted() const { return aborted_; }

private:
    StateStore&          store_;
    u64                  session_id_;
    u64                  max_bytes_;
    SessionState         state_{SessionState::IDLE};
    file_io::StagingFile staging_;
    u64                  bytes_received_{0};
    u64                  chunks_received_{0};
    bool                 aborted_{false};

    [[noreturn]] void violation(const std::string& what);
};
