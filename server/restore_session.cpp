// ============================================================
// restore_session.cpp -- Restore session state machine
// ============================================================

#include "restore_session.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

const char* session_state_str(SessionState s) {
    switch (s) {
        case SessionState::IDLE:      return "idle";
        case SessionState::OPENED:    return "opened";
        case SessionState::RECEIVING: return "receiving";
        case SessionState::APPLYING:  return "applying";
        case SessionState::DONE:      return "done";
    }
    return "?";
}

RestoreSession::RestoreSession(StateStore& store, u64 session_id, u64 max_bytes)
    : store_(store)
    , session_id_(session_id)
    , max_bytes_(max_bytes)
{}

RestoreSession::~RestoreSession() {
    if (state_ != SessionState::DONE) {
        abort("session destroyed before completion");
    }
}

void RestoreSession::violation(const std::string& what) {
    std::string msg = what + " (state " + session_state_str(state_) + ")";
    abort(msg);
    throw ProtocolError(msg);
}

void RestoreSession::open() {
    if (state_ != SessionState::IDLE) {
        violation("duplicate open");
    }
    try {
        staging_.create(store_.staging_path(session_id_));
    } catch (const std::exception& e) {
        abort(e.what());
        throw;
    }
    state_ = SessionState::OPENED;
    LOG_DEBUG("session " + std::to_string(session_id_) + ": opened, staging to " +
              staging_.path());
}

void RestoreSession::append(const void* data, size_t len) {
    switch (state_) {
        case SessionState::IDLE:
            violation("chunk before open");
        case SessionState::APPLYING:
        case SessionState::DONE:
            violation("chunk after end of stream");
        case SessionState::OPENED:
        case SessionState::RECEIVING:
            break;
    }

    if (max_bytes_ > 0 && bytes_received_ + len > max_bytes_) {
        std::string msg = "snapshot exceeds server limit of " + utils::format_bytes(max_bytes_);
        abort(msg);
        throw SnapshotTooLarge(msg);
    }

    try {
        if (len > 0) staging_.append(data, len);
    } catch (const std::exception& e) {
        abort(e.what());
        throw;
    }
    bytes_received_ += len;
    ++chunks_received_;
    state_ = SessionState::RECEIVING;
}

RestoreResult RestoreSession::finish() {
    switch (state_) {
        case SessionState::IDLE:
            violation("end of stream before open");
        case SessionState::APPLYING:
        case SessionState::DONE:
            violation("duplicate end of stream");
        case SessionState::OPENED:
        case SessionState::RECEIVING:
            break;
    }

    state_ = SessionState::APPLYING;
    LOG_DEBUG("session " + std::to_string(session_id_) + ": end of stream after " +
              std::to_string(chunks_received_) + " chunk(s), " +
              utils::format_bytes(bytes_received_));

    RestoreResult result;
    try {
        staging_.finish();
        result = store_.apply(staging_.path(), session_id_);
    } catch (const std::exception& e) {
        result = RestoreResult::failure(RestoreStatus::ERR_INTERNAL,
                                        std::string("staging failed: ") + e.what());
    }

    if (result.ok()) {
        staging_.release();  // renamed into place
    } else {
        staging_.discard();
    }
    state_ = SessionState::DONE;
    return result;
}

void RestoreSession::abort(const std::string& reason) {
    if (state_ == SessionState::DONE) return;
    if (state_ != SessionState::IDLE) {
        LOG_WARN("session " + std::to_string(session_id_) + ": aborted after " +
                 utils::format_bytes(bytes_received_) + ": " + reason);
        LOG_AUDIT("session " + std::to_string(session_id_) + " aborted: " + reason);
    }
    staging_.discard();
    aborted_ = true;
    state_   = SessionState::DONE;
}
