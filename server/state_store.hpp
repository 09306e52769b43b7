#pragma once

// ============================================================
// state_store.hpp -- The server's single persisted state
//
// Layout under state_dir:
//   state.snap                     current persisted state
//   .staging/restore-<sid>.part    in-flight uploads
//   restore_audit.log              one line per apply outcome
//
// apply() is the only writer of state.snap. It holds apply_mutex_
// for validation + swap, so concurrent sessions commit one at a time
// and the file always holds exactly one complete snapshot.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <atomic>

class StateStore {
public:
    explicit StateStore(std::string state_dir);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Create directories and remove staging files left by a crash
    void init();

    // Where session 'session_id' stages its upload
    std::string staging_path(u64 session_id) const;

    // Validate the fully received file at 'staged_path' and, if valid,
    // atomically make it the persisted state. On any failure the current
    // state is untouched. The staged file is never deleted here; on
    // success it has been renamed away.
    RestoreResult apply(const std::string& staged_path, u64 session_id);

    bool has_state() const;

    // Current persisted bytes (empty if none)
    std::vector<u8> current() const;

    // Hex xxh3-128 of the current state, "-" if none
    std::string current_digest() const;

    // Successful applies since this store was created
    u64 generation() const { return generation_.load(); }

private:
    std::string state_dir_;
    std::string state_path_;
    std::string staging_dir_;

    std::mutex       apply_mutex_;
    std::atomic<u64> generation_{0};
};
