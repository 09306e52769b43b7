// ============================================================
// state_store.cpp -- Validate + atomic swap of persisted state
// ============================================================

#include "state_store.hpp"
#include "../common/file_io.hpp"
#include "../common/snapshot_format.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

static const char* const STATE_FILE_NAME   = "state.snap";
static const char* const STAGING_DIR_NAME  = ".staging";
static const char* const STAGING_PREFIX    = "restore-";
static const char* const STAGING_SUFFIX    = ".part";

StateStore::StateStore(std::string state_dir)
    : state_dir_(std::move(state_dir))
{
    state_path_  = (fs::path(state_dir_) / STATE_FILE_NAME).string();
    staging_dir_ = (fs::path(state_dir_) / STAGING_DIR_NAME).string();
}

void StateStore::init() {
    fs::create_directories(state_dir_);
    fs::create_directories(staging_dir_);

    // Uploads interrupted by a crash can never be completed
    std::error_code ec;
    int purged = 0;
    for (auto& de : fs::directory_iterator(staging_dir_, ec)) {
        std::string name = de.path().filename().string();
        if (name.rfind(STAGING_PREFIX, 0) == 0) {
            file_io::remove_quietly(de.path().string());
            ++purged;
        }
    }
    if (purged > 0) {
        LOG_WARN("Removed " + std::to_string(purged) + " stale staging file(s) from " +
                 staging_dir_);
    }

    if (has_state()) {
        LOG_INFO("Persisted state: " + state_path_ + " (" +
                 utils::format_bytes(file_io::get_file_size(state_path_)) +
                 ", xxh3=" + current_digest() + ")");
    } else {
        LOG_INFO("No persisted state yet at " + state_path_);
    }
}

std::string StateStore::staging_path(u64 session_id) const {
    return (fs::path(staging_dir_) /
            (std::string(STAGING_PREFIX) + std::to_string(session_id) + STAGING_SUFFIX)).string();
}

RestoreResult StateStore::apply(const std::string& staged_path, u64 session_id) {
    std::lock_guard<std::mutex> lk(apply_mutex_);
    const std::string tag = "session " + std::to_string(session_id);

    snapshot::SnapshotInfo info;
    try {
        file_io::MmapReader reader(staged_path);
        info = snapshot::validate(reader.data(), (size_t)reader.size());
    } catch (const SnapshotError& e) {
        LOG_WARN(tag + ": snapshot rejected: " + e.what());
        LOG_AUDIT(tag + " rejected: " + e.what());
        return RestoreResult::failure(RestoreStatus::ERR_INVALID_SNAPSHOT, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(tag + ": cannot read staged snapshot: " + e.what());
        LOG_AUDIT(tag + " failed: " + e.what());
        return RestoreResult::failure(RestoreStatus::ERR_APPLY,
                                      std::string("cannot read staged snapshot: ") + e.what());
    }

    try {
        file_io::atomic_replace(staged_path, state_path_);
    } catch (const std::exception& e) {
        LOG_ERROR(tag + ": commit failed: " + e.what());
        LOG_AUDIT(tag + " failed: " + e.what());
        return RestoreResult::failure(RestoreStatus::ERR_APPLY,
                                      std::string("commit failed: ") + e.what());
    }

    u64 gen = generation_.fetch_add(1) + 1;
    std::string digest = hash::to_hex(info.digest);
    LOG_INFO(tag + ": state restored (" + utils::format_bytes(info.stored_size + sizeof(SnapshotHeader)) +
             ", payload " + utils::format_bytes(info.raw_size) +
             (info.algo == CompressAlgo::ZSTD ? " zstd" : "") +
             ", generation " + std::to_string(gen) + ")");
    LOG_AUDIT(tag + " applied: raw_size=" + std::to_string(info.raw_size) +
              " payload_xxh3=" + digest);
    return RestoreResult::success();
}

bool StateStore::has_state() const {
    std::error_code ec;
    return fs::is_regular_file(state_path_, ec);
}

std::vector<u8> StateStore::current() const {
    return file_io::read_file(state_path_);
}

std::string StateStore::current_digest() const {
    if (!has_state()) return "-";
    try {
        file_io::MmapReader reader(state_path_);
        return hash::to_hex(hash::xxh3_128(reader.data(), (size_t)reader.size()));
    } catch (const std::exception& e) {
        LOG_WARN("Cannot hash " + state_path_ + ": " + e.what());
        return "?";
    }
}
