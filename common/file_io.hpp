#pragma once

// ============================================================
// file_io.hpp -- Snapshot sources, staging files, atomic replace
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    // nullptr for an empty file
    const char* data() const { return data_; }
    u64 size() const { return size_; }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- ByteSource: a readable fd of unknown length (file or pipe) ----
// Owns (and closes) descriptors it opened; never closes stdin.
class ByteSource {
public:
    // Open 'path' for reading; throws std::runtime_error
    static ByteSource open_file(const std::string& path);

    // Wrap the process's standard input
    static ByteSource from_stdin();

    ByteSource(int fd, bool owned, std::string name);
    ~ByteSource();

    ByteSource(const ByteSource&) = delete;
    ByteSource& operator=(const ByteSource&) = delete;

    ByteSource(ByteSource&& o) noexcept;
    ByteSource& operator=(ByteSource&& o) noexcept;

    // One underlying read; 0 means end of input. Throws on I/O error.
    size_t read_some(void* buf, size_t len);

    // Keep reading until 'len' bytes arrived or input ended. Pipes deliver
    // a few bytes per read(); this batches them into one full buffer.
    size_t read_full(void* buf, size_t len);

    bool is_stdin() const { return !owned_; }
    const std::string& name() const { return name_; }
    int fd() const { return fd_; }

    void close();

private:
    int         fd_{-1};
    bool        owned_{false};
    std::string name_;
};

// ---- StagingFile: append-only temp file for an in-flight upload ----
// Removed on destruction unless release() was called after a commit.
class StagingFile {
public:
    StagingFile() = default;
    ~StagingFile();

    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    // Create 'path' exclusively (fails if it already exists)
    void create(const std::string& path);

    // Append bytes at the end; throws on short write / I/O error
    void append(const void* data, size_t len);

    // fsync + close; the file stays on disk for validation/commit
    void finish();

    // Close (if open) and unlink
    void discard();

    // Forget the path: the file has been renamed away
    void release();

    bool is_open() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }
    u64 size() const { return size_; }

private:
    int         fd_{-1};
    std::string path_;
    u64         size_{0};
};

// ---- Utility functions ----

// rename(src, dst) replacing dst atomically, then fsync the parent
// directory so the swap survives a crash. Throws on failure; dst is
// untouched if the rename did not happen.
void atomic_replace(const std::string& src, const std::string& dst);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Read entire file into memory (empty vector if missing)
std::vector<u8> read_file(const std::string& path);

// Remove a file, ignoring errors
void remove_quietly(const std::string& path);

} // namespace file_io
