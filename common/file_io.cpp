// ============================================================
// file_io.cpp -- Snapshot sources, staging files, atomic replace
// ============================================================

#include "file_io.hpp"
#include <vector>
#include <fstream>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>
#include <system_error>
#include <cerrno>

#ifdef _WIN32
#  include <io.h>
#  include <fcntl.h>
#  include <sys/stat.h>
#else
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace file_io;

// ---- thin fd wrappers ----

namespace {

#ifdef _WIN32
int sys_open_read(const char* p)          { return ::_open(p, _O_RDONLY | _O_BINARY); }
int sys_open_excl(const char* p)          { return ::_open(p, _O_WRONLY | _O_CREAT | _O_EXCL | _O_BINARY, _S_IREAD | _S_IWRITE); }
long sys_read(int fd, void* b, size_t n)  { return ::_read(fd, b, (unsigned)n); }
long sys_write(int fd, const void* b, size_t n) { return ::_write(fd, b, (unsigned)n); }
int sys_fsync(int fd)                     { return ::_commit(fd); }
int sys_close(int fd)                     { return ::_close(fd); }
#else
int sys_open_read(const char* p)          { return ::open(p, O_RDONLY | O_CLOEXEC); }
int sys_open_excl(const char* p)          { return ::open(p, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600); }
long sys_read(int fd, void* b, size_t n)  { return (long)::read(fd, b, n); }
long sys_write(int fd, const void* b, size_t n) { return (long)::write(fd, b, n); }
int sys_fsync(int fd)                     { return ::fsync(fd); }
int sys_close(int fd)                     { return ::close(fd); }
#endif

std::string errno_str() {
    return std::string(strerror(errno)) + " (errno=" + std::to_string(errno) + ")";
}

} // namespace

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL |
                               FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    LARGE_INTEGER sz{};
    GetFileSizeEx(file_handle_, &sz);
    size_ = (u64)sz.QuadPart;
    if (size_ == 0) return;

    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!map_handle_) {
        CloseHandle(file_handle_);
        file_handle_ = INVALID_HANDLE_VALUE;
        throw std::runtime_error("CreateFileMapping failed: " + path);
    }

    data_ = static_cast<const char*>(MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0));
    if (!data_) {
        CloseHandle(map_handle_);
        CloseHandle(file_handle_);
        map_handle_ = nullptr;
        file_handle_ = INVALID_HANDLE_VALUE;
        throw std::runtime_error("MapViewOfFile failed: " + path);
    }
#else
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + errno_str());
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;
    if (size_ == 0) return;

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
#endif
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
#ifdef _WIN32
    if (data_) { UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// ByteSource
// ============================================================

ByteSource ByteSource::open_file(const std::string& path) {
    int fd = sys_open_read(path.c_str());
    if (fd < 0) {
        throw std::runtime_error("open " + path + ": " + errno_str());
    }
    return ByteSource(fd, true, path);
}

ByteSource ByteSource::from_stdin() {
    return ByteSource(platform::stdin_fd(), false, "<stdin>");
}

ByteSource::ByteSource(int fd, bool owned, std::string name)
    : fd_(fd), owned_(owned), name_(std::move(name))
{}

ByteSource::~ByteSource() {
    close();
}

ByteSource::ByteSource(ByteSource&& o) noexcept
    : fd_(o.fd_), owned_(o.owned_), name_(std::move(o.name_))
{
    o.fd_ = -1;
    o.owned_ = false;
}

ByteSource& ByteSource::operator=(ByteSource&& o) noexcept {
    if (this != &o) {
        close();
        fd_    = o.fd_;
        owned_ = o.owned_;
        name_  = std::move(o.name_);
        o.fd_ = -1;
        o.owned_ = false;
    }
    return *this;
}

size_t ByteSource::read_some(void* buf, size_t len) {
    if (fd_ < 0) throw std::runtime_error("read from closed source " + name_);
    for (;;) {
        long n = sys_read(fd_, buf, len);
        if (n >= 0) return (size_t)n;
        if (errno == EINTR) continue;
        throw std::runtime_error("read " + name_ + ": " + errno_str());
    }
}

size_t ByteSource::read_full(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t filled = 0;
    while (filled < len) {
        size_t n = read_some(p + filled, len - filled);
        if (n == 0) break; // end of input
        filled += n;
    }
    return filled;
}

void ByteSource::close() {
    if (owned_ && fd_ >= 0) {
        sys_close(fd_);
    }
    fd_ = -1;
    owned_ = false;
}

// ============================================================
// StagingFile
// ============================================================

StagingFile::~StagingFile() {
    if (!path_.empty()) {
        discard();
    }
}

void StagingFile::create(const std::string& path) {
    if (fd_ >= 0 || !path_.empty()) {
        throw std::runtime_error("StagingFile already in use: " + path_);
    }
    ensure_parent_dirs(path);
    fd_ = sys_open_excl(path.c_str());
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create staging file " + path + ": " + errno_str());
    }
    path_ = path;
    size_ = 0;
}

void StagingFile::append(const void* data, size_t len) {
    if (fd_ < 0) throw std::runtime_error("append to closed staging file " + path_);
    const char* p = static_cast<const char*>(data);
    size_t remaining = len;
    while (remaining > 0) {
        long n = sys_write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("write " + path_ + ": " + errno_str());
        }
        if (n == 0) throw std::runtime_error("write " + path_ + ": no progress");
        p += n;
        remaining -= (size_t)n;
        size_ += (u64)n;
    }
}

void StagingFile::finish() {
    if (fd_ < 0) return;
    if (sys_fsync(fd_) != 0) {
        throw std::runtime_error("fsync " + path_ + ": " + errno_str());
    }
    int rc = sys_close(fd_);
    fd_ = -1;
    if (rc != 0) {
        throw std::runtime_error("close " + path_ + ": " + errno_str());
    }
}

void StagingFile::discard() {
    if (fd_ >= 0) {
        sys_close(fd_);
        fd_ = -1;
    }
    if (!path_.empty()) {
        remove_quietly(path_);
        path_.clear();
    }
    size_ = 0;
}

void StagingFile::release() {
    if (fd_ >= 0) {
        sys_close(fd_);
        fd_ = -1;
    }
    path_.clear();
}

// ============================================================
// Utility functions
// ============================================================

void file_io::atomic_replace(const std::string& src, const std::string& dst) {
    std::error_code ec;
    // POSIX rename() replaces dst atomically; on Windows filesystem::rename
    // maps to MoveFileEx(MOVEFILE_REPLACE_EXISTING).
    fs::rename(src, dst, ec);
    if (ec) {
        throw std::runtime_error("rename " + src + " -> " + dst + ": " + ec.message());
    }
#ifndef _WIN32
    fs::path parent = fs::path(dst).parent_path();
    if (parent.empty()) parent = ".";
    int dfd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) {
        ::fsync(dfd);
        ::close(dfd);
    }
#endif
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

std::vector<u8> file_io::read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return {};
    f.seekg(0, std::ios::end);
    size_t sz = (size_t)f.tellg();
    f.seekg(0, std::ios::beg);
    std::vector<u8> buf(sz);
    if (sz > 0) f.read((char*)buf.data(), (std::streamsize)sz);
    return buf;
}

void file_io::remove_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}
