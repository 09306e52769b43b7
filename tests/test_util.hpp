#pragma once

// Shared helpers for the snapcp test suites

#include "../common/platform.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace testutil {

// Fresh scratch directory under the system temp dir, removed on scope exit
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        path_ = std::filesystem::temp_directory_path() /
                ("snapcp_" + tag + "_" + std::to_string(utils::generate_session_id()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::string& path, const std::vector<u8>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
}

inline std::vector<u8> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<u8>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Bytes that expose reordering: position i holds a value derived from i
inline std::vector<u8> sequential_bytes(size_t n) {
    std::vector<u8> v(n);
    for (size_t i = 0; i < n; ++i) {
        v[i] = (u8)((i * 7 + (i >> 8)) & 0xFF);
    }
    return v;
}

inline std::vector<u8> bytes(const std::string& s) {
    return std::vector<u8>(s.begin(), s.end());
}

inline size_t count_files(const std::filesystem::path& dir) {
    std::error_code ec;
    size_t n = 0;
    for (auto it = std::filesystem::directory_iterator(dir, ec);
         it != std::filesystem::directory_iterator(); ++it) {
        ++n;
    }
    return n;
}

} // namespace testutil
