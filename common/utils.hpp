#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <iomanip>
#include <atomic>

namespace utils {

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (bytes < 1024ULL * 1024) {
        ss << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << (double)bytes / (1024.0 * 1024) << " MB";
    } else {
        ss << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
    }
    return ss.str();
}

// Format speed as "X.XX MB/s"
inline std::string format_speed(double bytes_per_sec) {
    std::ostringstream ss;
    if (bytes_per_sec < 1024.0) {
        ss << std::fixed << std::setprecision(1) << bytes_per_sec << " B/s";
    } else if (bytes_per_sec < 1024.0 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / 1024.0 << " KB/s";
    } else {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024) << " MB/s";
    }
    return ss.str();
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// Split "host:port". A bare host takes default_port.
// Returns false if the port is present but not a valid number.
inline bool parse_host_port(const std::string& addr, u16 default_port,
                            std::string& host_out, u16& port_out) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) {
        host_out = addr;
        port_out = default_port;
        return !addr.empty();
    }
    host_out = addr.substr(0, colon);
    std::string port_str = addr.substr(colon + 1);
    if (host_out.empty() || port_str.empty()) return false;
    for (char c : port_str) {
        if (c < '0' || c > '9') return false;
    }
    if (port_str.size() > 5) return false;
    int port = std::atoi(port_str.c_str());
    if (!validate_port(port)) return false;
    port_out = (u16)port;
    return true;
}

// Generate a 64-bit session ID, unique within the process and unlikely to
// repeat across restarts (staging files are named after it)
inline u64 generate_session_id() {
    using namespace std::chrono;
    static std::atomic<u64> counter{0};
    u64 t = (u64)high_resolution_clock::now().time_since_epoch().count();
    t ^= (counter.fetch_add(1) + 1) * 0x9e3779b97f4a7c15ULL;
    t ^= (t >> 30) * 0xbf58476d1ce4e5b9ULL;
    t ^= (t >> 27) * 0x94d049bb133111ebULL;
    t ^= (t >> 31);
    return t == 0 ? 1 : t; // never return 0 (reserved for "unset")
}

} // namespace utils
