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
#include <cerrno>
#include <sstream>
#include <iomanip>
#include <atomic>

namespace utils {

// Milliseconds on the monotonic clock (for durations only)
inline u64 steady_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    }
    static const char* const units[] = {"KB", "MB", "GB", "TB"};
    double v = (double)bytes / 1024.0;
    int unit = 0;
    while (v >= 1024.0 && unit < 3) {
        v /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v << " " << units[unit];
    return ss.str();
}

// Format speed as "X.XX MB/s"
inline std::string format_speed(u64 bytes, u64 elapsed_ms) {
    if (elapsed_ms == 0) elapsed_ms = 1;
    double bytes_per_sec = (double)bytes * 1000.0 / (double)elapsed_ms;
    std::ostringstream ss;
    if (bytes_per_sec < 1024.0) {
        ss << std::fixed << std::setprecision(1) << bytes_per_sec << " B/s";
    } else if (bytes_per_sec < 1024.0 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / 1024.0 << " KB/s";
    } else if (bytes_per_sec < 1024.0 * 1024 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024) << " MB/s";
    } else {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024 * 1024) << " GB/s";
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
inline bool validate_port(long port) {
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

// Parse a non-negative decimal integer; false on garbage or overflow
inline bool parse_u64(const char* s, u64& out) {
    if (!s || !*s || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = (u64)v;
    return true;
}

// 64-bit identifier, unique within the process and hard to guess across
// processes. Never returns 0.
inline u64 generate_id() {
    using namespace std::chrono;
    static std::atomic<u64> counter{0};
    u64 t = (u64)high_resolution_clock::now().time_since_epoch().count();
    t ^= (counter.fetch_add(1) + 1) * 0x9e3779b97f4a7c15ULL;
    t ^= (t >> 30) * 0xbf58476d1ce4e5b9ULL;
    t ^= (t >> 27) * 0x94d049bb133111ebULL;
    t ^= (t >> 31);
    return t == 0 ? 1 : t;
}

} // namespace utils
