#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>

namespace utils {

// Monotonic clock in milliseconds, for elapsed-time logging
inline u64 now_ms() {
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

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

} // namespace utils
