#pragma once

// ============================================================
// platform.hpp -- Portable types and OS error helpers
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#endif

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

namespace platform {

// Human-readable text for the current errno value
inline std::string last_error_str() {
    int err = errno;
    return std::string(std::strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

} // namespace platform
