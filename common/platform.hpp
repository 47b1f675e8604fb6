#pragma once

// ============================================================
// platform.hpp -- Process-wide library init, portable types
// ============================================================

#include <string>
#include <cstdint>
#include <stdexcept>

#include <curl/curl.h>

// ---- Platform init/cleanup ----

namespace platform {

// libcurl global state must be set up once before any easy handle
// is created, and torn down after the last one is gone.
inline void init() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") +
                                 curl_easy_strerror(rc));
    }
}

inline void cleanup() {
    curl_global_cleanup();
}

// RAII guard for libcurl global state
struct Guard {
    Guard()  { init(); }
    ~Guard() { cleanup(); }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
};

} // namespace platform

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
