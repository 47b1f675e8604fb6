#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cerrno>
#include <cctype>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <limits>

namespace utils {

// Current time in seconds since epoch
inline i64 now_s() {
    using namespace std::chrono;
    return (i64)duration_cast<seconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
        return ss.str();
    } else {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
        return ss.str();
    }
}

// Format epoch seconds as host-local "Tue Mar  5 14:02:11 2024"
inline std::string format_time(i64 epoch_s) {
    std::time_t t = (std::time_t)epoch_s;
    std::tm tm_local{};
    localtime_r(&t, &tm_local);
    std::ostringstream ss;
    ss << std::put_time(&tm_local, "%a %b %e %H:%M:%S %Y");
    return ss.str();
}

// Shortest text that reads back as the same double
inline std::string format_number(double value) {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    std::string s = ss.str();
    // Prefer "0.5" over "0.50000000000000000", and "100" over "1e+02"
    std::string exponent_form;
    for (int prec = 1; prec < std::numeric_limits<double>::max_digits10; ++prec) {
        std::ostringstream shorter;
        shorter << std::setprecision(prec) << value;
        std::string t = shorter.str();
        if (std::strtod(t.c_str(), nullptr) != value) continue;
        if (t.find('e') == std::string::npos) return t;
        if (exponent_form.empty()) exponent_form = t;
    }
    return exponent_form.empty() ? s : exponent_form;
}

// Trim ASCII whitespace from both ends
inline std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

inline std::string to_lower(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

// Split on runs of whitespace, dropping empty tokens
inline std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream ss(s);
    std::string tok;
    while (ss >> tok) out.push_back(tok);
    return out;
}

// Split into lines; a trailing '\r' (CRLF listings) is removed
inline std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream ss(s);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(line);
    }
    return out;
}

// Strict integer parse: whole string must be a base-10 integer
inline bool parse_i64(const std::string& s, i64& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno != 0 || end != t.c_str() + t.size()) return false;
    out = (i64)v;
    return true;
}

inline bool parse_u64(const std::string& s, u64& out) {
    std::string t = trim(s);
    if (t.empty() || t[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(t.c_str(), &end, 10);
    if (errno != 0 || end != t.c_str() + t.size()) return false;
    out = (u64)v;
    return true;
}

// Strict floating point parse (accepts "1e-3", rejects "nan"/"inf")
inline bool parse_double(const std::string& s, double& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    for (char c : t) {
        if (std::isalpha((unsigned char)c) && c != 'e' && c != 'E') return false;
    }
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (errno != 0 || end != t.c_str() + t.size()) return false;
    out = v;
    return true;
}

// Last path component of a '/' or '\' separated path
inline std::string base_name(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

// Hostname: letters, digits, '-', '.', non-empty, <= 253 chars
inline bool validate_hostname(const std::string& host) {
    if (host.empty() || host.size() > 253) return false;
    for (char c : host) {
        if (!std::isalnum((unsigned char)c) && c != '-' && c != '.') return false;
    }
    return host.front() != '-' && host.front() != '.';
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

} // namespace utils
