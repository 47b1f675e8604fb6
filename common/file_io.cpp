// ============================================================
// file_io.cpp -- Local file access implementation
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

bool file_io::is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

std::string file_io::read_file(const std::string& path) {
    if (!is_regular_file(path)) {
        throw LocalNotFoundError(path);
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        throw std::runtime_error("Read failed: " + path);
    }
    return ss.str();
}

void file_io::write_file_atomic(const std::string& path, const std::string& data) {
    fs::path target(path);
    fs::path tmp = target;
    tmp += ".part";

    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) {
            throw std::runtime_error("Cannot create file: " + tmp.string());
        }
        f.write(data.data(), (std::streamsize)data.size());
        f.flush();
        if (!f) {
            f.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("Write failed: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Cannot rename " + tmp.string() + " to " +
                                 target.string() + ": " + ec.message());
    }
}
