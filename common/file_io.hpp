#pragma once

// ============================================================
// file_io.hpp -- Local file access for uploads and comparisons
// ============================================================

#include "platform.hpp"
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// True if path names an existing regular file (symlinks followed)
bool is_regular_file(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Read an entire local file.
// Throws LocalNotFoundError if it does not exist, std::runtime_error on read failure.
std::string read_file(const std::string& path);

// Write data to path via a temporary sibling and rename, so a reader
// never sees a half-written file. Throws std::runtime_error on failure.
void write_file_atomic(const std::string& path, const std::string& data);

} // namespace file_io
