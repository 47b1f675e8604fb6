#pragma once

// ============================================================
// listing.hpp -- Long-format directory listing parser
// ============================================================

#include "../common/platform.hpp"
#include "profile.hpp"
#include <string>
#include <vector>

// One entry of a remote directory listing
struct RemoteFile {
    std::string filename;
    std::string directory;     // remote directory the listing came from
    bool        is_directory{false};
    std::string permissions;   // e.g. "rw-r--r--" (type character removed)
    int         link_count{0};
    std::string owner;
    std::string group;
    u64         size_bytes{0};
    i64         last_changed{0};  // epoch seconds, host-local clock
};

namespace listing {

// Parse raw listing text into entries, in listing order.
//   EPOCH_SECONDS: first line is discarded; each following non-empty line
//                  must have exactly 7 fields.
//   UNIX_LS:       "total N" lines are skipped; rows have at least 9 fields.
// Any malformed line throws ParseError for the whole listing.
std::vector<RemoteFile> parse(const std::string& text,
                              const std::string& directory = "",
                              ListingDialect dialect = ListingDialect::EPOCH_SECONDS);

// Parse a single EPOCH_SECONDS row; line_number is used for error context
RemoteFile parse_epoch_line(const std::string& line, size_t line_number,
                            const std::string& directory = "");

// Parse a single UNIX_LS row. now_s anchors year-less timestamps.
RemoteFile parse_unix_line(const std::string& line, size_t line_number,
                           const std::string& directory, i64 now_s);

// Name field of a listing row (used to filter listings by pattern)
std::string entry_name(const std::string& line, ListingDialect dialect);

// Entries that are not directories
std::vector<RemoteFile> files_only(const std::vector<RemoteFile>& entries);

} // namespace listing
