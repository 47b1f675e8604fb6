// ============================================================
// listing.cpp -- Long-format directory listing parser
// ============================================================

#include "listing.hpp"
#include "../common/errors.hpp"
#include "../common/utils.hpp"
#include <cctype>
#include <ctime>

// ---------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------

// Byte offsets of the first max_fields whitespace-separated fields,
// plus the offset where the remainder of the line starts.
struct FieldSpans {
    std::vector<std::pair<size_t, size_t>> spans; // [begin, end)
    size_t rest{std::string::npos};
};

static FieldSpans split_fields(const std::string& line, size_t max_fields) {
    FieldSpans out;
    size_t i = 0, n = line.size();
    while (i < n) {
        while (i < n && std::isspace((unsigned char)line[i])) ++i;
        if (i >= n) break;
        if (out.spans.size() == max_fields) {
            out.rest = i;
            break;
        }
        size_t b = i;
        while (i < n && !std::isspace((unsigned char)line[i])) ++i;
        out.spans.emplace_back(b, i);
    }
    return out;
}

static void apply_type_perms(RemoteFile& rf, const std::string& type_perms) {
    rf.is_directory = type_perms[0] == 'd';
    rf.permissions  = type_perms.substr(1);
}

static int parse_link_count(const std::string& tok, const std::string& line, size_t line_no) {
    i64 links = 0;
    if (!utils::parse_i64(tok, links) || links < 0 || links > 0x7FFFFFFF) {
        throw ParseError(line_no, line, "link count is not a number: " + tok);
    }
    return (int)links;
}

static u64 parse_size(const std::string& tok, const std::string& line, size_t line_no) {
    u64 size = 0;
    if (!utils::parse_u64(tok, size)) {
        throw ParseError(line_no, line, "size is not a number: " + tok);
    }
    return size;
}

static int month_index(const std::string& tok) {
    static const char* months[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
    std::string m = utils::to_lower(tok);
    for (int i = 0; i < 12; ++i) {
        if (m == months[i]) return i;
    }
    return -1;
}

// ---------------------------------------------------------------
// EPOCH_SECONDS rows:
//   type+perms links owner group size epoch_s name
// ---------------------------------------------------------------

RemoteFile listing::parse_epoch_line(const std::string& line, size_t line_number,
                                     const std::string& directory) {
    std::vector<std::string> tok = utils::split_ws(line);
    if (tok.size() != 7) {
        throw ParseError(line_number, line,
                         "expected 7 fields, found " + std::to_string(tok.size()));
    }

    RemoteFile rf;
    rf.directory = directory;
    apply_type_perms(rf, tok[0]);
    rf.link_count = parse_link_count(tok[1], line, line_number);
    rf.owner      = tok[2];
    rf.group      = tok[3];
    rf.size_bytes = parse_size(tok[4], line, line_number);

    i64 epoch = 0;
    if (!utils::parse_i64(tok[5], epoch)) {
        throw ParseError(line_number, line, "timestamp is not a number: " + tok[5]);
    }
    rf.last_changed = epoch;
    rf.filename     = tok[6];
    return rf;
}

// ---------------------------------------------------------------
// UNIX_LS rows:
//   type+perms links owner group size Mon DD HH:MM|YYYY name...
// ---------------------------------------------------------------

RemoteFile listing::parse_unix_line(const std::string& line, size_t line_number,
                                    const std::string& directory, i64 now_s) {
    FieldSpans fs = split_fields(line, 8);
    if (fs.spans.size() < 8 || fs.rest == std::string::npos) {
        throw ParseError(line_number, line,
                         "expected at least 9 fields, found " + std::to_string(fs.spans.size()));
    }
    auto field = [&](size_t i) {
        return line.substr(fs.spans[i].first, fs.spans[i].second - fs.spans[i].first);
    };

    RemoteFile rf;
    rf.directory = directory;
    apply_type_perms(rf, field(0));
    rf.link_count = parse_link_count(field(1), line, line_number);
    rf.owner      = field(2);
    rf.group      = field(3);
    rf.size_bytes = parse_size(field(4), line, line_number);

    int mon = month_index(field(5));
    if (mon < 0) {
        throw ParseError(line_number, line, "unknown month: " + field(5));
    }
    i64 day = 0;
    if (!utils::parse_i64(field(6), day) || day < 1 || day > 31) {
        throw ParseError(line_number, line, "day of month is not valid: " + field(6));
    }

    std::tm tm{};
    tm.tm_mon   = mon;
    tm.tm_mday  = (int)day;
    tm.tm_isdst = -1;

    std::string when = field(7);
    size_t colon = when.find(':');
    bool has_year = colon == std::string::npos;
    if (has_year) {
        i64 year = 0;
        if (!utils::parse_i64(when, year) || year < 1970) {
            throw ParseError(line_number, line, "year is not valid: " + when);
        }
        tm.tm_year = (int)(year - 1900);
    } else {
        i64 hh = 0, mm = 0;
        if (!utils::parse_i64(when.substr(0, colon), hh) ||
            !utils::parse_i64(when.substr(colon + 1), mm) ||
            hh < 0 || hh > 23 || mm < 0 || mm > 59)
        {
            throw ParseError(line_number, line, "time of day is not valid: " + when);
        }
        std::time_t now_t = (std::time_t)now_s;
        std::tm now_tm{};
        localtime_r(&now_t, &now_tm);
        tm.tm_year = now_tm.tm_year;
        tm.tm_hour = (int)hh;
        tm.tm_min  = (int)mm;
    }

    std::tm probe = tm;
    i64 t = (i64)std::mktime(&probe);
    // ls omits the year for recent dates; a result in the future means last year
    if (!has_year && t > now_s + 86400) {
        probe = tm;
        probe.tm_year -= 1;
        t = (i64)std::mktime(&probe);
    }
    rf.last_changed = t;

    std::string name = utils::trim(line.substr(fs.rest));
    if (!rf.permissions.empty() && field(0)[0] == 'l') {
        size_t arrow = name.find(" -> ");
        if (arrow != std::string::npos) name = name.substr(0, arrow);
    }
    rf.filename = name;
    return rf;
}

// ---------------------------------------------------------------
// parse
// ---------------------------------------------------------------

std::vector<RemoteFile> listing::parse(const std::string& text,
                                       const std::string& directory,
                                       ListingDialect dialect) {
    std::vector<std::string> lines = utils::split_lines(utils::trim(text));
    std::vector<RemoteFile> out;
    out.reserve(lines.size());

    if (dialect == ListingDialect::EPOCH_SECONDS) {
        // Line 0 is the "total N" header
        for (size_t i = 1; i < lines.size(); ++i) {
            if (utils::trim(lines[i]).empty()) continue;
            out.push_back(parse_epoch_line(lines[i], i + 1, directory));
        }
        return out;
    }

    i64 now = utils::now_s();
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string t = utils::trim(lines[i]);
        if (t.empty()) continue;
        if (t.rfind("total ", 0) == 0 || t == "total") continue;
        out.push_back(parse_unix_line(lines[i], i + 1, directory, now));
    }
    return out;
}

std::string listing::entry_name(const std::string& line, ListingDialect dialect) {
    if (dialect == ListingDialect::EPOCH_SECONDS) {
        std::vector<std::string> tok = utils::split_ws(line);
        return tok.size() == 7 ? tok[6] : std::string();
    }
    FieldSpans fs = split_fields(line, 8);
    if (fs.spans.size() < 8 || fs.rest == std::string::npos) return std::string();
    std::string name = utils::trim(line.substr(fs.rest));
    if (line[fs.spans[0].first] == 'l') {
        size_t arrow = name.find(" -> ");
        if (arrow != std::string::npos) name = name.substr(0, arrow);
    }
    return name;
}

std::vector<RemoteFile> listing::files_only(const std::vector<RemoteFile>& entries) {
    std::vector<RemoteFile> out;
    for (const auto& e : entries) {
        if (!e.is_directory) out.push_back(e);
    }
    return out;
}
