#pragma once

// ============================================================
// comparator.hpp -- Structural diff of two exports
// ============================================================

#include "../common/platform.hpp"
#include "file_contents.hpp"
#include <string>
#include <vector>

enum class DiffKind : u8 {
    ONLY_IN_A      = 0,
    ONLY_IN_B      = 1,
    VALUE_MISMATCH = 2,
    MATCH          = 3,
};

// One finding. path is "device" or "device/state" (empty for the file
// itself); field and the values are set for VALUE_MISMATCH only.
struct DiffEntry {
    DiffKind    kind;
    std::string path;
    std::string field;
    std::string a_value;
    std::string b_value;
};

struct Diff {
    std::vector<DiffEntry> entries;

    // True iff nothing differs (MATCH entries do not count)
    bool empty() const;
    size_t difference_count() const;
};

struct FieldDifference {
    std::string field;    // export key, e.g. "nTran"
    std::string a_value;
    std::string b_value;
};

const char* diff_kind_name(DiffKind kind);

namespace model {

// Fields that differ between two states, in export-key order.
// Masks compare on their decoded value, not their raw string.
std::vector<FieldDifference> field_differences(const BeamParameters& a,
                                               const BeamParameters& b);

// Walk devices, then states, then fields present in either side.
// Entries come out sorted by path, independent of input order.
Diff compare_contents(const FileContents& a, const FileContents& b,
                      bool report_matches = false);

// Multi-line, human-readable rendering for the CLI
std::string format_diff(const Diff& diff);

} // namespace model

inline bool operator==(const BeamParameters& a, const BeamParameters& b) {
    return model::field_differences(a, b).empty();
}

inline bool operator!=(const BeamParameters& a, const BeamParameters& b) {
    return !(a == b);
}
