// ============================================================
// comparator.cpp -- Structural diff of two exports
// ============================================================

#include "comparator.hpp"
#include "beam_class.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <set>

bool Diff::empty() const {
    return difference_count() == 0;
}

size_t Diff::difference_count() const {
    return (size_t)std::count_if(entries.begin(), entries.end(), [](const DiffEntry& e) {
        return e.kind != DiffKind::MATCH;
    });
}

const char* diff_kind_name(DiffKind kind) {
    switch (kind) {
        case DiffKind::ONLY_IN_A:      return "only_in_a";
        case DiffKind::ONLY_IN_B:      return "only_in_b";
        case DiffKind::VALUE_MISMATCH: return "value_mismatch";
        case DiffKind::MATCH:          return "match";
    }
    return "?";
}

namespace model {

static void check_text(std::vector<FieldDifference>& out, const char* field,
                       const std::string& a, const std::string& b) {
    if (a != b) out.push_back({field, a, b});
}

static void check_number(std::vector<FieldDifference>& out, const char* field,
                         double a, double b) {
    if (a != b) out.push_back({field, utils::format_number(a), utils::format_number(b)});
}

static void check_integer(std::vector<FieldDifference>& out, const char* field,
                          i64 a, i64 b) {
    if (a != b) out.push_back({field, std::to_string(a), std::to_string(b)});
}

static void check_mask(std::vector<FieldDifference>& out, const char* field,
                       const MaskField& a, const MaskField& b, int width) {
    if (a.value != b.value) {
        out.push_back({field,
                       beam_class::zero_pad_binary((i64)a.value, width),
                       beam_class::zero_pad_binary((i64)b.value, width)});
    }
}

std::vector<FieldDifference> field_differences(const BeamParameters& a,
                                               const BeamParameters& b) {
    std::vector<FieldDifference> out;
    check_integer(out, "id", a.id, b.id);
    check_text(out, "name", a.name, b.name);
    check_text(out, "beamline", a.beamline, b.beamline);
    check_mask(out, "nBeamClassRange", a.beam_class_range, b.beam_class_range,
               beam_class::BEAM_CLASS_WIDTH);
    check_mask(out, "neVRange", a.photon_energy_range, b.photon_energy_range,
               beam_class::ENERGY_WIDTH);
    check_number(out, "nTran", a.transmission_limit, b.transmission_limit);
    check_integer(out, "nRate", a.rate_limit, b.rate_limit);
    check_text(out, "ap_name", a.aperture.name, b.aperture.name);
    check_number(out, "ap_xgap", a.aperture.x_gap, b.aperture.x_gap);
    check_number(out, "ap_xcenter", a.aperture.x_center, b.aperture.x_center);
    check_number(out, "ap_ygap", a.aperture.y_gap, b.aperture.y_gap);
    check_number(out, "ap_ycenter", a.aperture.y_center, b.aperture.y_center);
    check_text(out, "damage_limit", a.damage_limit, b.damage_limit);
    check_text(out, "pulse_energy", a.pulse_energy, b.pulse_energy);
    check_text(out, "notes", a.notes, b.notes);
    if (a.special != b.special) {
        out.push_back({"special", a.special ? "true" : "false", b.special ? "true" : "false"});
    }
    return out;
}

template<typename Map>
static std::set<std::string> key_union(const Map& a, const Map& b) {
    std::set<std::string> keys;
    for (const auto& kv : a) keys.insert(kv.first);
    for (const auto& kv : b) keys.insert(kv.first);
    return keys;
}

static void compare_device(Diff& diff, const std::string& device,
                           const DeviceParameters& a, const DeviceParameters& b,
                           bool report_matches) {
    for (const std::string& state : key_union(a, b)) {
        std::string path = device + "/" + state;
        auto ia = a.find(state);
        auto ib = b.find(state);
        if (ib == b.end()) {
            diff.entries.push_back({DiffKind::ONLY_IN_A, path, "", "", ""});
            continue;
        }
        if (ia == a.end()) {
            diff.entries.push_back({DiffKind::ONLY_IN_B, path, "", "", ""});
            continue;
        }
        std::vector<FieldDifference> fields = field_differences(ia->second, ib->second);
        if (fields.empty()) {
            if (report_matches) diff.entries.push_back({DiffKind::MATCH, path, "", "", ""});
            continue;
        }
        for (auto& f : fields) {
            diff.entries.push_back({DiffKind::VALUE_MISMATCH, path, std::move(f.field),
                                    std::move(f.a_value), std::move(f.b_value)});
        }
    }
}

Diff compare_contents(const FileContents& a, const FileContents& b, bool report_matches) {
    Diff diff;
    if (a.plc_name != b.plc_name) {
        diff.entries.push_back({DiffKind::VALUE_MISMATCH, "", "plc_name", a.plc_name, b.plc_name});
    }

    for (const std::string& device : key_union(a.devices, b.devices)) {
        auto ia = a.devices.find(device);
        auto ib = b.devices.find(device);
        if (ib == b.devices.end()) {
            diff.entries.push_back({DiffKind::ONLY_IN_A, device, "", "", ""});
        } else if (ia == a.devices.end()) {
            diff.entries.push_back({DiffKind::ONLY_IN_B, device, "", "", ""});
        } else {
            compare_device(diff, device, ia->second, ib->second, report_matches);
        }
    }
    return diff;
}

std::string format_diff(const Diff& diff) {
    std::string out;
    for (const DiffEntry& e : diff.entries) {
        std::string where = e.path.empty() ? std::string("<file>") : e.path;
        switch (e.kind) {
            case DiffKind::ONLY_IN_A:
                out += "only in a: " + where + "\n";
                break;
            case DiffKind::ONLY_IN_B:
                out += "only in b: " + where + "\n";
                break;
            case DiffKind::VALUE_MISMATCH:
                out += "mismatch:  " + where + " " + e.field + ": " +
                       e.a_value + " != " + e.b_value + "\n";
                break;
            case DiffKind::MATCH:
                out += "match:     " + where + "\n";
                break;
        }
    }
    return out;
}

} // namespace model
