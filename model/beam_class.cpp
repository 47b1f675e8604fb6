// ============================================================
// beam_class.cpp -- Beam-class table and bitmask codec
// ============================================================

#include "beam_class.hpp"
#include "../common/utils.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace beam_class {

// ---------------------------------------------------------------
// Tables
// ---------------------------------------------------------------

const std::vector<BeamClass>& beam_classes() {
    static const std::vector<BeamClass> table = {
        // index name           dT        dt          Q      rate   current   power     int.E  notes
        {0,  "Beam Off",    0.5,    std::nullopt, 0,    0,    0.0,     0.0,      0.0,  "Beam off, Kickers off"},
        {1,  "Kicker STBY", 0.5,    std::nullopt, 0,    0,    0.0,     0.0,      0.0,  "Beam off, Kickers standby"},
        {2,  "BC1Hz",       1.0,    1.0,          350,  1,    0.35,    1.4,      1.4,  "350 pC x 1 Hz"},
        {3,  "BC10Hz",      1.0,    0.1,          3500, 10,   3.5,     14.0,     14.0, "350 pC X 10 Hz"},
        {4,  "Diagnostic",  0.5,    std::nullopt, 5000, std::nullopt, 10.0, 40.0, 20.0, "50 pC x 200 Hz"},
        {5,  "BC120Hz",     0.2,    0.0083,       6000, 120,  30.0,    120.0,    24.0, "250 pC x 120 Hz"},
        {6,  "Tuning",      0.2,    std::nullopt, 7000, std::nullopt, 35.0, 140.0, 28.0, "100 pC X 350 Hz"},
        {7,  "1% MAP",      0.01,   std::nullopt, 3000, std::nullopt, 300.0, 1200.0, 12.0, "100 pC X 3 kHz"},
        {8,  "5% MAP",      0.003,  std::nullopt, 4500, std::nullopt, 1500.0, 6000.0, 18.0, "100 pC x 15 kHz"},
        {9,  "10% MAP",     0.001,  std::nullopt, 3000, std::nullopt, 3000.0, 12000.0, 12.0, "100 pC X 30 kHz"},
        {10, "25% MAP",     4e-4,   std::nullopt, 3000, std::nullopt, 7500.0, 30000.0, 12.0, "100 pC x 75 kHz"},
        {11, "50% MAP",     2e-1,   std::nullopt, 3000, std::nullopt, 15000.0, 60000.0, 12.0, "100 pC x 150 kHz"},
        {12, "100% MAP",    2e-4,   std::nullopt, 6000, std::nullopt, 30000.0, 120000.0, 24.0, "100 pC x 300 kHz"},
        {13, "Unlimited",   std::nullopt, std::nullopt, std::nullopt, std::nullopt,
                            std::nullopt, std::nullopt, std::nullopt, std::nullopt},
    };
    return table;
}

// Upper band edges in eV; band i is [edge[i-1], edge[i]), band 0 starts at 0
static const double K_EDGES[ENERGY_WIDTH] = {
    1000, 1700, 2100, 2500, 3800, 4000, 5000, 7000,
    7500, 7700, 8900, 10000, 11100, 12000, 13000, 13500,
    14000, 16900, 18000, 20000, 22000, 24000, 25000, 25500,
    26000, 27000, 28000, 28500, 29000, 30000, 60000, 100000,
};

static const double L_EDGES[ENERGY_WIDTH] = {
    100, 250, 270, 350, 400, 450, 480, 530,
    561, 600, 622, 680, 700, 760, 830, 870,
    900, 1000, 1100, 1200, 1300, 1500, 1700, 2000,
    2500, 3000, 3500, 4000, 5000, 6000, 7000, 7500,
};

static std::vector<EnergyRange> build_ranges(const double* edges) {
    std::vector<EnergyRange> out;
    out.reserve(ENERGY_WIDTH);
    double low = 0.0;
    for (int i = 0; i < ENERGY_WIDTH; ++i) {
        out.push_back({i, low, edges[i]});
        low = edges[i];
    }
    return out;
}

const std::vector<EnergyRange>& energy_ranges(char line) {
    static const std::vector<EnergyRange> k_ranges = build_ranges(K_EDGES);
    static const std::vector<EnergyRange> l_ranges = build_ranges(L_EDGES);
    switch (line) {
        case 'k': return k_ranges;
        case 'l': return l_ranges;
        default:
            throw std::invalid_argument(std::string("unknown accelerator line '") + line +
                                        "', expected 'k' or 'l'");
    }
}

char line_for_beamline(const std::string& beamline) {
    if (!beamline.empty() && std::tolower((unsigned char)beamline[0]) == 'k') return 'k';
    return 'l';
}

// ---------------------------------------------------------------
// Lookups
// ---------------------------------------------------------------

const BeamClass* find_beam_class(const std::string& name) {
    for (const auto& bc : beam_classes()) {
        if (bc.name == name) return &bc;
    }
    return nullptr;
}

std::vector<BeamClass> permitted_classes(u64 mask, int width) {
    std::vector<BeamClass> out;
    const auto& table = beam_classes();
    for (int i = 0; i < width && i < (int)table.size(); ++i) {
        if (mask & ((u64)1 << i)) out.push_back(table[(size_t)i]);
    }
    return out;
}

u64 mask_for_classes(const std::vector<int>& indices) {
    u64 mask = 0;
    for (int idx : indices) {
        if (idx < 0 || idx >= (int)beam_classes().size()) {
            throw std::out_of_range("no beam class with index " + std::to_string(idx));
        }
        mask |= (u64)1 << idx;
    }
    return mask;
}

// ---------------------------------------------------------------
// Bit strings
// ---------------------------------------------------------------

std::string zero_pad_binary(i64 value, int width) {
    if (width < 1 || width > 64) {
        throw std::out_of_range("bit width must be 1..64, got " + std::to_string(width));
    }
    if (width < 63 && value >= ((i64)1 << width)) {
        throw std::out_of_range(std::to_string(value) + " does not fit in " +
                                std::to_string(width) + " bits");
    }
    if (value < 0) {
        i64 lowest = width == 64 ? std::numeric_limits<i64>::min()
                                 : -((i64)1 << (width - 1));
        if (value < lowest) {
            throw std::out_of_range(std::to_string(value) + " does not fit in " +
                                    std::to_string(width) + " bits");
        }
    }

    u64 bits = (u64)value;
    if (width < 64) bits &= ((u64)1 << width) - 1;

    std::string out((size_t)width, '0');
    for (int i = 0; i < width; ++i) {
        if (bits & ((u64)1 << i)) out[(size_t)(width - 1 - i)] = '1';
    }
    return out;
}

u64 parse_binary_mask(const std::string& text, int width) {
    if (width < 1 || width > 64) {
        throw std::out_of_range("bit width must be 1..64, got " + std::to_string(width));
    }
    if (text.empty() || text.size() > (size_t)width) {
        throw std::invalid_argument("bitmask \"" + text + "\" must have 1.." +
                                    std::to_string(width) + " binary digits");
    }
    u64 value = 0;
    for (char c : text) {
        if (c != '0' && c != '1') {
            throw std::invalid_argument("bitmask \"" + text + "\" is not a binary string");
        }
        value = (value << 1) | (u64)(c - '0');
    }
    return value;
}

// ---------------------------------------------------------------
// Descriptions
// ---------------------------------------------------------------

std::string decode_beam_class_mask(i64 mask, int width) {
    std::string bits = zero_pad_binary(mask, width);
    const auto& table = beam_classes();

    std::string out;
    for (int i = 0; i < width; ++i) {
        if (bits[(size_t)(width - 1 - i)] != '1') continue;
        if (!out.empty()) out += "\n";
        if (i < (int)table.size()) {
            out += std::to_string(i) + ": " + table[(size_t)i].name;
        } else {
            out += std::to_string(i) + ": undefined beam class";
        }
    }
    return out.empty() ? std::string("no beam classes") : out;
}

std::string decode_energy_mask(i64 mask, int width, char line) {
    const auto& ranges = energy_ranges(line);
    std::string bits = zero_pad_binary(mask, width);

    std::string out;
    for (int i = 0; i < width; ++i) {
        if (bits[(size_t)(width - 1 - i)] != '1') continue;
        if (!out.empty()) out += "\n";
        if (i < (int)ranges.size()) {
            const EnergyRange& r = ranges[(size_t)i];
            out += std::to_string(i) + ": " + utils::format_number(r.low_ev) + " eV to " +
                   utils::format_number(r.high_ev) + " eV";
        } else {
            out += std::to_string(i) + ": undefined energy range";
        }
    }
    return out.empty() ? std::string("no energy ranges") : out;
}

} // namespace beam_class
