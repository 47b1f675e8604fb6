#pragma once

// ============================================================
// beam_class.hpp -- Beam-class table and bitmask codec
// ============================================================

#include "../common/platform.hpp"
#include <optional>
#include <string>
#include <vector>

// One row of the beam-class table. Absent limits mean "no limit /
// not applicable", never zero.
struct BeamClass {
    int                        index;
    std::string                name;
    std::optional<double>      charge_time;   // s
    std::optional<double>      pulse_period;  // s
    std::optional<i64>         charge;        // pC
    std::optional<i64>         rate_max;      // Hz
    std::optional<double>      current;       // nA
    std::optional<double>      power;         // W @ 4 GeV
    std::optional<double>      int_energy;    // J @ 4 GeV
    std::optional<std::string> notes;
};

// One photon-energy band [low_ev, high_ev)
struct EnergyRange {
    int    bit;
    double low_ev;
    double high_ev;
};

namespace beam_class {

constexpr int BEAM_CLASS_WIDTH = 16;
constexpr int ENERGY_WIDTH     = 32;

// The 14 beam classes, index 0..13, built once on first use
const std::vector<BeamClass>& beam_classes();

// nullptr when no class has that display name
const BeamClass* find_beam_class(const std::string& name);

// Classes whose bit is set in mask (bit i <-> class index i)
std::vector<BeamClass> permitted_classes(u64 mask, int width = BEAM_CLASS_WIDTH);

// Mask with the bits of the given class indices set.
// Throws std::out_of_range for an index outside the table.
u64 mask_for_classes(const std::vector<int>& indices);

// Human-readable summary of a beam-class mask, one line per set bit:
//   "<index>: <name>"  ("<index>: undefined beam class" past the table)
// or "no beam classes" when no bit is set.
std::string decode_beam_class_mask(i64 mask, int width = BEAM_CLASS_WIDTH);

// The 32 energy bands of accelerator line 'k' or 'l'.
// Throws std::invalid_argument for any other line.
const std::vector<EnergyRange>& energy_ranges(char line);

// 'k' when the beamline name starts with K (case-insensitive), else 'l'
char line_for_beamline(const std::string& beamline);

// Human-readable summary of a photon-energy mask, one line per set bit
std::string decode_energy_mask(i64 mask, int width = ENERGY_WIDTH, char line = 'l');

// Normalize value into [0, 2^width) (two's complement for negatives) and
// left-pad its binary form to exactly width characters.
// width must be 1..64; values outside [-2^(width-1), 2^width) throw
// std::out_of_range.
std::string zero_pad_binary(i64 value, int width);

// Value of a '0'/'1' string of 1..width characters.
// Throws std::invalid_argument otherwise.
u64 parse_binary_mask(const std::string& text, int width);

} // namespace beam_class
