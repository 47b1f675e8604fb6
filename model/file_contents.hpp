#pragma once

// ============================================================
// file_contents.hpp -- Typed view of a PLC beam-parameter export
// ============================================================

#include "../common/platform.hpp"
#include <map>
#include <string>

// A bitmask as stored in the export: the raw zero-padded binary string
// is kept for writing the file back, the value is used for comparison.
struct MaskField {
    std::string raw;
    u64         value{0};
    std::string description;
};

struct Aperture {
    std::string name;
    double      x_gap{0};
    double      x_center{0};
    double      y_gap{0};
    double      y_center{0};
};

// Beam parameters of one state of one device
struct BeamParameters {
    i64         id{0};
    std::string name;
    std::string beamline;
    MaskField   beam_class_range;     // nBeamClassRange, 16 bits
    MaskField   photon_energy_range;  // neVRange, 32 bits
    double      transmission_limit{0};
    i64         rate_limit{0};
    Aperture    aperture;
    std::string damage_limit;
    std::string pulse_energy;
    std::string notes;
    bool        special{false};
};

// state name -> parameters
using DeviceParameters = std::map<std::string, BeamParameters>;

struct FileContents {
    std::string                             plc_name;
    std::map<std::string, DeviceParameters> devices;
};

namespace model {

// Parse the raw bytes of an export.
//   malformed JSON                 -> ParseError
//   wrong shape, missing or
//   mistyped field                 -> SchemaError naming device/state/field
// Keys of a state object that are not part of the schema are ignored.
FileContents parse_file_contents(const std::string& raw);

// Write contents back in the export schema (4-space indented JSON).
// Masks keep their raw strings; numeric fields are written as numbers.
std::string serialize(const FileContents& contents);

} // namespace model
