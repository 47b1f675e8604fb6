// ============================================================
// file_contents.cpp -- Export parsing and serialization (jsoncpp)
// ============================================================

#include "file_contents.hpp"
#include "beam_class.hpp"
#include "../common/errors.hpp"
#include "../common/utils.hpp"
#include <json/json.h>
#include <memory>
#include <stdexcept>

namespace {

// Export keys
const char* const K_ID           = "id";
const char* const K_NAME         = "name";
const char* const K_BEAMLINE     = "beamline";
const char* const K_BC_RANGE     = "nBeamClassRange";
const char* const K_EV_RANGE     = "neVRange";
const char* const K_TRAN         = "nTran";
const char* const K_RATE         = "nRate";
const char* const K_AP_NAME      = "ap_name";
const char* const K_AP_XGAP      = "ap_xgap";
const char* const K_AP_XCENTER   = "ap_xcenter";
const char* const K_AP_YGAP      = "ap_ygap";
const char* const K_AP_YCENTER   = "ap_ycenter";
const char* const K_DAMAGE_LIMIT = "damage_limit";
const char* const K_PULSE_ENERGY = "pulse_energy";
const char* const K_NOTES        = "notes";
const char* const K_SPECIAL      = "special";

// ---------------------------------------------------------------
// Field conversion: one function per target type, each either
// returns the typed value or throws SchemaError for that field.
// ---------------------------------------------------------------

const Json::Value& require(const Json::Value& obj, const char* key, const std::string& path) {
    if (!obj.isMember(key)) {
        throw SchemaError(path + "/" + key, "missing required field");
    }
    return obj[key];
}

std::string get_string(const Json::Value& obj, const char* key, const std::string& path) {
    const Json::Value& v = require(obj, key, path);
    if (!v.isString()) {
        throw SchemaError(path + "/" + key, "expected a string");
    }
    return v.asString();
}

i64 get_integer(const Json::Value& obj, const char* key, const std::string& path) {
    const Json::Value& v = require(obj, key, path);
    if (v.isInt64()) return (i64)v.asInt64();
    if (v.isString()) {
        i64 out = 0;
        if (utils::parse_i64(v.asString(), out)) return out;
        throw SchemaError(path + "/" + key, "\"" + v.asString() + "\" is not an integer");
    }
    throw SchemaError(path + "/" + key, "expected an integer");
}

double get_number(const Json::Value& obj, const char* key, const std::string& path) {
    const Json::Value& v = require(obj, key, path);
    if (v.isNumeric() && !v.isBool()) return v.asDouble();
    if (v.isString()) {
        double out = 0;
        if (utils::parse_double(v.asString(), out)) return out;
        throw SchemaError(path + "/" + key, "\"" + v.asString() + "\" is not a number");
    }
    throw SchemaError(path + "/" + key, "expected a number");
}

bool get_bool(const Json::Value& obj, const char* key, const std::string& path) {
    const Json::Value& v = require(obj, key, path);
    if (!v.isBool()) {
        throw SchemaError(path + "/" + key, "expected true or false");
    }
    return v.asBool();
}

std::string get_mask(const Json::Value& obj, const char* key, const std::string& path,
                     int width, u64& value) {
    std::string raw = get_string(obj, key, path);
    try {
        value = beam_class::parse_binary_mask(raw, width);
    } catch (const std::invalid_argument& e) {
        throw SchemaError(path + "/" + key, e.what());
    }
    return raw;
}

BeamParameters parse_state(const Json::Value& obj, const std::string& path) {
    if (!obj.isObject()) {
        throw SchemaError(path, "expected an object of beam parameters");
    }

    BeamParameters bp;
    bp.id       = get_integer(obj, K_ID, path);
    bp.name     = get_string(obj, K_NAME, path);
    bp.beamline = get_string(obj, K_BEAMLINE, path);

    bp.beam_class_range.raw = get_mask(obj, K_BC_RANGE, path, beam_class::BEAM_CLASS_WIDTH,
                                       bp.beam_class_range.value);
    bp.beam_class_range.description =
        beam_class::decode_beam_class_mask((i64)bp.beam_class_range.value);

    bp.photon_energy_range.raw = get_mask(obj, K_EV_RANGE, path, beam_class::ENERGY_WIDTH,
                                          bp.photon_energy_range.value);
    bp.photon_energy_range.description =
        beam_class::decode_energy_mask((i64)bp.photon_energy_range.value,
                                       beam_class::ENERGY_WIDTH,
                                       beam_class::line_for_beamline(bp.beamline));

    bp.transmission_limit = get_number(obj, K_TRAN, path);
    bp.rate_limit         = get_integer(obj, K_RATE, path);

    bp.aperture.name     = get_string(obj, K_AP_NAME, path);
    bp.aperture.x_gap    = get_number(obj, K_AP_XGAP, path);
    bp.aperture.x_center = get_number(obj, K_AP_XCENTER, path);
    bp.aperture.y_gap    = get_number(obj, K_AP_YGAP, path);
    bp.aperture.y_center = get_number(obj, K_AP_YCENTER, path);

    bp.damage_limit = get_string(obj, K_DAMAGE_LIMIT, path);
    bp.pulse_energy = get_string(obj, K_PULSE_ENERGY, path);
    bp.notes        = get_string(obj, K_NOTES, path);
    bp.special      = get_bool(obj, K_SPECIAL, path);
    return bp;
}

// jsoncpp reports "* Line N, Column M" ahead of each message
size_t error_line(const std::string& errs) {
    size_t pos = errs.find("Line ");
    if (pos == std::string::npos) return 0;
    u64 n = 0;
    size_t end = errs.find(',', pos);
    if (utils::parse_u64(errs.substr(pos + 5, end == std::string::npos
                                              ? std::string::npos : end - pos - 5), n)) {
        return (size_t)n;
    }
    return 0;
}

} // namespace

namespace model {

FileContents parse_file_contents(const std::string& raw) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(raw.data(), raw.data() + raw.size(), &root, &errs)) {
        throw ParseError(error_line(errs), "", "invalid JSON: " + utils::trim(errs));
    }

    if (!root.isObject() || root.size() != 1) {
        throw SchemaError("", "expected an object with exactly one key (the PLC name)");
    }

    FileContents fc;
    fc.plc_name = root.getMemberNames().front();
    const Json::Value& plc = root[fc.plc_name];
    if (!plc.isObject()) {
        throw SchemaError("", "value of \"" + fc.plc_name + "\" must be an object of devices");
    }

    for (const std::string& device : plc.getMemberNames()) {
        const Json::Value& states = plc[device];
        if (!states.isObject()) {
            throw SchemaError(device, "expected an object of states");
        }
        DeviceParameters& params = fc.devices[device];
        for (const std::string& state : states.getMemberNames()) {
            params.emplace(state, parse_state(states[state], device + "/" + state));
        }
    }
    return fc;
}

std::string serialize(const FileContents& contents) {
    Json::Value devices(Json::objectValue);
    for (const auto& dev : contents.devices) {
        Json::Value states(Json::objectValue);
        for (const auto& st : dev.second) {
            const BeamParameters& bp = st.second;
            Json::Value v(Json::objectValue);
            v[K_ID]           = Json::Int64(bp.id);
            v[K_NAME]         = bp.name;
            v[K_BEAMLINE]     = bp.beamline;
            v[K_BC_RANGE]     = bp.beam_class_range.raw;
            v[K_EV_RANGE]     = bp.photon_energy_range.raw;
            v[K_TRAN]         = bp.transmission_limit;
            v[K_RATE]         = Json::Int64(bp.rate_limit);
            v[K_AP_NAME]      = bp.aperture.name;
            v[K_AP_XGAP]      = bp.aperture.x_gap;
            v[K_AP_XCENTER]   = bp.aperture.x_center;
            v[K_AP_YGAP]      = bp.aperture.y_gap;
            v[K_AP_YCENTER]   = bp.aperture.y_center;
            v[K_DAMAGE_LIMIT] = bp.damage_limit;
            v[K_PULSE_ENERGY] = bp.pulse_energy;
            v[K_NOTES]        = bp.notes;
            v[K_SPECIAL]      = bp.special;
            states[st.first] = v;
        }
        devices[dev.first] = states;
    }

    Json::Value root(Json::objectValue);
    root[contents.plc_name] = devices;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "    ";
    return Json::writeString(writer, root) + "\n";
}

} // namespace model
