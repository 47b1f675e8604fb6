#pragma once

// ============================================================
// test_support.hpp -- Sample exports and scratch directories
// ============================================================

#include "../common/logger.hpp"
#include <json/json.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

// A state object carrying every required field
inline Json::Value sample_state(const std::string& name = "OUT",
                                const std::string& beam_classes = "0000000000000001") {
    Json::Value s(Json::objectValue);
    s["id"]              = 7;
    s["name"]            = name;
    s["beamline"]        = "L0";
    s["nBeamClassRange"] = beam_classes;
    s["neVRange"]        = "00000000000000000000000000000011";
    s["nTran"]           = "0.5";
    s["nRate"]           = "120";
    s["ap_name"]         = "Aperture 1";
    s["ap_xgap"]         = 1.5;
    s["ap_xcenter"]      = 0.0;
    s["ap_ygap"]         = 2.25;
    s["ap_ycenter"]      = -0.5;
    s["damage_limit"]    = "";
    s["pulse_energy"]    = "";
    s["notes"]           = "sample";
    s["special"]         = false;
    return s;
}

// {"<plc>": {"<device>": {"<state>": state}}}
inline Json::Value single_state_export(const std::string& plc, const std::string& device,
                                       const std::string& state, const Json::Value& params) {
    Json::Value root(Json::objectValue);
    root[plc][device][state] = params;
    return root;
}

inline std::string to_json_text(const Json::Value& v) {
    Json::StreamWriterBuilder w;
    w["indentation"] = "  ";
    return Json::writeString(w, v);
}

// Unique scratch directory, removed with its contents on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("pmpsdb_test_" + std::to_string((long)::getpid()) + "_" +
                 std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }

    std::string write(const std::string& name, const std::string& data) const {
        std::filesystem::path p = path_ / name;
        std::ofstream f(p, std::ios::binary);
        f << data;
        return p.string();
    }

private:
    std::filesystem::path path_;
};

// Keeps expected WARN lines out of the test output
struct QuietLogs {
    QuietLogs()  { Logger::get().set_quiet(true); }
    ~QuietLogs() { Logger::get().set_quiet(false); }
};
