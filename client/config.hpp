#pragma once

// ============================================================
// config.hpp -- Deployment profiles: built-in and JSON file
// ============================================================

#include "../transport/profile.hpp"
#include <map>
#include <string>

struct PmpsConfig {
    std::string                             default_profile;
    std::map<std::string, TransportProfile> profiles;
};

namespace config {

// "ftp" / "sftp" (case-insensitive); throws ConfigError otherwise
TransferProtocol parse_protocol(const std::string& text, const std::string& source = "argument");

// Built-in profile for the protocol, named after it
TransportProfile default_profile(TransferProtocol protocol);

// Both built-in profiles, default "sftp"
PmpsConfig builtin_config();

// Parse configuration JSON text; source names it in errors
PmpsConfig parse_config(const std::string& text, const std::string& source);

// Read and parse a configuration file. Throws ConfigError.
PmpsConfig load_config(const std::string& path);

// The named profile, or the default one when name is empty.
// Throws ConfigError for an unknown name.
const TransportProfile& select_profile(const PmpsConfig& cfg, const std::string& name = "");

} // namespace config
