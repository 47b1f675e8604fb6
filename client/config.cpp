// ============================================================
// config.cpp -- Deployment profiles: built-in and JSON file
// ============================================================

#include "config.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <json/json.h>
#include <memory>

namespace config {

TransferProtocol parse_protocol(const std::string& text, const std::string& source) {
    std::string p = utils::to_lower(utils::trim(text));
    if (p == "ftp")  return TransferProtocol::FTP;
    if (p == "sftp") return TransferProtocol::SFTP;
    throw ConfigError(source, "unknown protocol \"" + text + "\" (expected ftp or sftp)");
}

static ListingDialect parse_dialect(const std::string& text, const std::string& source) {
    std::string d = utils::to_lower(utils::trim(text));
    if (d == "epoch") return ListingDialect::EPOCH_SECONDS;
    if (d == "unix")  return ListingDialect::UNIX_LS;
    throw ConfigError(source, "unknown listing_dialect \"" + text + "\" (expected epoch or unix)");
}

TransportProfile default_profile(TransferProtocol protocol) {
    TransportProfile p;
    p.name     = protocol_name(protocol);
    p.protocol = protocol;
    if (protocol == TransferProtocol::FTP) {
        // TcBSD ftpd hands LIST options to ls(1); -D %s prints epoch seconds
        p.directory        = "pmps";
        p.credentials      = {{"Administrator", "1"}, {"anonymous", ""}};
        p.create_directory = true;
        p.listing_dialect  = ListingDialect::EPOCH_SECONDS;
        p.list_command     = "LIST -D %s";
    } else {
        p.directory        = "/Hard Disk/ftp/pmps";
        p.credentials      = {{"Administrator", "1"}};
        p.create_directory = false;
        p.listing_dialect  = ListingDialect::UNIX_LS;
    }
    return p;
}

PmpsConfig builtin_config() {
    PmpsConfig cfg;
    cfg.default_profile = "sftp";
    cfg.profiles["ftp"]  = default_profile(TransferProtocol::FTP);
    cfg.profiles["sftp"] = default_profile(TransferProtocol::SFTP);
    return cfg;
}

// ---------------------------------------------------------------
// JSON helpers: absent keys keep the built-in value
// ---------------------------------------------------------------

static void read_string(const Json::Value& obj, const char* key, std::string& out,
                        const std::string& where) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isString()) throw ConfigError(where, std::string(key) + " must be a string");
    out = obj[key].asString();
}

static void read_int(const Json::Value& obj, const char* key, int& out,
                     const std::string& where, int min_value) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isInt() || obj[key].asInt() < min_value) {
        throw ConfigError(where, std::string(key) + " must be an integer >= " +
                                 std::to_string(min_value));
    }
    out = obj[key].asInt();
}

static void read_bool(const Json::Value& obj, const char* key, bool& out,
                      const std::string& where) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isBool()) throw ConfigError(where, std::string(key) + " must be true or false");
    out = obj[key].asBool();
}

static TransportProfile parse_profile(const std::string& name, const Json::Value& obj,
                                      const std::string& source) {
    std::string where = source + ": profile " + name;
    if (!obj.isObject()) throw ConfigError(where, "must be an object");
    if (!obj.isMember("protocol") || !obj["protocol"].isString()) {
        throw ConfigError(where, "protocol is required");
    }

    TransportProfile p = default_profile(parse_protocol(obj["protocol"].asString(), where));
    p.name = name;

    int port = 0;
    read_int(obj, "port", port, where, 0);
    if (port != 0 && !utils::validate_port(port)) {
        throw ConfigError(where, "port must be 1-65535");
    }
    p.port = (u16)port;

    read_string(obj, "directory", p.directory, where);
    read_int(obj, "connect_timeout_s", p.connect_timeout_s, where, 1);
    read_int(obj, "transfer_timeout_s", p.transfer_timeout_s, where, 1);
    read_bool(obj, "create_directory", p.create_directory, where);
    read_string(obj, "list_command", p.list_command, where);
    read_string(obj, "known_hosts", p.known_hosts, where);

    if (obj.isMember("listing_dialect")) {
        if (!obj["listing_dialect"].isString()) {
            throw ConfigError(where, "listing_dialect must be a string");
        }
        p.listing_dialect = parse_dialect(obj["listing_dialect"].asString(), where);
    }

    if (obj.isMember("credentials")) {
        const Json::Value& creds = obj["credentials"];
        if (!creds.isArray() || creds.empty()) {
            throw ConfigError(where, "credentials must be a non-empty array");
        }
        p.credentials.clear();
        for (Json::ArrayIndex i = 0; i < creds.size(); ++i) {
            const Json::Value& c = creds[i];
            if (!c.isObject() || !c["username"].isString() ||
                (c.isMember("password") && !c["password"].isString())) {
                throw ConfigError(where, "credentials[" + std::to_string(i) +
                                         "] needs a string username and password");
            }
            p.credentials.push_back({c["username"].asString(),
                                     c.get("password", "").asString()});
        }
    }
    return p;
}

PmpsConfig parse_config(const std::string& text, const std::string& source) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        throw ConfigError(source, utils::trim(errs));
    }
    if (!root.isObject()) throw ConfigError(source, "top level must be an object");

    PmpsConfig cfg = builtin_config();
    if (root.isMember("profiles")) {
        const Json::Value& profiles = root["profiles"];
        if (!profiles.isObject()) throw ConfigError(source, "profiles must be an object");
        for (const std::string& name : profiles.getMemberNames()) {
            cfg.profiles[name] = parse_profile(name, profiles[name], source);
        }
    }

    read_string(root, "default_profile", cfg.default_profile, source);
    if (!cfg.profiles.count(cfg.default_profile)) {
        throw ConfigError(source, "default_profile \"" + cfg.default_profile +
                                  "\" is not defined");
    }
    return cfg;
}

PmpsConfig load_config(const std::string& path) {
    std::string text;
    try {
        text = file_io::read_file(path);
    } catch (const std::exception& e) {
        throw ConfigError(path, e.what());
    }
    PmpsConfig cfg = parse_config(text, path);
    LOG_DEBUG("Config: loaded " + std::to_string(cfg.profiles.size()) + " profiles from " + path);
    return cfg;
}

const TransportProfile& select_profile(const PmpsConfig& cfg, const std::string& name) {
    const std::string& key = name.empty() ? cfg.default_profile : name;
    auto it = cfg.profiles.find(key);
    if (it == cfg.profiles.end()) {
        throw ConfigError("profiles", "no profile named \"" + key + "\"");
    }
    return it->second;
}

} // namespace config
