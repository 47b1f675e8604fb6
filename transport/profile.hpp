#pragma once

// ============================================================
// profile.hpp -- How to reach the PLC file area
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>

struct Credential {
    std::string username;
    std::string password;
};

enum class TransferProtocol : u8 {
    FTP  = 0,
    SFTP = 1,
};

// Long-format listing flavours produced by the PLC servers
enum class ListingDialect : u8 {
    EPOCH_SECONDS = 0,  // ls -l -D %s: 7 fields, first line is "total N"
    UNIX_LS       = 1,  // classic ls -l: month/day/time-or-year, name may contain spaces
};

struct TransportProfile {
    std::string             name;
    TransferProtocol        protocol{TransferProtocol::SFTP};
    u16                     port{0};             // 0 = protocol default
    std::string             directory;           // remote working directory
    std::vector<Credential> credentials;         // tried in order
    int                     connect_timeout_s{10};
    int                     transfer_timeout_s{30};
    bool                    create_directory{false};
    ListingDialect          listing_dialect{ListingDialect::UNIX_LS};
    std::string             list_command;        // FTP only, e.g. "LIST -D %s"
    std::string             known_hosts;         // SFTP only; empty = no host key check
};

inline const char* protocol_name(TransferProtocol p) {
    switch (p) {
        case TransferProtocol::FTP:  return "ftp";
        case TransferProtocol::SFTP: return "sftp";
    }
    return "?";
}
