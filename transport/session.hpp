#pragma once

// ============================================================
// session.hpp -- One authenticated operation sequence on a PLC
// ============================================================

#include "../common/platform.hpp"
#include "profile.hpp"
#include "transport.hpp"
#include <memory>
#include <string>

class Session {
public:
    // Try each credential of the profile in order until one logs in,
    // then change into directory (profile.directory when empty).
    // Throws ConnectionError when no credential works; errors while
    // changing directory propagate unchanged.
    static Session open(const TransportProfile& profile,
                        const TransportFactory& factory,
                        const std::string& host,
                        const std::string& directory = "");

    ~Session();

    // Move-only: exactly one owner closes the connection
    Session(Session&& o) noexcept;
    Session& operator=(Session&& o) noexcept;
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    std::string list(const std::string& pattern = "");
    void put(const std::string& local_path, const std::string& remote_name);
    std::string get(const std::string& remote_name);

    void close();

    const std::string& host() const { return host_; }
    const std::string& directory() const { return directory_; }
    ListingDialect listing_dialect() const;
    bool is_open() const { return transport_ != nullptr; }

private:
    Session(std::unique_ptr<Transport> transport, std::string host, std::string directory);

    Transport& live(const char* operation);

    std::unique_ptr<Transport> transport_;
    std::string host_;
    std::string directory_;
};
