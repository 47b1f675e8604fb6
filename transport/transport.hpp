#pragma once

// ============================================================
// transport.hpp -- Abstract file transport to one PLC
// ============================================================

#include "../common/platform.hpp"
#include "profile.hpp"
#include <functional>
#include <memory>
#include <string>

// One authenticated connection to a host. Implementations are not
// thread-safe: a transport serves a single in-flight operation.
//
// Error contract:
//   connect          -> AuthenticationError for any failed attempt
//   change_directory -> RemoteNotFoundError, IOError
//   list/put/get     -> RemoteNotFoundError, LocalNotFoundError (put), IOError
class Transport {
public:
    virtual ~Transport() = default;

    virtual void connect(const std::string& host, const Credential& cred) = 0;

    // Make directory the working directory; create it when allowed
    virtual void change_directory(const std::string& directory, bool create) = 0;

    // Raw long-format listing of the working directory.
    // An empty pattern lists everything.
    virtual std::string list(const std::string& pattern) = 0;

    // Upload local_path as remote_name in the working directory.
    // The remote file is either fully replaced or left untouched.
    virtual void put(const std::string& local_path, const std::string& remote_name) = 0;

    // Download remote_name from the working directory
    virtual std::string get(const std::string& remote_name) = 0;

    // Release the connection; safe to call more than once
    virtual void close() = 0;

    virtual ListingDialect listing_dialect() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;
