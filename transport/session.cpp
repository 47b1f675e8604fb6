// ============================================================
// session.cpp -- Credential fallback and scoped connection
// ============================================================

#include "session.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <utility>
#include <vector>

// Closes a transport that never made it into a Session
struct TransportCloser {
    std::unique_ptr<Transport>& t;
    ~TransportCloser() {
        if (t) t->close();
    }
};

Session Session::open(const TransportProfile& profile,
                      const TransportFactory& factory,
                      const std::string& host,
                      const std::string& directory)
{
    std::string dir = directory.empty() ? profile.directory : directory;
    std::vector<std::string> causes;

    for (const Credential& cred : profile.credentials) {
        std::unique_ptr<Transport> transport = factory();
        if (!transport) {
            throw std::runtime_error("Session: transport factory returned null");
        }
        TransportCloser closer{transport};

        LOG_DEBUG("Session: connecting to " + host + " as " + cred.username +
                  " (" + protocol_name(profile.protocol) + ")");
        try {
            transport->connect(host, cred);
        } catch (const AuthenticationError& e) {
            LOG_WARN("Session: " + std::string(e.what()));
            causes.push_back(cred.username + ": " + e.what());
            continue;
        }

        if (!dir.empty()) {
            transport->change_directory(dir, profile.create_directory);
        }
        LOG_DEBUG("Session: connected to " + host + ", directory " +
                  (dir.empty() ? std::string("<login>") : dir));
        return Session(std::move(transport), host, dir);
    }

    throw ConnectionError(host, std::move(causes));
}

Session::Session(std::unique_ptr<Transport> transport, std::string host, std::string directory)
    : transport_(std::move(transport))
    , host_(std::move(host))
    , directory_(std::move(directory)) {}

Session::~Session() {
    close();
}

Session::Session(Session&& o) noexcept
    : transport_(std::move(o.transport_))
    , host_(std::move(o.host_))
    , directory_(std::move(o.directory_)) {}

Session& Session::operator=(Session&& o) noexcept {
    if (this != &o) {
        close();
        transport_ = std::move(o.transport_);
        host_      = std::move(o.host_);
        directory_ = std::move(o.directory_);
    }
    return *this;
}

void Session::close() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

Transport& Session::live(const char* operation) {
    if (!transport_) {
        throw IOError(host_, operation, "session is closed");
    }
    return *transport_;
}

ListingDialect Session::listing_dialect() const {
    return transport_ ? transport_->listing_dialect() : ListingDialect::EPOCH_SECONDS;
}

std::string Session::list(const std::string& pattern) {
    return live("list").list(pattern);
}

void Session::put(const std::string& local_path, const std::string& remote_name) {
    live("put").put(local_path, remote_name);
}

std::string Session::get(const std::string& remote_name) {
    return live("get").get(remote_name);
}
