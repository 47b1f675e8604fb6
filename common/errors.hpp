#pragma once

// ============================================================
// errors.hpp -- Exception taxonomy for transfers and parsing
// ============================================================

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class PmpsError : public std::runtime_error {
public:
    explicit PmpsError(const std::string& msg) : std::runtime_error(msg) {}
};

// No configured credential could open a session to the host.
// causes() has one "<user>: <reason>" entry per attempt, in order.
class ConnectionError : public PmpsError {
public:
    ConnectionError(const std::string& host, std::vector<std::string> causes)
        : PmpsError(make_message(host, causes))
        , host_(host)
        , causes_(std::move(causes)) {}

    const std::string& host() const { return host_; }
    const std::vector<std::string>& causes() const { return causes_; }

private:
    std::string host_;
    std::vector<std::string> causes_;

    static std::string make_message(const std::string& host,
                                    const std::vector<std::string>& causes) {
        if (causes.empty()) {
            return "Unable to connect to " + host + ": no credentials configured";
        }
        if (causes.size() == 1) {
            return "Unable to connect to " + host + ": " + causes[0];
        }
        std::string msg = "Unable to connect to " + host + " with any of " +
                          std::to_string(causes.size()) + " credentials:";
        for (const auto& c : causes) msg += "\n  " + c;
        return msg;
    }
};

// One credential attempt failed inside Transport::connect
class AuthenticationError : public PmpsError {
public:
    AuthenticationError(const std::string& host, const std::string& user,
                        const std::string& reason)
        : PmpsError("Login to " + host + " as " + user + " failed: " + reason)
        , host_(host), user_(user), reason_(reason) {}

    const std::string& host() const { return host_; }
    const std::string& user() const { return user_; }
    const std::string& reason() const { return reason_; }

private:
    std::string host_;
    std::string user_;
    std::string reason_;
};

class RemoteNotFoundError : public PmpsError {
public:
    RemoteNotFoundError(const std::string& host, const std::string& path)
        : PmpsError("No such file or directory on " + host + ": " + path)
        , host_(host), path_(path) {}

    const std::string& host() const { return host_; }
    const std::string& path() const { return path_; }

private:
    std::string host_;
    std::string path_;
};

class LocalNotFoundError : public PmpsError {
public:
    explicit LocalNotFoundError(const std::string& path)
        : PmpsError("No such local file: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Content reached us but is not what we expected
class ContentError : public PmpsError {
public:
    explicit ContentError(const std::string& msg) : PmpsError(msg) {}
};

class ParseError : public ContentError {
public:
    // line_number is 1-based; 0 when the position is unknown
    ParseError(size_t line_number, const std::string& line, const std::string& reason)
        : ContentError(make_message(line_number, line, reason))
        , line_number_(line_number), line_(line), reason_(reason) {}

    size_t line_number() const { return line_number_; }
    const std::string& line() const { return line_; }
    const std::string& reason() const { return reason_; }

private:
    size_t line_number_;
    std::string line_;
    std::string reason_;

    static std::string make_message(size_t n, const std::string& line,
                                    const std::string& reason) {
        std::string msg = "Parse error";
        if (n > 0) msg += " on line " + std::to_string(n);
        msg += ": " + reason;
        if (!line.empty()) msg += " (\"" + line + "\")";
        return msg;
    }
};

class SchemaError : public ContentError {
public:
    // path is "device/state/field"; shorter for errors above the field level
    SchemaError(const std::string& path, const std::string& reason)
        : ContentError("Schema error at " + (path.empty() ? std::string("<root>") : path) +
                       ": " + reason)
        , path_(path), reason_(reason) {}

    const std::string& path() const { return path_; }
    const std::string& reason() const { return reason_; }

private:
    std::string path_;
    std::string reason_;
};

// Transport-level failure after the session was established
class IOError : public PmpsError {
public:
    IOError(const std::string& host, const std::string& operation,
            const std::string& reason)
        : PmpsError(operation + " on " + host + " failed: " + reason)
        , host_(host), operation_(operation), reason_(reason) {}

    const std::string& host() const { return host_; }
    const std::string& operation() const { return operation_; }
    const std::string& reason() const { return reason_; }

private:
    std::string host_;
    std::string operation_;
    std::string reason_;
};

class ConfigError : public PmpsError {
public:
    ConfigError(const std::string& source, const std::string& reason)
        : PmpsError("Invalid configuration (" + source + "): " + reason)
        , source_(source), reason_(reason) {}

    const std::string& source() const { return source_; }
    const std::string& reason() const { return reason_; }

private:
    std::string source_;
    std::string reason_;
};
