#pragma once

// ============================================================
// curl_transport.hpp -- FTP / SFTP transport on libcurl
// ============================================================

#include "../common/platform.hpp"
#include "transport.hpp"
#include <curl/curl.h>
#include <atomic>
#include <functional>
#include <string>
#include <vector>

class CurlTransport : public Transport {
public:
    // cancel, when set, aborts the in-flight request as soon as it turns true
    explicit CurlTransport(const TransportProfile& profile,
                           const std::atomic<bool>* cancel = nullptr);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    void connect(const std::string& host, const Credential& cred) override;
    void change_directory(const std::string& directory, bool create) override;
    std::string list(const std::string& pattern) override;
    void put(const std::string& local_path, const std::string& remote_name) override;
    std::string get(const std::string& remote_name) override;
    void close() override;

    ListingDialect listing_dialect() const override { return profile_.listing_dialect; }

    // Factory bound to one profile, for Session::open
    static TransportFactory factory(const TransportProfile& profile,
                                    const std::atomic<bool>* cancel = nullptr);

    // Command deleting name from directory. FTP sends the bare name as a
    // POSTQUOTE on the directory URL (after libcurl's CWD); SFTP sends the
    // full path as a QUOTE.
    struct RemoveCommand {
        std::string command;
        bool        after_cwd;
    };
    static RemoveCommand remove_command(TransferProtocol protocol,
                                        const std::string& directory,
                                        const std::string& name);

private:
    using OptionSetter = std::function<void(CURL*)>;

    TransportProfile profile_;
    const std::atomic<bool>* cancel_{nullptr};
    CURL*            easy_{nullptr};
    std::string      host_;
    Credential       cred_;
    std::string      dir_path_;   // URL path of the working directory, ends with '/'
    std::string      dir_remote_; // same directory as a server-side path

    bool is_ftp() const { return profile_.protocol == TransferProtocol::FTP; }

    std::string base_url() const;
    std::string dir_url() const { return base_url() + dir_path_; }
    std::string file_url(const std::string& name) const;
    std::string escape_segment(const std::string& segment) const;
    std::string remote_path(const std::string& name) const;

    // Run one request. extra sets request-specific options after the
    // common ones. Returns the CURLcode; error_text gets curl's detail.
    CURLcode perform(const std::string& url, const OptionSetter& extra,
                     std::string& error_text);

    // Map a failed CURLcode to the error taxonomy and throw
    [[noreturn]] void fail(CURLcode rc, const std::string& operation,
                           const std::string& target, const std::string& error_text) const;

    void remove_quietly(const std::string& name);
};
