// ============================================================
// curl_transport.cpp -- FTP / SFTP transport on libcurl
// ============================================================

#include "curl_transport.hpp"
#include "listing.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <fnmatch.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>

// ---------------------------------------------------------------
// libcurl callbacks
// ---------------------------------------------------------------

static size_t append_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static size_t discard_cb(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

struct UploadCursor {
    const std::string* data;
    size_t             offset;
};

static size_t read_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* cur = static_cast<UploadCursor*>(userdata);
    size_t want = size * nitems;
    size_t left = cur->data->size() - cur->offset;
    size_t n = std::min(want, left);
    std::memcpy(buffer, cur->data->data() + cur->offset, n);
    cur->offset += n;
    return n;
}

static int progress_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<const std::atomic<bool>*>(userdata);
    return (cancel && cancel->load()) ? 1 : 0;
}

template<typename T>
static void setopt(CURL* easy, CURLoption opt, T value) {
    CURLcode rc = curl_easy_setopt(easy, opt, value);
    if (rc != CURLE_OK) {
        throw std::runtime_error("curl_easy_setopt(" + std::to_string((int)opt) +
                                 ") failed: " + curl_easy_strerror(rc));
    }
}

using SlistPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

static SlistPtr make_slist(const std::vector<std::string>& items) {
    curl_slist* list = nullptr;
    for (const auto& s : items) {
        curl_slist* next = curl_slist_append(list, s.c_str());
        if (!next) {
            curl_slist_free_all(list);
            throw std::runtime_error("curl_slist_append failed");
        }
        list = next;
    }
    return SlistPtr(list, &curl_slist_free_all);
}

// SFTP quote commands take double-quoted paths with backslash escapes
static std::string sftp_quote(const std::string& path) {
    std::string out = "\"";
    for (char c : path) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

// ---------------------------------------------------------------
// CurlTransport
// ---------------------------------------------------------------

CurlTransport::CurlTransport(const TransportProfile& profile,
                             const std::atomic<bool>* cancel)
    : profile_(profile)
    , cancel_(cancel) {}

CurlTransport::~CurlTransport() {
    close();
}

TransportFactory CurlTransport::factory(const TransportProfile& profile,
                                        const std::atomic<bool>* cancel) {
    return [profile, cancel]() -> std::unique_ptr<Transport> {
        return std::make_unique<CurlTransport>(profile, cancel);
    };
}

void CurlTransport::close() {
    if (easy_) {
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
        LOG_DEBUG("CurlTransport: released connection to " + host_);
    }
}

std::string CurlTransport::base_url() const {
    std::string url = std::string(protocol_name(profile_.protocol)) + "://" + host_;
    if (profile_.port != 0) url += ":" + std::to_string(profile_.port);
    return url;
}

std::string CurlTransport::escape_segment(const std::string& segment) const {
    char* esc = curl_easy_escape(easy_, segment.c_str(), (int)segment.size());
    if (!esc) throw std::runtime_error("curl_easy_escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}

std::string CurlTransport::file_url(const std::string& name) const {
    return dir_url() + escape_segment(name);
}

static std::string join_remote(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir == "/") return "/" + name;
    return dir + "/" + name;
}

std::string CurlTransport::remote_path(const std::string& name) const {
    return join_remote(dir_remote_, name);
}

CurlTransport::RemoveCommand CurlTransport::remove_command(TransferProtocol protocol,
                                                           const std::string& directory,
                                                           const std::string& name)
{
    if (protocol == TransferProtocol::FTP) {
        return RemoveCommand{"*DELE " + name, true};
    }
    return RemoveCommand{"*rm " + sftp_quote(join_remote(directory, name)), false};
}

CURLcode CurlTransport::perform(const std::string& url, const OptionSetter& extra,
                                std::string& error_text)
{
    if (!easy_) {
        throw IOError(host_, "request", "not connected");
    }
    // Reset options but keep the live connection in the handle's cache
    curl_easy_reset(easy_);

    char errbuf[CURL_ERROR_SIZE] = {};
    setopt(easy_, CURLOPT_ERRORBUFFER, errbuf);
    setopt(easy_, CURLOPT_URL, url.c_str());
    setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    setopt(easy_, CURLOPT_USERNAME, cred_.username.c_str());
    setopt(easy_, CURLOPT_PASSWORD, cred_.password.c_str());
    if (profile_.port != 0) {
        setopt(easy_, CURLOPT_PORT, (long)profile_.port);
    }
    setopt(easy_, CURLOPT_CONNECTTIMEOUT, (long)profile_.connect_timeout_s);
    // Abort a stalled transfer, not a slow one
    setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    setopt(easy_, CURLOPT_LOW_SPEED_TIME, (long)profile_.transfer_timeout_s);
    setopt(easy_, CURLOPT_TCP_KEEPALIVE, 1L);
    setopt(easy_, CURLOPT_WRITEFUNCTION, discard_cb);

    if (cancel_) {
        setopt(easy_, CURLOPT_NOPROGRESS, 0L);
        setopt(easy_, CURLOPT_XFERINFOFUNCTION, progress_cb);
        setopt(easy_, CURLOPT_XFERINFODATA, (void*)cancel_);
    }

    if (is_ftp()) {
        setopt(easy_, CURLOPT_FTP_FILEMETHOD, (long)CURLFTPMETHOD_SINGLECWD);
        setopt(easy_, CURLOPT_SERVER_RESPONSE_TIMEOUT, (long)profile_.transfer_timeout_s);
    } else {
        setopt(easy_, CURLOPT_SSH_AUTH_TYPES,
               (long)(CURLSSH_AUTH_PASSWORD | CURLSSH_AUTH_KEYBOARD));
        if (!profile_.known_hosts.empty()) {
            setopt(easy_, CURLOPT_SSH_KNOWNHOSTS, profile_.known_hosts.c_str());
        }
    }

    if (extra) extra(easy_);

    CURLcode rc = curl_easy_perform(easy_);
    error_text = utils::trim(errbuf);
    // errbuf lives on this stack frame
    setopt(easy_, CURLOPT_ERRORBUFFER, (char*)nullptr);
    return rc;
}

void CurlTransport::fail(CURLcode rc, const std::string& operation,
                         const std::string& target, const std::string& error_text) const
{
    std::string reason = curl_easy_strerror(rc);
    if (!error_text.empty() && error_text != reason) {
        reason = error_text + " (" + reason + ")";
    }

    switch (rc) {
        case CURLE_REMOTE_FILE_NOT_FOUND:
            throw RemoteNotFoundError(host_, remote_path(target));
        case CURLE_REMOTE_ACCESS_DENIED:
            // FTP reports a failed CWD this way
            if (operation == "cd") throw RemoteNotFoundError(host_, target);
            throw IOError(host_, operation + " " + target, reason);
        case CURLE_ABORTED_BY_CALLBACK:
            throw IOError(host_, operation + " " + target, "cancelled");
        default:
            throw IOError(host_, operation + " " + target, reason);
    }
}

// ---------------------------------------------------------------
// connect
// ---------------------------------------------------------------

void CurlTransport::connect(const std::string& host, const Credential& cred) {
    close();
    host_       = host;
    cred_       = cred;
    dir_path_   = "/";
    dir_remote_ = "";

    easy_ = curl_easy_init();
    if (!easy_) {
        throw AuthenticationError(host, cred.username, "curl_easy_init failed");
    }

    // A body-less request at the server root logs in and nothing else
    std::string err;
    CURLcode rc = perform(base_url() + "/", [](CURL* c) {
        setopt(c, CURLOPT_NOBODY, 1L);
    }, err);

    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        close();
        throw IOError(host, "connect", "cancelled");
    }
    if (rc != CURLE_OK) {
        std::string reason = curl_easy_strerror(rc);
        if (!err.empty() && err != reason) reason = err + " (" + reason + ")";
        close();
        throw AuthenticationError(host, cred.username, reason);
    }
    LOG_DEBUG("CurlTransport: logged in to " + base_url() + " as " + cred.username);
}

// ---------------------------------------------------------------
// change_directory
// ---------------------------------------------------------------

void CurlTransport::change_directory(const std::string& directory, bool create) {
    bool absolute = !directory.empty() && directory[0] == '/';

    std::string path = "/";
    if (is_ftp()) {
        // FTP URL paths are relative to the login directory
        if (absolute) path += "%2F";
    } else {
        // SFTP URL paths are absolute; "~/" is the login directory
        if (!absolute) path += "~/";
    }
    std::string remote = absolute ? "/" : "";
    size_t start = 0;
    bool first = true;
    while (start <= directory.size()) {
        size_t slash = directory.find('/', start);
        std::string seg = directory.substr(start, slash == std::string::npos
                                                  ? std::string::npos : slash - start);
        if (!seg.empty()) {
            path += escape_segment(seg) + "/";
            if (!first) remote += "/";
            remote += seg;
            first = false;
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    dir_path_   = path;
    dir_remote_ = remote;

    bool ftp = is_ftp();
    bool ftp_create = ftp && create;
    std::string err;
    // SFTP skips the readdir under NOBODY, so it lists (and discards) instead
    CURLcode rc = perform(dir_url(), [ftp, ftp_create](CURL* c) {
        if (ftp) setopt(c, CURLOPT_NOBODY, 1L);
        if (ftp_create) {
            // Walk the path one CWD at a time so each missing level gets a MKD
            setopt(c, CURLOPT_FTP_FILEMETHOD, (long)CURLFTPMETHOD_MULTICWD);
            setopt(c, CURLOPT_FTP_CREATE_MISSING_DIRS, (long)CURLFTP_CREATE_DIR_RETRY);
        }
    }, err);

    if (rc == CURLE_REMOTE_FILE_NOT_FOUND && create && !is_ftp()) {
        LOG_INFO("CurlTransport: creating " + dir_remote_ + " on " + host_);
        SlistPtr quote = make_slist({"mkdir " + sftp_quote(dir_remote_)});
        rc = perform(base_url() + "/", [&quote](CURL* c) {
            setopt(c, CURLOPT_NOBODY, 1L);
            setopt(c, CURLOPT_QUOTE, quote.get());
        }, err);
        if (rc == CURLE_OK) {
            rc = perform(dir_url(), nullptr, err);
        }
    }

    if (rc != CURLE_OK) {
        fail(rc, "cd", directory, err);
    }
}

// ---------------------------------------------------------------
// list
// ---------------------------------------------------------------

std::string CurlTransport::list(const std::string& pattern) {
    std::string out;
    std::string err;
    std::string command;
    if (is_ftp()) {
        command = profile_.list_command.empty() ? std::string("LIST") : profile_.list_command;
        if (!pattern.empty()) command += " " + pattern;
    }

    CURLcode rc = perform(dir_url(), [&](CURL* c) {
        setopt(c, CURLOPT_WRITEFUNCTION, append_cb);
        setopt(c, CURLOPT_WRITEDATA, (void*)&out);
        if (!command.empty()) {
            setopt(c, CURLOPT_CUSTOMREQUEST, command.c_str());
        }
    }, err);
    if (rc != CURLE_OK) {
        fail(rc, "list", dir_remote_, err);
    }

    if (is_ftp()) return out;

    // SFTP: the server cannot filter, and reports "." and ".."
    std::string filtered;
    for (const std::string& line : utils::split_lines(out)) {
        std::string name = listing::entry_name(line, profile_.listing_dialect);
        if (name == "." || name == "..") continue;
        if (!pattern.empty() && !name.empty() &&
            fnmatch(pattern.c_str(), name.c_str(), 0) != 0) continue;
        filtered += line + "\n";
    }
    return filtered;
}

// ---------------------------------------------------------------
// put: upload under a temporary name, rename when complete
// ---------------------------------------------------------------

void CurlTransport::put(const std::string& local_path, const std::string& remote_name) {
    std::string data = file_io::read_file(local_path);
    std::string tmp_name = "." + remote_name + ".part";

    SlistPtr post = is_ftp()
        ? make_slist({"RNFR " + tmp_name, "RNTO " + remote_name})
        : make_slist({"*rm " + sftp_quote(remote_path(remote_name)),
                      "rename " + sftp_quote(remote_path(tmp_name)) + " " +
                                  sftp_quote(remote_path(remote_name))});

    UploadCursor cursor{&data, 0};
    std::string err;
    CURLcode rc = perform(file_url(tmp_name), [&](CURL* c) {
        setopt(c, CURLOPT_UPLOAD, 1L);
        setopt(c, CURLOPT_READFUNCTION, read_cb);
        setopt(c, CURLOPT_READDATA, (void*)&cursor);
        setopt(c, CURLOPT_INFILESIZE_LARGE, (curl_off_t)data.size());
        setopt(c, CURLOPT_POSTQUOTE, post.get());
    }, err);

    if (rc != CURLE_OK) {
        remove_quietly(tmp_name);
        fail(rc, "upload", remote_name, err);
    }
    LOG_DEBUG("CurlTransport: uploaded " + std::to_string(data.size()) + " bytes to " +
              host_ + ":" + remote_path(remote_name));
}

void CurlTransport::remove_quietly(const std::string& name) {
    // A reused FTP connection may still sit in the working directory
    RemoveCommand cmd = remove_command(profile_.protocol, dir_remote_, name);
    std::string err;
    CURLcode rc = CURLE_OK;
    try {
        SlistPtr quote = make_slist({cmd.command});
        bool post = cmd.after_cwd;
        rc = perform(post ? dir_url() : base_url() + "/", [&quote, post](CURL* c) {
            setopt(c, CURLOPT_NOBODY, 1L);
            setopt(c, post ? CURLOPT_POSTQUOTE : CURLOPT_QUOTE, quote.get());
        }, err);
    } catch (const std::exception& e) {
        LOG_WARN("CurlTransport: cleanup of " + name + " on " + host_ + " failed: " + e.what());
        return;
    }
    if (rc != CURLE_OK) {
        LOG_WARN("CurlTransport: cleanup of " + name + " on " + host_ + " failed: " +
                 (err.empty() ? std::string(curl_easy_strerror(rc)) : err));
    }
}

// ---------------------------------------------------------------
// get
// ---------------------------------------------------------------

std::string CurlTransport::get(const std::string& remote_name) {
    std::string out;
    std::string err;
    CURLcode rc = perform(file_url(remote_name), [&out](CURL* c) {
        setopt(c, CURLOPT_WRITEFUNCTION, append_cb);
        setopt(c, CURLOPT_WRITEDATA, (void*)&out);
    }, err);
    if (rc != CURLE_OK) {
        fail(rc, "download", remote_name, err);
    }
    return out;
}
