// ============================================================
// plc_file_client.cpp -- File operations on PLC hosts
// ============================================================

#include "plc_file_client.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include "../common/utils.hpp"
#include "../transport/curl_transport.hpp"
#include <algorithm>
#include <future>
#include <utility>

PlcFileClient::PlcFileClient(TransportProfile profile, TransportFactory factory)
    : profile_(std::move(profile))
    , factory_(std::move(factory))
{
    if (!factory_) factory_ = CurlTransport::factory(profile_);
}

Session PlcFileClient::open(const std::string& host, const std::string& directory) const {
    return Session::open(profile_, factory_, host, directory);
}

std::vector<RemoteFile> PlcFileClient::list_file_info(const std::string& host,
                                                      const std::string& directory) const
{
    LOG_DEBUG("list_file_info(" + host + ", " + directory + ")");
    std::string text;
    std::string dir;
    ListingDialect dialect = ListingDialect::EPOCH_SECONDS;
    {
        Session s = open(host, directory);
        text    = s.list();
        dir     = s.directory();
        dialect = s.listing_dialect();
    }
    return listing::parse(text, dir, dialect);
}

void PlcFileClient::upload(const std::string& host, const std::string& local_path,
                           const std::string& dest_name, const std::string& directory) const
{
    LOG_DEBUG("upload(" + host + ", " + local_path + ", " + dest_name + ", " + directory + ")");
    if (!file_io::is_regular_file(local_path)) {
        throw LocalNotFoundError(local_path);
    }
    std::string name = dest_name.empty() ? utils::base_name(local_path) : dest_name;

    Session s = open(host, directory);
    s.put(local_path, name);
    LOG_INFO("Uploaded " + local_path + " to " + host + ":" + s.directory() + "/" + name +
             " (" + utils::format_bytes(file_io::get_file_size(local_path)) + ")");
}

std::string PlcFileClient::download_text(const std::string& host, const std::string& remote_name,
                                         const std::string& directory) const
{
    LOG_DEBUG("download_text(" + host + ", " + remote_name + ", " + directory + ")");
    Session s = open(host, directory);
    std::string data = s.get(remote_name);
    LOG_DEBUG("Downloaded " + utils::format_bytes(data.size()) + " from " + host + ":" +
              remote_name + " xxh3=" + hash::to_hex(hash::xxh3_64(data)));
    return data;
}

FileContents PlcFileClient::download_json(const std::string& host, const std::string& remote_name,
                                          const std::string& directory) const
{
    LOG_DEBUG("download_json(" + host + ", " + remote_name + ", " + directory + ")");
    return model::parse_file_contents(download_text(host, remote_name, directory));
}

bool PlcFileClient::compare(const std::string& host, const std::string& local_path,
                            const std::string& directory) const
{
    LOG_DEBUG("compare(" + host + ", " + local_path + ", " + directory + ")");
    std::string local  = file_io::read_file(local_path);
    std::string remote = download_text(host, utils::base_name(local_path), directory);

    u64 lh = hash::xxh3_64(local);
    u64 rh = hash::xxh3_64(remote);
    LOG_DEBUG("compare: local xxh3=" + hash::to_hex(lh) + " remote xxh3=" + hash::to_hex(rh));
    return lh == rh && local == remote;
}

Diff PlcFileClient::compare_contents(const std::string& host, const std::string& local_path,
                                     const std::string& directory) const
{
    LOG_DEBUG("compare_contents(" + host + ", " + local_path + ", " + directory + ")");
    FileContents local  = model::parse_file_contents(file_io::read_file(local_path));
    FileContents remote = download_json(host, utils::base_name(local_path), directory);
    return model::compare_contents(local, remote);
}

std::map<std::string, SurveyResult> PlcFileClient::survey(const std::vector<std::string>& hosts,
                                                          size_t max_parallel,
                                                          const std::string& directory) const
{
    std::map<std::string, SurveyResult> results;
    if (hosts.empty()) return results;

    ThreadPool pool(std::min(std::max<size_t>(max_parallel, 1), hosts.size()));
    std::vector<std::pair<std::string, std::future<SurveyResult>>> pending;
    for (const std::string& host : hosts) {
        if (results.count(host)) continue;
        results[host];
        pending.emplace_back(host, pool.submit([this, host, &directory]() {
            LogContext ctx(host);
            SurveyResult r;
            try {
                r.files = list_file_info(host, directory);
                r.ok = true;
            } catch (const std::exception& e) {
                LOG_WARN(std::string("survey failed: ") + e.what());
                r.error = e.what();
            }
            return r;
        }));
    }
    for (auto& p : pending) {
        results[p.first] = p.second.get();
    }
    return results;
}
