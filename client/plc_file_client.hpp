#pragma once

// ============================================================
// plc_file_client.hpp -- File operations on PLC hosts
// ============================================================

#include "../common/platform.hpp"
#include "../model/comparator.hpp"
#include "../model/file_contents.hpp"
#include "../transport/listing.hpp"
#include "../transport/profile.hpp"
#include "../transport/session.hpp"
#include "../transport/transport.hpp"
#include <map>
#include <string>
#include <vector>

// Outcome of refreshing one host in survey()
struct SurveyResult {
    bool                    ok{false};
    std::vector<RemoteFile> files;
    std::string             error;
};

// Each call opens its own Session and releases it before returning;
// nothing is shared between calls, so one client may serve many threads.
// An empty directory argument means the profile's directory.
class PlcFileClient {
public:
    // factory defaults to CurlTransport for the profile
    explicit PlcFileClient(TransportProfile profile, TransportFactory factory = nullptr);

    std::vector<RemoteFile> list_file_info(const std::string& host,
                                           const std::string& directory = "") const;

    // dest_name defaults to the local file's base name.
    // LocalNotFoundError is thrown before any connection is made.
    void upload(const std::string& host, const std::string& local_path,
                const std::string& dest_name = "", const std::string& directory = "") const;

    std::string download_text(const std::string& host, const std::string& remote_name,
                              const std::string& directory = "") const;

    // Transport failures keep their PmpsError types; a corrupt file
    // surfaces as ContentError (ParseError / SchemaError).
    FileContents download_json(const std::string& host, const std::string& remote_name,
                               const std::string& directory = "") const;

    // Byte-exact: true iff the PLC copy named like local_path has the same bytes
    bool compare(const std::string& host, const std::string& local_path,
                 const std::string& directory = "") const;

    // Structural: a = local file, b = PLC copy
    Diff compare_contents(const std::string& host, const std::string& local_path,
                          const std::string& directory = "") const;

    // list_file_info on several hosts at once, at most max_parallel in flight.
    // Failures are recorded per host instead of thrown.
    std::map<std::string, SurveyResult> survey(const std::vector<std::string>& hosts,
                                               size_t max_parallel = 4,
                                               const std::string& directory = "") const;

    const TransportProfile& profile() const { return profile_; }

private:
    Session open(const std::string& host, const std::string& directory) const;

    TransportProfile profile_;
    TransportFactory factory_;
};
