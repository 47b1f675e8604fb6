// ============================================================
// client/main.cpp -- pmpsdb command-line entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../transport/curl_transport.hpp"
#include "config.hpp"
#include "plc_file_client.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static std::atomic<bool> g_cancel{false};

static void sig_handler(int /*sig*/) {
    g_cancel.store(true);
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <hostname>... [options]\n"
        << "\n"
        << "  hostname             PLC to connect to (several allowed with --list)\n"
        << "\nOperations:\n"
        << "  --list, -l           list the PMPS database files on each PLC\n"
        << "  --download, -d NAME  print PLC file NAME to stdout\n"
        << "  --output, -o FILE    with --download, write to FILE instead of stdout\n"
        << "  --upload, -u PATH    upload local file PATH to the PLC\n"
        << "  --as NAME            with --upload, store the file as NAME\n"
        << "  --compare, -c PATH   byte-compare local PATH with the PLC copy\n"
        << "  --diff PATH          compare the contents of local PATH with the PLC copy\n"
        << "\nOptions:\n"
        << "  --protocol ftp|sftp  transfer protocol (default: sftp)\n"
        << "  --config FILE        JSON configuration with transfer profiles\n"
        << "  --profile NAME       profile to use from the configuration\n"
        << "  --dir DIR            remote directory (default: from the profile)\n"
        << "  --export-dir, -e DIR directory holding database exports; bare file\n"
        << "                       names given to --upload/--compare/--diff are looked up here\n"
        << "  --parallel N         hosts listed at once with --list (default: 4)\n"
        << "  --log-file FILE      also append log lines to FILE\n"
        << "  --verbose, -v        enable debug logging\n"
        << "  --version            print the version and exit\n"
        << "\nExit status: 0 success, 1 failure or differences found, 2 usage error.\n"
        << "\nExamples:\n"
        << "  " << prog << " plc-tst-01 --list\n"
        << "  " << prog << " plc-tst-01 plc-tst-02 --list --protocol ftp\n"
        << "  " << prog << " plc-tst-01 --download plc-tst-01.json -o /tmp/plc-tst-01.json\n"
        << "  " << prog << " plc-tst-01 --upload exports/plc-tst-01.json\n"
        << "  " << prog << " plc-tst-01 -e exports --diff plc-tst-01.json\n";
}

static void print_listing(const std::string& host, const std::vector<RemoteFile>& files,
                          bool with_header) {
    if (with_header) std::cout << host << ":\n";
    for (const RemoteFile& f : listing::files_only(files)) {
        std::cout << (with_header ? "  " : "")
                  << '-' << f.permissions << " "
                  << std::setw(3) << f.link_count << " "
                  << std::left << std::setw(14) << f.owner << " "
                  << std::setw(8) << f.group << std::right << " "
                  << std::setw(10) << f.size_bytes << " "
                  << utils::format_time(f.last_changed) << " "
                  << f.filename << "\n";
    }
}

struct CliOptions {
    std::vector<std::string> hosts;
    bool        list{false};
    std::string download;
    std::string output;
    std::string upload;
    std::string upload_as;
    std::string compare;
    std::string diff;
    std::string protocol;
    std::string config_file;
    std::string profile;
    std::string directory;
    std::string export_dir;
    std::string log_file;
    int         parallel{4};
    bool        verbose{false};
};

// Bare names resolve inside the export directory
static std::string local_path(const CliOptions& opt, const std::string& path) {
    if (opt.export_dir.empty() || path.find_first_of("/\\") != std::string::npos) return path;
    return opt.export_dir + "/" + path;
}

static int run(const CliOptions& opt, const TransportProfile& profile) {
    PlcFileClient client(profile, CurlTransport::factory(profile, &g_cancel));
    const std::string& host = opt.hosts.front();
    int rc = 0;

    if (opt.list) {
        auto results = client.survey(opt.hosts, (size_t)opt.parallel, opt.directory);
        bool many = opt.hosts.size() > 1;
        for (const std::string& h : opt.hosts) {
            const SurveyResult& r = results[h];
            if (r.ok) {
                print_listing(h, r.files, many);
            } else {
                std::cerr << "ERROR: " << h << ": " << r.error << "\n";
                rc = 1;
            }
        }
    }

    if (!opt.download.empty()) {
        std::string text = client.download_text(host, opt.download, opt.directory);
        if (opt.output.empty()) {
            std::cout << text;
            if (!text.empty() && text.back() != '\n') std::cout << "\n";
        } else {
            file_io::write_file_atomic(opt.output, text);
            LOG_INFO("Saved " + host + ":" + opt.download + " to " + opt.output);
        }
    }

    if (!opt.upload.empty()) {
        std::string path = local_path(opt, opt.upload);
        LOG_INFO("Uploading " + path);
        client.upload(host, path, opt.upload_as, opt.directory);
    }

    if (!opt.compare.empty()) {
        std::string path = local_path(opt, opt.compare);
        bool same = client.compare(host, path, opt.directory);
        if (same) {
            LOG_INFO("Local file " + path + " matches the copy on " + host);
        } else {
            LOG_ERROR("Local file " + path + " differs from the copy on " + host);
            rc = 1;
        }
    }

    if (!opt.diff.empty()) {
        std::string path = local_path(opt, opt.diff);
        Diff d = client.compare_contents(host, path, opt.directory);
        if (d.empty()) {
            LOG_INFO("Contents of " + path + " match the copy on " + host);
        } else {
            std::cout << "a = " << path << "\nb = " << host << ":" << utils::base_name(path) << "\n"
                      << model::format_diff(d);
            LOG_ERROR(std::to_string(d.difference_count()) + " difference(s) between " + path +
                      " and the copy on " + host);
            rc = 1;
        }
    }
    return rc;
}

int main(int argc, char* argv[]) {
    CliOptions opt;

    auto need_value = [&](int& i) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << argv[i] << "\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        const char* v = nullptr;
        if (std::strcmp(a, "--list") == 0 || std::strcmp(a, "-l") == 0) {
            opt.list = true;
        } else if (std::strcmp(a, "--download") == 0 || std::strcmp(a, "-d") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.download = v;
        } else if (std::strcmp(a, "--output") == 0 || std::strcmp(a, "-o") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.output = v;
        } else if (std::strcmp(a, "--upload") == 0 || std::strcmp(a, "-u") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.upload = v;
        } else if (std::strcmp(a, "--as") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.upload_as = v;
        } else if (std::strcmp(a, "--compare") == 0 || std::strcmp(a, "-c") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.compare = v;
        } else if (std::strcmp(a, "--diff") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.diff = v;
        } else if (std::strcmp(a, "--protocol") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.protocol = v;
        } else if (std::strcmp(a, "--config") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.config_file = v;
        } else if (std::strcmp(a, "--profile") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.profile = v;
        } else if (std::strcmp(a, "--dir") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.directory = v;
        } else if (std::strcmp(a, "--export-dir") == 0 || std::strcmp(a, "-e") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.export_dir = v;
        } else if (std::strcmp(a, "--parallel") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.parallel = std::atoi(v);
            if (opt.parallel < 1) {
                std::cerr << "ERROR: --parallel must be at least 1\n";
                return 2;
            }
        } else if (std::strcmp(a, "--log-file") == 0) {
            if (!(v = need_value(i))) return 2;
            opt.log_file = v;
        } else if (std::strcmp(a, "--verbose") == 0 || std::strcmp(a, "-v") == 0) {
            opt.verbose = true;
        } else if (std::strcmp(a, "--version") == 0) {
            std::cout << "pmpsdb " << PMPSDB_VERSION << "\n";
            return 0;
        } else if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (a[0] == '-') {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return 2;
        } else {
            opt.hosts.push_back(a);
        }
    }

    bool single_ops = !opt.download.empty() || !opt.upload.empty() ||
                      !opt.compare.empty() || !opt.diff.empty();
    if (opt.hosts.empty() || (!opt.list && !single_ops)) {
        print_usage(argv[0]);
        return 2;
    }
    if (single_ops && opt.hosts.size() != 1) {
        std::cerr << "ERROR: --download/--upload/--compare/--diff take exactly one hostname\n";
        return 2;
    }
    if (!opt.output.empty() && opt.download.empty()) {
        std::cerr << "ERROR: --output requires --download\n";
        return 2;
    }
    if (!opt.upload_as.empty() && opt.upload.empty()) {
        std::cerr << "ERROR: --as requires --upload\n";
        return 2;
    }
    for (const std::string& h : opt.hosts) {
        if (!utils::validate_hostname(h)) {
            std::cerr << "ERROR: Invalid hostname: " << h << "\n";
            return 2;
        }
    }

    Logger::get().set_level(opt.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    if (!opt.log_file.empty() && !Logger::get().set_log_file(opt.log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << opt.log_file << "\n";
        return 2;
    }
    // Keep stdout clean for file contents
    if (!opt.download.empty() && opt.output.empty()) {
        Logger::get().set_quiet(true);
    }

    TransportProfile profile;
    try {
        PmpsConfig cfg = opt.config_file.empty() ? config::builtin_config()
                                                 : config::load_config(opt.config_file);
        std::string name = opt.profile;
        if (name.empty() && !opt.protocol.empty()) {
            name = protocol_name(config::parse_protocol(opt.protocol, "--protocol"));
        }
        profile = config::select_profile(cfg, name);
    } catch (const ConfigError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }
    if (!opt.directory.empty() && !utils::validate_path(opt.directory)) {
        std::cerr << "ERROR: Invalid directory\n";
        return 2;
    }

    try {
        platform::Guard platform_guard;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        LOG_DEBUG("Using profile " + profile.name + " (" + protocol_name(profile.protocol) +
                  ", directory " + profile.directory + ")");
        return run(opt, profile);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
