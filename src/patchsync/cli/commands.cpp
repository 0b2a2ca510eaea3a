// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/cli/commands.hpp>
#include <patchsync/cli/progress_bar.hpp>
#include <patchsync/core/http_session.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/core/manifest.hpp>
#include <patchsync/core/sync_engine.hpp>
#include <patchsync/disk/error.hpp>
#include <patchsync/version.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

using namespace patchsync::core;

namespace patchsync::cli {

namespace {

bool parse_number(const char* text, std::uint64_t& out) noexcept {
    char* end = nullptr;
    errno = 0;
    auto value = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || text[0] == '-') {
        return false;
    }
    out = value;
    return true;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> const char* {
        if (i + 1 >= argc) {
            args.error = std::string(option) + " needs a value";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value_of(i, arg)) args.config_path = v;
        } else if (arg == "-t" || arg == "--target") {
            if (auto v = value_of(i, arg)) args.target_folder = v;
        } else if (arg == "-l" || arg == "--limit") {
            if (auto v = value_of(i, arg)) {
                std::uint64_t kbs = 0;
                if (!parse_number(v, kbs)) {
                    args.error = "invalid speed limit: " + std::string(v);
                } else {
                    args.speed_limit_kbs = kbs;
                }
            }
        } else if (arg == "-j" || arg == "--jobs") {
            if (auto v = value_of(i, arg)) {
                std::uint64_t jobs = 0;
                if (!parse_number(v, jobs) || jobs == 0 || jobs > std::numeric_limits<std::uint32_t>::max()) {
                    args.error = "invalid worker count: " + std::string(v);
                } else {
                    args.workers = static_cast<std::uint32_t>(jobs);
                }
            }
        } else if (arg == "--delete") {
            args.delete_extraneous = true;
        } else if (arg == "--log") {
            if (auto v = value_of(i, arg)) args.log_file = v;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value_of(i, arg)) args.output_file = v;
        } else if (args.command == Command::none && arg == "sync") {
            args.command = Command::sync;
        } else if (args.command == Command::none && arg == "generate") {
            args.command = Command::generate;
        } else if (args.command == Command::generate && args.folder.empty() && !arg.starts_with("-")) {
            args.folder = arg;
        } else {
            args.error = "unexpected argument: " + arg;
        }
    }

    if (args.error.empty()) {
        if (args.command == Command::sync && args.config_path.empty()) {
            args.error = "sync needs -c <config.json>";
        } else if (args.command == Command::generate && args.folder.empty()) {
            args.error = "generate needs a folder";
        }
    }
    return args;
}

void apply_overrides(const CliArgs& args, SyncConfig& config) {
    if (!args.target_folder.empty()) config.target_folder = args.target_folder;
    if (args.speed_limit_kbs) config.download_speed_limit_kbs = *args.speed_limit_kbs;
    if (args.workers) config.worker_count = *args.workers;
    if (args.delete_extraneous) config.delete_extraneous = true;
    if (!args.log_file.empty()) config.log_file = args.log_file;
    if (args.verbose) config.log_level = "debug";
}

//=============================================================================
// Commands
//=============================================================================

CliResult sync(const CliArgs& args, std::stop_token stop) {
    auto config = load_config(args.config_path);
    if (!config) {
        std::cerr << "Error: cannot load " << args.config_path << ": " << config.error().message() << std::endl;
        return std::unexpected(config.error());
    }
    apply_overrides(args, *config);
    if (auto ec = config->validate()) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    if (auto ec = init_logging(config->log_file, config->log_level, !args.quiet)) {
        std::cerr << "Warning: cannot open log file: " << ec.message() << std::endl;
    }

    HttpSession::global_init();

    HttpOptions http_options;
    http_options.connect_timeout_sec = config->connect_timeout_sec;
    http_options.stall_timeout_sec = config->stall_timeout_sec;
    http_options.user_agent = std::string(USER_AGENT);
    HttpSession session(http_options);

    SyncEngine engine(*config, session);

    ProgressBar bar("Syncing");
    ProgressCallback callback;
    if (!args.quiet) {
        callback = [&](const SyncProgress& p) {
            bar.update(p.completed_bytes, p.total_bytes, p.completed_files, p.total_files, p.path);
        };
    }

    auto report = engine.run(callback, stop);
    if (!args.quiet) bar.finish();

    HttpSession::global_cleanup();

    if (!report) {
        std::cerr << "Error: " << report.error().message() << std::endl;
        return std::unexpected(report.error());
    }

    std::cout << report->to_json() << std::endl;

    if (report->cancelled) {
        std::cerr << "Sync cancelled" << std::endl;
    }
    if (args.verbose) {
        for (const auto& [path, reason] : report->errors) {
            std::cerr << "  " << path << ": " << reason << std::endl;
        }
    }
    return report->ok() ? EXIT_SYNC_OK : EXIT_FILES_FAILED;
}

CliResult generate(const std::string& folder, const std::string& output) {
    auto text = generate_manifest(folder);
    if (!text) {
        std::cerr << "Error: cannot list " << folder << ": " << text.error().message() << std::endl;
        return std::unexpected(text.error());
    }

    if (output.empty()) {
        std::cout << *text << std::flush;
        return EXIT_SYNC_OK;
    }

    std::ofstream file(output, std::ios::binary | std::ios::trunc);
    if (!file) {
        std::cerr << "Error: cannot write " << output << std::endl;
        return std::unexpected(make_error_code(disk::DiskErrc::access_denied));
    }
    file << *text;
    file.flush();
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::write_error));
    }
    std::cout << "File list written to " << output << std::endl;
    return EXIT_SYNC_OK;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "patchsync " << program_name << " - keep a folder in sync with a remote file list\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " sync -c <config.json> [OPTIONS]\n";
    std::cout << "  " << program_name << " generate <folder> [-o <file>]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -c, --config <FILE>     Configuration file (JSON)\n";
    std::cout << "  -t, --target <DIR>      Override the target folder\n";
    std::cout << "  -l, --limit <KB/s>      Download speed limit, 0 = unlimited\n";
    std::cout << "  -j, --jobs <N>          Files downloaded at once\n";
    std::cout << "      --delete            Delete local files missing from the file list\n";
    std::cout << "      --log <FILE>        Also write the log to FILE\n";
    std::cout << "  -o, --output <FILE>     Where generate writes the file list\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             No progress bar or console log\n";
    std::cout << "\n";
    std::cout << "EXIT STATUS:\n";
    std::cout << "  0 all files in sync, 1 some files failed or cancelled, 2 run error\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " sync -c patch.json\n";
    std::cout << "  " << program_name << " sync -c patch.json -l 512 -j 2\n";
    std::cout << "  " << program_name << " generate ./release -o filelist.txt\n";
}

void print_version() noexcept {
    std::cout << "patchsync " << patchsync::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, OpenSSL, spdlog\n";
}

} // namespace patchsync::cli
