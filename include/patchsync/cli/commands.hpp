// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/sync_config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>

namespace patchsync::cli {

// CLI result: process exit code, or a run-level error
using CliResult = std::expected<int, std::error_code>;

constexpr int EXIT_SYNC_OK = 0;
constexpr int EXIT_FILES_FAILED = 1;     // Some files failed or the run was cancelled
constexpr int EXIT_RUN_ERROR = 2;        // Bad arguments, config or manifest

enum class Command : std::uint8_t {
    none,
    sync,
    generate,
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};

    // sync
    std::string config_path;
    std::string target_folder;
    std::optional<std::uint64_t> speed_limit_kbs;
    std::optional<std::uint32_t> workers;
    bool delete_extraneous{false};
    std::string log_file;

    // generate
    std::string folder;
    std::string output_file;

    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};

    std::string error;   // Set when the arguments do not parse
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Apply -t/-l/-j/--delete/--log on top of a loaded configuration
void apply_overrides(const CliArgs& args, core::SyncConfig& config);

// Run one synchronization and print the status report
[[nodiscard]] CliResult sync(const CliArgs& args, std::stop_token stop);

// Print (or write to output) a file list for every file under folder
[[nodiscard]] CliResult generate(const std::string& folder, const std::string& output);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace patchsync::cli
