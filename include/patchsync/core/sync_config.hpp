// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/config.hpp>
#include <patchsync/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace patchsync::core {

// Everything one run needs
struct SyncConfig {
    std::string server_base_url;                 // Must end with '/'
    std::filesystem::path target_folder;
    std::string file_list_url;
    std::uint64_t download_speed_limit_kbs{0};   // 0 = unlimited
    std::uint64_t multithreading_threshold_bytes{DEFAULT_MULTITHREADING_THRESHOLD};
    std::uint64_t progress_max_age_sec{DEFAULT_PROGRESS_MAX_AGE_SEC};

    std::uint32_t worker_count{DEFAULT_WORKER_COUNT};
    std::uint32_t range_workers{DEFAULT_RANGE_WORKERS};
    std::uint32_t retry_count{RETRY_COUNT};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    bool delete_extraneous{false};
    bool strict_manifest{false};
    bool probe_remote_sizes{true};

    std::optional<std::filesystem::path> log_file;
    std::string log_level{"info"};

    // invalid_config if a field is missing or out of range
    [[nodiscard]] std::error_code validate() const;
};

// Parse a JSON configuration document (camelCase keys)
[[nodiscard]] std::expected<SyncConfig, std::error_code> parse_config(std::string_view json);

// Read and parse a configuration file
[[nodiscard]] std::expected<SyncConfig, std::error_code> load_config(const std::filesystem::path& path);

} // namespace patchsync::core
