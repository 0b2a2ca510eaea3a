// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/progress_store.hpp>
#include <patchsync/core/scheduler.hpp>
#include <patchsync/core/status_report.hpp>
#include <patchsync/core/sync_config.hpp>
#include <patchsync/core/transport.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <stop_token>

namespace patchsync::core {

// Knobs tests turn; production runs use the defaults
struct EngineHooks {
    std::shared_ptr<KeyValueBackend> progress_backend;   // Default: FileBackend under the target
    UnixClock clock;                                     // Default: system clock
    std::chrono::milliseconds backoff_initial{RETRY_BACKOFF_INITIAL};
    std::chrono::milliseconds backoff_max{RETRY_BACKOFF_MAX};
    std::uint64_t checkpoint_bytes{PROGRESS_CHECKPOINT_BYTES};
};

// One synchronization run: fetch manifest, scan, diff, download, verify, report
class SyncEngine {
public:
    SyncEngine(SyncConfig config, Transport& transport, EngineHooks hooks = {});

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // A report is returned even when files fail. Errors are run-level only:
    // invalid_config, manifest_unavailable, malformed_manifest (strict mode).
    [[nodiscard]] std::expected<StatusReport, std::error_code>
    run(const ProgressCallback& callback = {}, std::stop_token stop = {});

    [[nodiscard]] const SyncConfig& config() const noexcept { return config_; }

    // <target>/.patchsync/progress
    [[nodiscard]] static std::filesystem::path progress_directory(const std::filesystem::path& target);

private:
    SyncConfig config_;
    Transport& transport_;
    EngineHooks hooks_;
};

} // namespace patchsync::core
