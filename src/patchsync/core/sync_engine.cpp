// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/sync_engine.hpp>
#include <patchsync/core/bandwidth_limiter.hpp>
#include <patchsync/core/chunked_downloader.hpp>
#include <patchsync/core/diff_engine.hpp>
#include <patchsync/core/integrity_verifier.hpp>
#include <patchsync/core/local_state.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/core/manifest.hpp>
#include <patchsync/core/url.hpp>
#include <patchsync/disk/error.hpp>

namespace patchsync::core {

namespace fs = std::filesystem;

SyncEngine::SyncEngine(SyncConfig config, Transport& transport, EngineHooks hooks)
    : config_(std::move(config))
    , transport_(transport)
    , hooks_(std::move(hooks)) {}

fs::path SyncEngine::progress_directory(const fs::path& target) {
    return target / STATE_DIR_NAME / "progress";
}

std::expected<StatusReport, std::error_code>
SyncEngine::run(const ProgressCallback& callback, std::stop_token stop) {
    if (auto ec = config_.validate()) {
        return std::unexpected(ec);
    }
    auto base_url = Url::parse(config_.server_base_url);
    if (!base_url) {
        return std::unexpected(base_url.error());
    }

    //-------------------------------------------------------------------------
    // Manifest
    //-------------------------------------------------------------------------

    logger()->info("Fetching file list from {}", config_.file_list_url);
    auto text = transport_.get_text(config_.file_list_url, stop);
    if (!text) {
        if (text.error() == SyncErrc::cancelled) {
            return std::unexpected(text.error());
        }
        logger()->error("Cannot fetch file list: {}", text.error().message());
        return std::unexpected(make_error_code(SyncErrc::manifest_unavailable));
    }

    auto policy = config_.strict_manifest ? ManifestPolicy::strict : ManifestPolicy::skip_invalid;
    auto manifest = parse_manifest(*text, policy);
    if (!manifest) {
        logger()->error("File list line {} is malformed: {}",
                        manifest.error().line_number, manifest.error().detail);
        return std::unexpected(manifest.error().code);
    }
    logger()->info("File list has {} entries", manifest->size());

    //-------------------------------------------------------------------------
    // Local state and plan
    //-------------------------------------------------------------------------

    const auto& target = config_.target_folder;
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        logger()->error("Cannot create {}: {}", target.string(), ec.message());
        return std::unexpected(disk::from_errno(ec.value()));
    }

    auto backend = hooks_.progress_backend
        ? hooks_.progress_backend
        : std::make_shared<FileBackend>(progress_directory(target));
    ProgressStore store(std::move(backend),
                        std::chrono::seconds(config_.progress_max_age_sec),
                        hooks_.clock ? hooks_.clock : UnixClock(system_unix_time));

    DiffOptions diff_options;
    diff_options.delete_extraneous = config_.delete_extraneous;
    if (config_.probe_remote_sizes) {
        diff_options.probe = [this, &base_url, &stop](const ManifestEntry& entry)
            -> std::optional<std::uint64_t> {
            auto url = base_url->join(entry.relative_path);
            if (!url) return std::nullopt;
            auto info = transport_.head(url->full(), stop);
            if (!info) return std::nullopt;
            return info->content_length;
        };
    }

    LocalStateScanner scanner(target);
    auto plan = DiffEngine(std::move(diff_options)).plan(*manifest, scanner);

    //-------------------------------------------------------------------------
    // Transfer
    //-------------------------------------------------------------------------

    BandwidthLimiter limiter(config_.download_speed_limit_kbs);

    DownloaderOptions downloader_options;
    downloader_options.multithreading_threshold = config_.multithreading_threshold_bytes;
    downloader_options.range_workers = config_.range_workers;
    downloader_options.retry_count = config_.retry_count;
    downloader_options.backoff_initial = hooks_.backoff_initial;
    downloader_options.backoff_max = hooks_.backoff_max;
    downloader_options.checkpoint_bytes = hooks_.checkpoint_bytes;

    ChunkedDownloader downloader(transport_, limiter, store, downloader_options);
    IntegrityVerifier verifier(store);

    Scheduler scheduler(SchedulerContext{transport_, downloader, verifier, store, *base_url, target},
                        config_.worker_count);
    auto report = scheduler.run(plan, callback, stop);

    // Rejected manifest lines are reported by their text
    for (const auto& issue : manifest->issues()) {
        report.failed.push_back(issue.line);
        report.errors[issue.line] = issue.reason;
    }

    logger()->info("Sync finished: {} updated, {} skipped, {} failed, {} removed{}",
                   report.updated.size(), report.skipped.size(), report.failed.size(),
                   report.removed.size(), report.cancelled ? " (cancelled)" : "");
    return report;
}

} // namespace patchsync::core
