// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/bandwidth_limiter.hpp>
#include <patchsync/core/config.hpp>
#include <patchsync/core/progress_store.hpp>
#include <patchsync/core/transport.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace patchsync::core {

struct DownloadRequest {
    std::string url;
    std::string relative_path;                  // Progress store key
    std::filesystem::path destination;          // Final location; bytes go to the part file
    std::optional<std::uint64_t> expected_size; // nullopt if the server did not say
    std::optional<ProgressRecord> resume;
};

struct DownloadResult {
    std::filesystem::path part_path;
    std::uint64_t size{0};            // Bytes in the part file
    std::uint64_t fetched{0};         // Bytes received over the network by this call
    std::uint64_t resumed_from{0};    // Bytes reused from an earlier attempt
    bool multi_range{false};
    bool range_fallback{false};       // Server ignored ranges; restarted as one stream
};

struct DownloaderOptions {
    std::uint64_t multithreading_threshold{DEFAULT_MULTITHREADING_THRESHOLD};
    std::uint32_t range_workers{DEFAULT_RANGE_WORKERS};
    std::uint32_t retry_count{RETRY_COUNT};
    std::chrono::milliseconds backoff_initial{RETRY_BACKOFF_INITIAL};
    std::chrono::milliseconds backoff_max{RETRY_BACKOFF_MAX};
    std::uint64_t checkpoint_bytes{PROGRESS_CHECKPOINT_BYTES};
};

// Bytes of this file on disk so far, and the file size (0 if unknown).
// Called from transfer threads.
using ByteProgress = std::function<void(std::uint64_t done, std::uint64_t total)>;

// Fetches one file into "<destination>.pspart".
//
// Files below the threshold (or of unknown size) come down as one stream that
// resumes with "Range: bytes=N-". Larger files are split into range_workers
// sub-ranges fetched on their own threads, each retried on its own.
class ChunkedDownloader {
public:
    ChunkedDownloader(Transport& transport,
                      BandwidthLimiter& limiter,
                      ProgressStore& store,
                      DownloaderOptions options = {});

    [[nodiscard]] std::expected<DownloadResult, std::error_code>
    download(const DownloadRequest& request,
             std::stop_token stop,
             const ByteProgress& on_progress = {});

    [[nodiscard]] const DownloaderOptions& options() const noexcept { return options_; }

    [[nodiscard]] static std::filesystem::path part_path(const std::filesystem::path& destination);

    // Split [begin, end) into at most count contiguous ranges
    [[nodiscard]] static std::vector<RangeProgress>
    partition(std::uint64_t begin, std::uint64_t end, std::uint32_t count);

private:
    struct Transfer;

    [[nodiscard]] std::error_code single_stream(Transfer& transfer, bool resumable);
    [[nodiscard]] std::error_code multi_range(Transfer& transfer);
    [[nodiscard]] std::error_code fetch_range(Transfer& transfer, std::size_t index,
                                              std::stop_token stop);

    // Run attempt until it succeeds, fails for good, or retries run out
    [[nodiscard]] std::error_code with_retries(const std::string& label,
                                               std::stop_token stop,
                                               const std::function<std::error_code()>& attempt) const;

    Transport& transport_;
    BandwidthLimiter& limiter_;
    ProgressStore& store_;
    DownloaderOptions options_;
};

} // namespace patchsync::core
