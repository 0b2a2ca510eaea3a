// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/chunked_downloader.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/disk/file_writer.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <numeric>
#include <thread>

namespace patchsync::core {

namespace fs = std::filesystem;

namespace {

// Sleep unless stopped first. Returns false if stop was requested.
bool sleep_for(std::chrono::milliseconds duration, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

std::uint64_t part_file_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(fs::symlink_status(path, ec))) return 0;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

std::uint64_t range_bytes(const std::vector<RangeProgress>& ranges, bool downloaded) {
    return std::accumulate(ranges.begin(), ranges.end(), std::uint64_t{0},
        [downloaded](std::uint64_t sum, const RangeProgress& r) {
            return sum + (downloaded ? r.downloaded : r.size);
        });
}

// Stored ranges must tile [first offset, total) without gaps
bool ranges_tile(const std::vector<RangeProgress>& ranges, std::uint64_t total) {
    if (ranges.empty()) return false;
    std::uint64_t cursor = ranges.front().offset;
    for (const auto& r : ranges) {
        if (r.offset != cursor || r.size == 0) return false;
        cursor += r.size;
    }
    return cursor == total;
}

} // namespace

//=============================================================================
// Transfer state shared by the ranges of one file
//=============================================================================

struct ChunkedDownloader::Transfer {
    const DownloadRequest& request;
    std::stop_token stop;
    const ByteProgress& on_progress;

    disk::FileWriter writer;
    std::optional<std::uint64_t> total;
    std::uint64_t base{0};                     // Bytes before the first range, already on disk

    std::atomic<std::uint64_t> done{0};
    std::atomic<std::uint64_t> fetched{0};

    std::mutex mutex;                          // Guards ranges, first_error and checkpoints
    std::vector<RangeProgress> ranges;
    std::error_code first_error;

    Transfer(const DownloadRequest& req, std::stop_token token, const ByteProgress& progress)
        : request(req), stop(std::move(token)), on_progress(progress) {}

    void report() const {
        if (on_progress) on_progress(done.load(std::memory_order_relaxed), total.value_or(0));
    }
};

//=============================================================================
// ChunkedDownloader
//=============================================================================

ChunkedDownloader::ChunkedDownloader(Transport& transport,
                                     BandwidthLimiter& limiter,
                                     ProgressStore& store,
                                     DownloaderOptions options)
    : transport_(transport)
    , limiter_(limiter)
    , store_(store)
    , options_(options) {
    options_.range_workers = std::max<std::uint32_t>(options_.range_workers, 1);
    options_.checkpoint_bytes = std::max<std::uint64_t>(options_.checkpoint_bytes, 1);
}

fs::path ChunkedDownloader::part_path(const fs::path& destination) {
    auto part = destination;
    part += PART_SUFFIX;
    return part;
}

std::vector<RangeProgress>
ChunkedDownloader::partition(std::uint64_t begin, std::uint64_t end, std::uint32_t count) {
    std::vector<RangeProgress> ranges;
    if (begin >= end || count == 0) return ranges;

    const std::uint64_t length = end - begin;
    const std::uint64_t n = std::min<std::uint64_t>(count, length);
    const std::uint64_t size = (length + n - 1) / n;  // Round up

    for (std::uint64_t offset = begin; offset < end; offset += size) {
        ranges.push_back({offset, std::min(size, end - offset), 0});
    }
    return ranges;
}

std::expected<DownloadResult, std::error_code>
ChunkedDownloader::download(const DownloadRequest& request,
                            std::stop_token stop,
                            const ByteProgress& on_progress) {
    DownloadResult result;
    result.part_path = part_path(request.destination);

    Transfer transfer(request, stop, on_progress);
    transfer.total = request.expected_size;

    const auto part_size = part_file_size(result.part_path);
    auto resume = request.resume;
    if (resume && (!transfer.total || resume->total_bytes != *transfer.total)) {
        logger()->info("{}: remote size changed since last attempt, restarting", request.relative_path);
        if (auto ec = store_.clear(request.relative_path)) {
            logger()->warn("Cannot clear progress for {}: {}", request.relative_path, ec.message());
        }
        resume.reset();
    }

    result.multi_range = transfer.total && *transfer.total >= options_.multithreading_threshold;

    bool keep_bytes = false;
    if (result.multi_range) {
        const auto total = *transfer.total;
        if (resume && part_size == total && ranges_tile(resume->ranges, total)) {
            transfer.ranges = resume->ranges;
            transfer.base = resume->ranges.front().offset;
        } else {
            if (resume && resume->ranges.empty()) {
                transfer.base = std::min(resume->bytes_confirmed, part_size);
            }
            transfer.ranges = partition(transfer.base, total, options_.range_workers);
        }
        transfer.done = transfer.base + range_bytes(transfer.ranges, true);
        keep_bytes = transfer.done > 0;
    } else if (resume && resume->ranges.empty()) {
        transfer.done = std::min(resume->bytes_confirmed, part_size);
        keep_bytes = transfer.done > 0;
    }
    result.resumed_from = transfer.done;

    if (auto ec = transfer.writer.open(result.part_path,
                                       keep_bytes ? disk::OpenMode::keep : disk::OpenMode::truncate)) {
        logger()->error("Cannot open {}: {}", result.part_path.string(), ec.message());
        return std::unexpected(ec);
    }

    if (result.resumed_from > 0) {
        logger()->info("Resuming {} from byte {}", request.relative_path, result.resumed_from);
    } else {
        logger()->info("Downloading {} ({} bytes{})", request.relative_path,
                       transfer.total ? std::to_string(*transfer.total) : std::string("unknown"),
                       result.multi_range
                           ? spdlog::fmt_lib::format(", {} ranges", transfer.ranges.size())
                           : std::string());
    }
    transfer.report();

    std::error_code ec;
    if (result.multi_range) {
        ec = transfer.writer.pre_allocate(*transfer.total);
        if (!ec) ec = multi_range(transfer);
    } else {
        ec = single_stream(transfer, true);
    }

    if (ec == SyncErrc::range_unsupported) {
        logger()->warn("{}: server ignored the range request, restarting as a single stream",
                       request.relative_path);
        if (auto clear_ec = store_.clear(request.relative_path)) {
            logger()->warn("Cannot clear progress for {}: {}", request.relative_path, clear_ec.message());
        }
        result.range_fallback = true;
        result.multi_range = false;
        result.resumed_from = 0;
        transfer.ranges.clear();
        transfer.base = 0;
        transfer.done = 0;
        ec = single_stream(transfer, false);
    }

    result.fetched = transfer.fetched.load(std::memory_order_relaxed);

    if (ec) {
        transfer.writer.close();
        if (ec == SyncErrc::invalid_range) {
            // More bytes than asked for: nothing in the part file can be trusted
            std::error_code rm_ec;
            fs::remove(result.part_path, rm_ec);
            if (auto clear_ec = store_.clear(request.relative_path)) {
                logger()->warn("Cannot clear progress for {}: {}", request.relative_path, clear_ec.message());
            }
        } else if (transfer.done.load() == 0) {
            // Nothing on disk worth resuming from
            std::error_code rm_ec;
            fs::remove(result.part_path, rm_ec);
        }
        if (ec != SyncErrc::cancelled) {
            logger()->error("Download of {} failed: {}", request.relative_path, ec.message());
        }
        return std::unexpected(ec);
    }

    if (auto flush_ec = transfer.writer.flush()) {
        transfer.writer.close();
        return std::unexpected(flush_ec);
    }
    result.size = transfer.writer.size();
    transfer.writer.close();

    logger()->debug("{}: {} bytes on disk, {} fetched", request.relative_path, result.size, result.fetched);
    return result;
}

//=============================================================================
// Single stream
//=============================================================================

std::error_code ChunkedDownloader::single_stream(Transfer& transfer, bool resumable) {
    const auto& path = transfer.request.relative_path;
    std::uint64_t offset = resumable ? transfer.done.load() : 0;
    std::uint64_t since_checkpoint = 0;

    if (auto ec = transfer.writer.truncate(offset)) {
        return ec;
    }
    if (transfer.total && offset == *transfer.total) {
        logger()->debug("{}: already complete on disk", path);
        return {};
    }

    auto checkpoint = [&] {
        if (!resumable || !transfer.total || since_checkpoint == 0) return;
        since_checkpoint = 0;
        if (auto ec = store_.save(path, offset, *transfer.total)) {
            logger()->warn("Cannot save progress for {}: {}", path, ec.message());
        }
    };

    auto attempt = [&]() -> std::error_code {
        // Without ranges every attempt starts over
        if (!resumable && offset > 0) {
            offset = 0;
            transfer.done = 0;
            if (auto ec = transfer.writer.truncate(0)) return ec;
        }

        FetchRequest request{transfer.request.url, offset, std::nullopt};

        HeadHandler on_head = [&](const ResponseHead& head) -> std::error_code {
            if (request.wants_range() && !(head.partial && head.range_start == request.offset)) {
                return make_error_code(SyncErrc::range_unsupported);
            }
            if (!transfer.total && head.total_size) {
                transfer.total = head.total_size;
            }
            return {};
        };

        BodyHandler on_body = [&](std::span<const std::byte> data) -> std::error_code {
            if (transfer.total && offset + data.size() > *transfer.total) {
                return make_error_code(SyncErrc::invalid_range);
            }
            if (!limiter_.acquire(data.size(), transfer.stop)) {
                return make_error_code(SyncErrc::cancelled);
            }
            if (auto ec = transfer.writer.write(offset, data.data(), data.size())) {
                return ec;
            }
            offset += data.size();
            since_checkpoint += data.size();
            transfer.done = offset;
            transfer.fetched += data.size();
            transfer.report();

            if (since_checkpoint >= options_.checkpoint_bytes) {
                checkpoint();
            }
            return {};
        };

        auto ec = transport_.fetch(request, on_head, on_body, transfer.stop);
        if (!ec && transfer.total && offset < *transfer.total) {
            logger()->warn("{}: connection closed at byte {} of {}", path, offset, *transfer.total);
            ec = make_error_code(SyncErrc::network_transient);
        }
        if (ec) checkpoint();
        return ec;
    };

    return with_retries(path, transfer.stop, attempt);
}

//=============================================================================
// Multi-range
//=============================================================================

std::error_code ChunkedDownloader::multi_range(Transfer& transfer) {
    std::stop_source local;
    std::stop_callback forward(transfer.stop, [&local] { local.request_stop(); });

    auto fail = [&](std::error_code ec) {
        std::lock_guard lock(transfer.mutex);
        if (!transfer.first_error) transfer.first_error = ec;
        local.request_stop();
    };

    {
        std::vector<std::jthread> threads;
        threads.reserve(transfer.ranges.size());
        for (std::size_t i = 0; i < transfer.ranges.size(); ++i) {
            if (transfer.ranges[i].downloaded == transfer.ranges[i].size) continue;
            threads.emplace_back([this, &transfer, &local, &fail, i] {
                try {
                    if (auto ec = fetch_range(transfer, i, local.get_token())) {
                        fail(ec);
                    }
                } catch (const std::exception& e) {
                    logger()->error("{} [range {}]: {}", transfer.request.relative_path, i, e.what());
                    fail(make_error_code(SyncErrc::transfer_failed));
                }
            });
        }
    } // Join all ranges

    std::lock_guard lock(transfer.mutex);
    if (range_bytes(transfer.ranges, true) > 0) {
        ProgressRecord record;
        record.relative_path = transfer.request.relative_path;
        record.total_bytes = *transfer.total;
        record.ranges = transfer.ranges;
        record.bytes_confirmed = transfer.base + range_bytes(transfer.ranges, true);
        if (auto ec = store_.save(std::move(record))) {
            logger()->warn("Cannot save progress for {}: {}", transfer.request.relative_path, ec.message());
        }
    }

    if (transfer.first_error) {
        return transfer.first_error;
    }
    if (transfer.stop.stop_requested()) {
        return make_error_code(SyncErrc::cancelled);
    }
    return {};
}

std::error_code ChunkedDownloader::fetch_range(Transfer& transfer, std::size_t index,
                                               std::stop_token stop) {
    const auto label = spdlog::fmt_lib::format("{} [range {}]", transfer.request.relative_path, index);
    std::uint64_t since_checkpoint = 0;

    // Caller holds transfer.mutex
    auto checkpoint = [&] {
        since_checkpoint = 0;
        ProgressRecord record;
        record.relative_path = transfer.request.relative_path;
        record.total_bytes = *transfer.total;
        record.ranges = transfer.ranges;
        record.bytes_confirmed = transfer.base + range_bytes(transfer.ranges, true);
        if (auto ec = store_.save(std::move(record))) {
            logger()->warn("Cannot save progress for {}: {}", label, ec.message());
        }
    };

    auto attempt = [&]() -> std::error_code {
        RangeProgress range;
        {
            std::lock_guard lock(transfer.mutex);
            range = transfer.ranges[index];
        }
        if (range.downloaded == range.size) return {};

        const std::uint64_t end = range.offset + range.size;
        std::uint64_t position = range.offset + range.downloaded;
        FetchRequest request{transfer.request.url, position, end - 1};

        HeadHandler on_head = [&](const ResponseHead& head) -> std::error_code {
            if (!head.partial || head.range_start != request.offset) {
                return make_error_code(SyncErrc::range_unsupported);
            }
            if (head.total_size && *head.total_size != *transfer.total) {
                return make_error_code(SyncErrc::invalid_range);
            }
            return {};
        };

        BodyHandler on_body = [&](std::span<const std::byte> data) -> std::error_code {
            if (position + data.size() > end) {
                return make_error_code(SyncErrc::invalid_range);
            }
            if (!limiter_.acquire(data.size(), stop)) {
                return make_error_code(SyncErrc::cancelled);
            }
            if (auto ec = transfer.writer.write(position, data.data(), data.size())) {
                return ec;
            }
            position += data.size();
            {
                std::lock_guard lock(transfer.mutex);
                transfer.ranges[index].downloaded += data.size();
                since_checkpoint += data.size();
                if (since_checkpoint >= options_.checkpoint_bytes) {
                    checkpoint();
                }
            }
            transfer.done += data.size();
            transfer.fetched += data.size();
            transfer.report();
            return {};
        };

        logger()->debug("{}: bytes {}-{}", label, request.offset, end - 1);
        auto ec = transport_.fetch(request, on_head, on_body, stop);
        if (!ec && position < end) {
            logger()->warn("{}: connection closed at byte {} of {}", label, position, end);
            ec = make_error_code(SyncErrc::network_transient);
        }
        // Range finished or attempt failed: keep what landed on disk
        if (since_checkpoint > 0) {
            std::lock_guard lock(transfer.mutex);
            checkpoint();
        }
        return ec;
    };

    return with_retries(label, stop, attempt);
}

//=============================================================================
// Retry
//=============================================================================

std::error_code ChunkedDownloader::with_retries(const std::string& label,
                                                std::stop_token stop,
                                                const std::function<std::error_code()>& attempt) const {
    auto backoff = options_.backoff_initial;
    for (std::uint32_t retry = 0;; ++retry) {
        auto ec = attempt();
        if (!ec) return {};
        if (stop.stop_requested()) return make_error_code(SyncErrc::cancelled);
        if (!is_transient(ec)) return ec;

        if (retry >= options_.retry_count) {
            logger()->error("{}: {} after {} retries", label, ec.message(), options_.retry_count);
            return make_error_code(SyncErrc::transfer_failed);
        }

        logger()->warn("{}: {} (retry {}/{} in {} ms)", label, ec.message(),
                       retry + 1, options_.retry_count, backoff.count());
        if (!sleep_for(backoff, stop)) {
            return make_error_code(SyncErrc::cancelled);
        }
        backoff = std::min(backoff * 2, options_.backoff_max);
    }
}

} // namespace patchsync::core
