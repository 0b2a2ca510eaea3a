// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/chunked_downloader.hpp>
#include <patchsync/core/diff_engine.hpp>
#include <patchsync/core/integrity_verifier.hpp>
#include <patchsync/core/progress_store.hpp>
#include <patchsync/core/status_report.hpp>
#include <patchsync/core/transport.hpp>
#include <patchsync/core/url.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace patchsync::core {

// Lifecycle of one work item
enum class ItemState : std::uint8_t {
    pending,
    claimed,
    transferring,
    verifying,
    completed,
    failed,
    skipped_verified,
};

[[nodiscard]] std::string_view to_string(ItemState state) noexcept;

[[nodiscard]] constexpr bool is_terminal(ItemState state) noexcept {
    return state == ItemState::completed || state == ItemState::failed ||
           state == ItemState::skipped_verified;
}

// Emitted on every item transition and, at most every 100 ms, on byte progress
struct SyncProgress {
    std::size_t completed_files{0};   // Items in a terminal state
    std::size_t total_files{0};
    std::uint64_t completed_bytes{0};
    std::uint64_t total_bytes{0};     // Known download sizes
    std::string path;
    ItemState state{ItemState::pending};
};

using ProgressCallback = std::function<void(const SyncProgress&)>;

// Paths currently owned by a worker
class ClaimSet {
public:
    // already_claimed if another worker holds the path
    [[nodiscard]] std::error_code claim(const std::string& path);
    void release(const std::string& path);

    [[nodiscard]] bool contains(const std::string& path) const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> claimed_;
};

struct SchedulerContext {
    Transport& transport;
    ChunkedDownloader& downloader;
    IntegrityVerifier& verifier;
    ProgressStore& store;
    Url base_url;                        // Directory URL manifest paths are joined onto
    std::filesystem::path target_root;
};

// Runs a work plan on a pool of worker threads. The thread calling run() is the
// dispatch loop: it alone writes the report and invokes the callback.
class Scheduler {
public:
    Scheduler(SchedulerContext context, std::uint32_t worker_count);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    [[nodiscard]] StatusReport run(const WorkPlan& plan,
                                   const ProgressCallback& callback,
                                   std::stop_token stop);

    [[nodiscard]] std::uint32_t worker_count() const noexcept { return worker_count_; }

private:
    enum class EventKind : std::uint8_t { state, bytes, worker_exit };

    struct Event {
        EventKind kind{EventKind::state};
        std::size_t item{0};
        ItemState state{ItemState::pending};
        std::uint64_t done{0};
        std::uint64_t total{0};
        bool corrupted{false};
        std::string reason;
    };

    struct Outcome {
        ItemState state{ItemState::failed};
        bool corrupted{false};
        std::string reason;
    };

    void worker_loop(const WorkPlan& plan, std::stop_token stop);
    [[nodiscard]] Outcome process(const WorkPlan& plan, std::size_t index, std::stop_token stop);
    [[nodiscard]] Outcome download(const WorkItem& item, std::size_t index, std::stop_token stop);
    [[nodiscard]] Outcome remove(const WorkItem& item);

    void post(Event event);

    SchedulerContext context_;
    std::uint32_t worker_count_;
    ClaimSet claims_;

    std::mutex mutex_;
    std::condition_variable events_cv_;
    std::condition_variable work_cv_;
    std::deque<Event> events_;
    std::deque<std::size_t> pending_;
};

} // namespace patchsync::core
