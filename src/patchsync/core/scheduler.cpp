// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/scheduler.hpp>
#include <patchsync/core/config.hpp>
#include <patchsync/core/local_state.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/disk/error.hpp>

#include <algorithm>
#include <chrono>
#include <thread>

namespace patchsync::core {

namespace fs = std::filesystem;

namespace {

std::string reason_for(const std::error_code& ec) {
    return ec == SyncErrc::cancelled ? std::string("cancelled") : ec.message();
}

// Requests stop when the run scope unwinds, before the workers are joined
struct StopOnExit {
    std::stop_source& source;
    ~StopOnExit() { source.request_stop(); }
};

} // namespace

std::string_view to_string(ItemState state) noexcept {
    switch (state) {
        case ItemState::pending:          return "pending";
        case ItemState::claimed:          return "claimed";
        case ItemState::transferring:     return "transferring";
        case ItemState::verifying:        return "verifying";
        case ItemState::completed:        return "completed";
        case ItemState::failed:           return "failed";
        case ItemState::skipped_verified: return "skipped";
    }
    return "unknown";
}

//=============================================================================
// ClaimSet
//=============================================================================

std::error_code ClaimSet::claim(const std::string& path) {
    std::lock_guard lock(mutex_);
    if (!claimed_.insert(path).second) {
        return make_error_code(SyncErrc::already_claimed);
    }
    return {};
}

void ClaimSet::release(const std::string& path) {
    std::lock_guard lock(mutex_);
    claimed_.erase(path);
}

bool ClaimSet::contains(const std::string& path) const {
    std::lock_guard lock(mutex_);
    return claimed_.contains(path);
}

std::size_t ClaimSet::size() const {
    std::lock_guard lock(mutex_);
    return claimed_.size();
}

//=============================================================================
// Scheduler
//=============================================================================

Scheduler::Scheduler(SchedulerContext context, std::uint32_t worker_count)
    : context_(std::move(context))
    , worker_count_(std::max<std::uint32_t>(worker_count, 1)) {}

void Scheduler::post(Event event) {
    {
        std::lock_guard lock(mutex_);
        events_.push_back(std::move(event));
    }
    events_cv_.notify_one();
}

StatusReport Scheduler::run(const WorkPlan& plan,
                            const ProgressCallback& callback,
                            std::stop_token stop) {
    using Clock = std::chrono::steady_clock;
    using Entries = std::vector<std::pair<std::size_t, std::string>>;

    const auto& items = plan.items;

    struct Tracker {
        ItemState state{ItemState::pending};
        std::uint64_t done{0};
        std::uint64_t total{0};
    };
    std::vector<Tracker> trackers(items.size());

    std::size_t terminal = 0;
    std::uint64_t completed_bytes = 0;
    std::uint64_t total_bytes = 0;
    auto last_emit = Clock::now();

    Entries updated, skipped, failed, removed, verified, corrupted;
    std::map<std::string, std::string> errors;

    auto emit = [&](std::size_t index) {
        last_emit = Clock::now();
        if (!callback) return;
        callback(SyncProgress{terminal, items.size(), completed_bytes, total_bytes,
                              items[index].relative_path, trackers[index].state});
    };

    auto finish = [&](std::size_t index, const Event& event) {
        const auto& item = items[index];
        auto entry = std::make_pair(item.manifest_index, item.relative_path);
        ++terminal;

        if (event.state == ItemState::completed) {
            if (item.kind == WorkKind::remove) {
                removed.push_back(entry);
            } else {
                updated.push_back(entry);
                verified.push_back(entry);
            }
        } else if (event.state == ItemState::failed) {
            failed.push_back(entry);
            errors[item.relative_path] = event.reason;
            if (event.corrupted) corrupted.push_back(entry);
        } else {
            skipped.push_back(entry);
        }
    };

    auto apply = [&](const Event& event) {
        auto& tracker = trackers[event.item];
        if (is_terminal(tracker.state)) return;

        if (event.kind == EventKind::bytes) {
            completed_bytes = completed_bytes - tracker.done + event.done;
            tracker.done = event.done;
            if (event.total != 0 && event.total != tracker.total) {
                total_bytes = total_bytes - tracker.total + event.total;
                tracker.total = event.total;
            }
            if (Clock::now() - last_emit >= PROGRESS_EMIT_INTERVAL) {
                emit(event.item);
            }
            return;
        }

        tracker.state = event.state;
        if (is_terminal(event.state)) {
            finish(event.item, event);
        }
        emit(event.item);
    };

    {
        std::lock_guard lock(mutex_);
        events_.clear();
        pending_.clear();
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (items[i].kind != WorkKind::skip) {
                pending_.push_back(i);
                trackers[i].total = items[i].remote_size.value_or(0);
                total_bytes += trackers[i].total;
            }
        }
    }

    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i].kind == WorkKind::skip) {
            apply(Event{EventKind::state, i, ItemState::skipped_verified});
        }
    }

    std::stop_source run_stop;
    std::stop_callback link(stop, [&run_stop] { run_stop.request_stop(); });

    std::size_t alive = 0;
    {
        std::vector<std::jthread> workers;
        StopOnExit guard{run_stop};

        const auto queued = items.size() - plan.count(WorkKind::skip);
        const auto count = std::min<std::size_t>(worker_count_, queued);
        for (std::size_t n = 0; n < count; ++n) {
            workers.emplace_back([this, &plan, token = run_stop.get_token()] {
                worker_loop(plan, token);
            });
        }
        alive = workers.size();

        // Dispatch loop
        while (alive > 0) {
            std::deque<Event> batch;
            {
                std::unique_lock lock(mutex_);
                events_cv_.wait(lock, [this] { return !events_.empty(); });
                batch.swap(events_);
            }
            for (const auto& event : batch) {
                if (event.kind == EventKind::worker_exit) {
                    --alive;
                } else {
                    apply(event);
                }
            }
        }
    } // Workers joined

    // Items nobody got to before the stop
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!is_terminal(trackers[i].state)) {
            apply(Event{EventKind::state, i, ItemState::failed, 0, 0, false, "cancelled"});
        }
    }

    auto sorted = [](Entries& entries) {
        std::sort(entries.begin(), entries.end());
        std::vector<std::string> paths;
        paths.reserve(entries.size());
        for (auto& [index, path] : entries) paths.push_back(std::move(path));
        return paths;
    };

    StatusReport report;
    report.updated = sorted(updated);
    report.skipped = sorted(skipped);
    report.failed = sorted(failed);
    report.removed = sorted(removed);
    report.verification.verified = sorted(verified);
    report.verification.corrupted = sorted(corrupted);
    report.errors = std::move(errors);
    report.cancelled = stop.stop_requested();
    return report;
}

void Scheduler::worker_loop(const WorkPlan& plan, std::stop_token stop) {
    using namespace std::chrono_literals;

    while (!stop.stop_requested()) {
        std::size_t index = 0;
        {
            std::unique_lock lock(mutex_);
            if (pending_.empty()) break;

            auto it = pending_.begin();
            for (; it != pending_.end(); ++it) {
                if (!claims_.claim(plan.items[*it].relative_path)) break;
            }
            if (it == pending_.end()) {
                // Every pending path is held by another worker
                work_cv_.wait_for(lock, 50ms);
                continue;
            }
            index = *it;
            pending_.erase(it);
        }

        const auto& item = plan.items[index];
        post(Event{EventKind::state, index, ItemState::claimed});

        Outcome outcome;
        try {
            outcome = process(plan, index, stop);
        } catch (const std::exception& e) {
            logger()->error("{}: {}", item.relative_path, e.what());
            outcome = Outcome{ItemState::failed, false, e.what()};
        }

        claims_.release(item.relative_path);
        work_cv_.notify_all();

        post(Event{EventKind::state, index, outcome.state, 0, 0, outcome.corrupted,
                   std::move(outcome.reason)});
    }

    post(Event{EventKind::worker_exit});
}

Scheduler::Outcome Scheduler::process(const WorkPlan& plan, std::size_t index, std::stop_token stop) {
    const auto& item = plan.items[index];
    if (item.kind != WorkKind::skip && crosses_symlink(context_.target_root, item.relative_path)) {
        auto ec = make_error_code(disk::DiskErrc::invalid_path);
        logger()->error("{}: refusing to write through a symlinked directory", item.relative_path);
        return Outcome{ItemState::failed, false, ec.message()};
    }
    switch (item.kind) {
        case WorkKind::download: return download(item, index, stop);
        case WorkKind::remove:   return remove(item);
        case WorkKind::skip:     break;
    }
    return Outcome{ItemState::skipped_verified};
}

Scheduler::Outcome Scheduler::download(const WorkItem& item, std::size_t index, std::stop_token stop) {
    const auto& path = item.relative_path;

    auto url = context_.base_url.join(path);
    if (!url) {
        logger()->error("{}: cannot build URL: {}", path, url.error().message());
        return Outcome{ItemState::failed, false, url.error().message()};
    }

    auto remote_size = item.remote_size;
    if (!remote_size) {
        auto info = context_.transport.head(url->full(), stop);
        if (info) {
            remote_size = info->content_length;
        } else if (info.error() == SyncErrc::cancelled) {
            return Outcome{ItemState::failed, false, reason_for(info.error())};
        } else {
            logger()->debug("{}: HEAD failed ({}), size unknown", path, info.error().message());
        }
    }
    if (remote_size) {
        post(Event{EventKind::bytes, index, ItemState::pending, 0, *remote_size});
    }

    auto resume = context_.store.load(path);

    post(Event{EventKind::state, index, ItemState::transferring});

    DownloadRequest request{url->full(), path, context_.target_root / path, remote_size, std::move(resume)};
    auto result = context_.downloader.download(request, stop,
        [this, index](std::uint64_t done, std::uint64_t total) {
            post(Event{EventKind::bytes, index, ItemState::pending, done, total});
        });
    if (!result) {
        return Outcome{ItemState::failed, false, reason_for(result.error())};
    }

    post(Event{EventKind::state, index, ItemState::verifying});

    auto verdict = context_.verifier.verify(path, result->part_path, request.destination,
                                            item.expected_hash);
    if (!verdict) {
        return Outcome{ItemState::failed, false, verdict.error().message()};
    }
    if (*verdict == Verdict::corrupted) {
        return Outcome{ItemState::failed, true, "content hash mismatch"};
    }

    logger()->info("Updated {}", path);
    return Outcome{ItemState::completed};
}

Scheduler::Outcome Scheduler::remove(const WorkItem& item) {
    std::error_code ec;
    fs::remove(context_.target_root / item.relative_path, ec);
    if (ec) {
        logger()->error("Cannot remove {}: {}", item.relative_path, ec.message());
        return Outcome{ItemState::failed, false, ec.message()};
    }
    logger()->info("Removed {}", item.relative_path);
    return Outcome{ItemState::completed};
}

} // namespace patchsync::core
