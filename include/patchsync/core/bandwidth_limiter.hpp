// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/config.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stop_token>
#include <thread>

namespace patchsync::core {

// Token bucket shared by every transfer.
//
// One dispenser thread owns the bucket. Requesters queue a request for at most
// one slice and sleep until the dispenser grants it, in arrival order. The
// bucket holds at most one slice, so the bytes granted over any window never
// exceed rate * window + slice.
class BandwidthLimiter {
public:
    // limit_kbs == 0 means unlimited: acquire() returns at once, no thread runs
    explicit BandwidthLimiter(std::uint64_t limit_kbs,
                              std::size_t slice_bytes = LIMITER_SLICE_BYTES);
    ~BandwidthLimiter();

    BandwidthLimiter(const BandwidthLimiter&) = delete;
    BandwidthLimiter& operator=(const BandwidthLimiter&) = delete;

    // Block until `bytes` may be transferred. Returns false if stop was
    // requested first; bytes granted before that are still counted.
    [[nodiscard]] bool acquire(std::size_t bytes, std::stop_token stop);

    [[nodiscard]] bool unlimited() const noexcept { return rate_ == 0; }
    [[nodiscard]] std::uint64_t rate_bytes_per_sec() const noexcept { return rate_; }
    [[nodiscard]] std::size_t slice_bytes() const noexcept { return slice_; }

    [[nodiscard]] std::uint64_t total_granted() const noexcept {
        return total_granted_.load(std::memory_order_relaxed);
    }

private:
    struct Request {
        std::size_t bytes{0};
        bool granted{false};
    };

    void dispense(std::stop_token stop);

    const std::uint64_t rate_;   // bytes per second
    const std::size_t slice_;

    std::atomic<std::uint64_t> total_granted_{0};

    std::mutex mutex_;
    std::condition_variable_any requester_cv_;
    std::condition_variable_any dispenser_cv_;
    std::deque<Request*> queue_;

    std::jthread dispenser_;   // Last: stopped and joined before the rest is torn down
};

} // namespace patchsync::core
