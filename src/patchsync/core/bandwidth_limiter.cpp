// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/bandwidth_limiter.hpp>
#include <patchsync/core/log.hpp>

#include <algorithm>
#include <chrono>

namespace patchsync::core {

BandwidthLimiter::BandwidthLimiter(std::uint64_t limit_kbs, std::size_t slice_bytes)
    : rate_(limit_kbs * 1024)
    , slice_(std::max<std::size_t>(slice_bytes, 1)) {
    if (rate_ > 0) {
        logger()->info("Download speed limited to {} KB/s", limit_kbs);
        dispenser_ = std::jthread([this](std::stop_token stop) { dispense(stop); });
    }
}

BandwidthLimiter::~BandwidthLimiter() {
    if (dispenser_.joinable()) {
        dispenser_.request_stop();
        dispenser_.join();
    }
}

bool BandwidthLimiter::acquire(std::size_t bytes, std::stop_token stop) {
    if (unlimited()) {
        total_granted_.fetch_add(bytes, std::memory_order_relaxed);
        return !stop.stop_requested();
    }

    while (bytes > 0) {
        Request request{std::min(bytes, slice_), false};

        std::unique_lock lock(mutex_);
        queue_.push_back(&request);
        dispenser_cv_.notify_one();

        if (!requester_cv_.wait(lock, stop, [&request] { return request.granted; })) {
            // Cancelled while queued: withdraw so the dispenser never touches it
            queue_.erase(std::remove(queue_.begin(), queue_.end(), &request), queue_.end());
            return false;
        }
        bytes -= request.bytes;
    }
    return true;
}

void BandwidthLimiter::dispense(std::stop_token stop) {
    using Clock = std::chrono::steady_clock;

    const double capacity = static_cast<double>(slice_);
    const double rate = static_cast<double>(rate_);
    double tokens = capacity;
    auto last = Clock::now();

    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (queue_.empty()) {
            if (!dispenser_cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
                break;
            }
        }

        auto now = Clock::now();
        tokens = std::min(capacity, tokens + rate * std::chrono::duration<double>(now - last).count());
        last = now;

        auto* front = queue_.front();
        auto needed = static_cast<double>(front->bytes);
        if (tokens >= needed) {
            tokens -= needed;
            front->granted = true;
            queue_.pop_front();
            total_granted_.fetch_add(front->bytes, std::memory_order_relaxed);
            requester_cv_.notify_all();
            continue;
        }

        // Sleep until the bucket can cover the head of the queue; the head may
        // have been withdrawn by then, so it is re-read on the next pass
        auto wait = std::chrono::duration<double>((needed - tokens) / rate);
        dispenser_cv_.wait_for(lock, stop, std::chrono::duration_cast<Clock::duration>(wait),
                               [] { return false; });
    }
}

} // namespace patchsync::core
