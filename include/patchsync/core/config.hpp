// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string_view>

namespace patchsync::core {

constexpr std::uint64_t DEFAULT_MULTITHREADING_THRESHOLD = 10 * 1024 * 1024;  // 10 MB
constexpr std::uint32_t DEFAULT_RANGE_WORKERS = 4;                          // Sub-ranges per large file
constexpr std::uint32_t DEFAULT_WORKER_COUNT = 4;                           // Files in flight
constexpr std::uint64_t DEFAULT_PROGRESS_MAX_AGE_SEC = 86'400;              // 24 hours

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;
constexpr std::uint32_t RETRY_COUNT = 3;

constexpr std::chrono::milliseconds RETRY_BACKOFF_INITIAL{1000};
constexpr std::chrono::milliseconds RETRY_BACKOFF_MAX{120'000};

constexpr std::chrono::milliseconds PROGRESS_EMIT_INTERVAL{100};

constexpr std::size_t LIMITER_SLICE_BYTES = 8 * 1024;                       // 8 KB
constexpr std::uint64_t PROGRESS_CHECKPOINT_BYTES = 256 * 1024;             // 256 KB
constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;                         // 64 KB
constexpr std::size_t TRANSFER_BUFFER_SIZE = 16 * 1024;                     // curl receive buffer

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::size_t SHA256_HEX_LENGTH = 64;

constexpr std::string_view STATE_DIR_NAME = ".patchsync";
constexpr std::string_view PART_SUFFIX = ".pspart";

} // namespace patchsync::core
