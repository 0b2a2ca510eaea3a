// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace patchsync::core {

// Resume state of one sub-range of a multi-range transfer
struct RangeProgress {
    std::uint64_t offset{0};
    std::uint64_t size{0};
    std::uint64_t downloaded{0};

    friend bool operator==(const RangeProgress&, const RangeProgress&) = default;
};

// Resume checkpoint for one file
struct ProgressRecord {
    std::string relative_path;
    std::uint64_t bytes_confirmed{0};
    std::uint64_t total_bytes{0};
    std::int64_t last_updated{0};        // Unix seconds
    std::vector<RangeProgress> ranges;   // Empty for single-stream transfers

    // bytes_confirmed <= total_bytes and every range inside [0, total_bytes)
    [[nodiscard]] bool valid() const noexcept;
};

[[nodiscard]] std::string to_json_text(const ProgressRecord& record);
[[nodiscard]] std::expected<ProgressRecord, std::error_code> from_json_text(const std::string& text);

//=============================================================================
// Backends
//=============================================================================

class KeyValueBackend {
public:
    virtual ~KeyValueBackend() = default;

    // nullopt if the key is absent
    [[nodiscard]] virtual std::expected<std::optional<std::string>, std::error_code>
    get(const std::string& key) = 0;

    [[nodiscard]] virtual std::error_code put(const std::string& key, const std::string& value) = 0;

    // Erasing an absent key is not an error
    [[nodiscard]] virtual std::error_code erase(const std::string& key) = 0;
};

class MemoryBackend final : public KeyValueBackend {
public:
    [[nodiscard]] std::expected<std::optional<std::string>, std::error_code>
    get(const std::string& key) override;
    [[nodiscard]] std::error_code put(const std::string& key, const std::string& value) override;
    [[nodiscard]] std::error_code erase(const std::string& key) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// One JSON file per key, named by the SHA-256 of the key
class FileBackend final : public KeyValueBackend {
public:
    explicit FileBackend(std::filesystem::path directory);

    [[nodiscard]] std::expected<std::optional<std::string>, std::error_code>
    get(const std::string& key) override;
    [[nodiscard]] std::error_code put(const std::string& key, const std::string& value) override;
    [[nodiscard]] std::error_code erase(const std::string& key) override;

    [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
};

//=============================================================================
// ProgressStore
//=============================================================================

// Returns the current time in unix seconds
using UnixClock = std::function<std::int64_t()>;

[[nodiscard]] std::int64_t system_unix_time() noexcept;

class ProgressStore {
public:
    ProgressStore(std::shared_ptr<KeyValueBackend> backend,
                  std::chrono::seconds max_age,
                  UnixClock clock = system_unix_time);

    // Record for path, or nullopt if absent, unreadable, invalid or stale.
    // Stale and invalid records are erased.
    [[nodiscard]] std::optional<ProgressRecord> load(const std::string& relative_path);

    // Stamp last_updated = now and persist
    [[nodiscard]] std::error_code save(ProgressRecord record);
    [[nodiscard]] std::error_code save(const std::string& relative_path,
                                       std::uint64_t bytes_confirmed,
                                       std::uint64_t total_bytes);

    [[nodiscard]] std::error_code clear(const std::string& relative_path);

    [[nodiscard]] std::int64_t now() const { return clock_(); }
    [[nodiscard]] std::chrono::seconds max_age() const noexcept { return max_age_; }

private:
    std::shared_ptr<KeyValueBackend> backend_;
    std::chrono::seconds max_age_;
    UnixClock clock_;
};

} // namespace patchsync::core
