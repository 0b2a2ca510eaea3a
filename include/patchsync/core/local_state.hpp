// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/error.hpp>
#include <patchsync/core/manifest.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace patchsync::core {

// What is on disk for one manifest path. Rebuilt every run.
struct LocalFileRecord {
    std::string relative_path;
    bool exists{false};            // Regular file reached without symlinks
    std::uint64_t size_bytes{0};
    std::optional<std::string> observed_hash;  // Filled on first hash()
};

// True if a directory between root and the last component of relative_path is
// a symlink. Such paths would resolve outside the tree and are never touched.
[[nodiscard]] bool crosses_symlink(const std::filesystem::path& root, const std::string& relative_path);

class LocalStateScanner {
public:
    explicit LocalStateScanner(std::filesystem::path root);

    // Cheap pass: existence and size only, in manifest order
    [[nodiscard]] std::vector<LocalFileRecord> scan(const Manifest& manifest) const;

    // Stat one path below the root
    [[nodiscard]] LocalFileRecord stat(const std::string& relative_path) const;

    // Hash on demand and cache the result on the record
    [[nodiscard]] std::expected<std::string, std::error_code> hash(LocalFileRecord& record);

    // Every regular file under the root, excluding engine state and part files
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code> walk() const;

    [[nodiscard]] std::filesystem::path absolute(const std::string& relative_path) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    // Number of files actually hashed so far
    [[nodiscard]] std::uint64_t hashes_computed() const noexcept {
        return hashes_computed_.load(std::memory_order_relaxed);
    }

private:
    std::filesystem::path root_;
    std::atomic<std::uint64_t> hashes_computed_{0};
};

} // namespace patchsync::core
