// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/disk/error.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <atomic>

namespace patchsync::disk {

// How an existing file is treated on open
enum class OpenMode : std::uint8_t {
    truncate,   // Start empty
    keep,       // Keep existing bytes (resume)
};

// Thread-safe positional writer. Concurrent writes at disjoint offsets
// are allowed (pwrite), so sub-ranges share one writer.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Open file for writing, creating parent directories
    [[nodiscard]] std::error_code open(const std::filesystem::path& path, OpenMode mode) noexcept;

    // Write data at offset (thread-safe)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    // Grow the file to size so out-of-order writes land in place
    [[nodiscard]] std::error_code pre_allocate(std::uint64_t size) noexcept;

    // Cut the file to size (drops bytes past a resume point)
    [[nodiscard]] std::error_code truncate(std::uint64_t size) noexcept;

    // Current size on disk
    [[nodiscard]] std::uint64_t size() const noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_.load(std::memory_order_acquire) >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::atomic<int> fd_{-1};
    std::filesystem::path path_;
};

} // namespace patchsync::disk
