// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace patchsync::disk {

// Local filesystem failures: part files, progress records, the target tree
enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,       // Not a directory, name too long, symlink loop
    file_exists,
    write_error,
    read_error,
    rename_failed,      // Part file or record could not be moved into place
    allocation_failed,
    handle_invalid,
};

[[nodiscard]] const std::error_category& disk_errc_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map an errno value from a failed POSIX or std::filesystem call
[[nodiscard]] std::error_code from_errno(int err) noexcept;

// True for any error that belongs to the disk category
[[nodiscard]] inline bool is_disk_error(const std::error_code& ec) noexcept {
    return ec && ec.category() == disk_errc_category();
}

} // namespace patchsync::disk

namespace std {

template<>
struct is_error_code_enum<patchsync::disk::DiskErrc> : true_type {};

} // namespace std
