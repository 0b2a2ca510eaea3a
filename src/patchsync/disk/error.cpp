// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/disk/error.hpp>

#include <cerrno>
#include <string>

namespace patchsync::disk {

namespace {

class DiskCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "patchsync::disk"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:            return "Success";
            case DiskErrc::file_not_found:     return "File not found";
            case DiskErrc::access_denied:      return "Access denied";
            case DiskErrc::disk_full:          return "Disk full";
            case DiskErrc::invalid_path:       return "Invalid path";
            case DiskErrc::file_exists:        return "File already exists";
            case DiskErrc::write_error:        return "Write error";
            case DiskErrc::read_error:         return "Read error";
            case DiskErrc::rename_failed:      return "Cannot move file into place";
            case DiskErrc::allocation_failed:  return "Allocation failed";
            case DiskErrc::handle_invalid:     return "Invalid handle";
        }
        return "Unknown disk error";
    }

    // Lets callers compare against std::errc values as well
    [[nodiscard]] std::error_condition default_error_condition(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::file_not_found: return std::errc::no_such_file_or_directory;
            case DiskErrc::access_denied:  return std::errc::permission_denied;
            case DiskErrc::disk_full:      return std::errc::no_space_on_device;
            case DiskErrc::file_exists:    return std::errc::file_exists;
            default:                       return {ev, *this};
        }
    }
};

} // namespace

const std::error_category& disk_errc_category() noexcept {
    static const DiskCategory category;
    return category;
}

std::error_code from_errno(int err) noexcept {
    switch (err) {
        case 0:            return {};
        case ENOENT:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:        return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case ELOOP:        return make_error_code(DiskErrc::invalid_path);
        case EEXIST:       return make_error_code(DiskErrc::file_exists);
        case ENOMEM:       return make_error_code(DiskErrc::allocation_failed);
        case EBADF:        return make_error_code(DiskErrc::handle_invalid);
        case EXDEV:        return make_error_code(DiskErrc::rename_failed);
        case EIO:          return make_error_code(DiskErrc::read_error);
        default:           return make_error_code(DiskErrc::write_error);
    }
}

} // namespace patchsync::disk
