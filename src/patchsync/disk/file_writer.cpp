// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/disk/file_writer.hpp>

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace patchsync::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open(const std::filesystem::path& path, OpenMode mode) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::file_exists);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return from_errno(ec.value());
        }
    }

    // A symlink at the destination is replaced, never written through
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC | O_NOFOLLOW;
    if (mode == OpenMode::truncate) {
        flags |= O_TRUNC;
    }

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0 && errno == ELOOP) {
        std::filesystem::remove(path, ec);
        fd = ::open(path.c_str(), flags, 0644);
    }
    if (fd < 0) {
        return from_errno(errno);
    }

    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        ::close(fd);
        return make_error_code(DiskErrc::allocation_failed);
    }
    fd_.store(fd, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* cursor = static_cast<const char*>(data);
    while (size > 0) {
        auto written = ::pwrite(fd, cursor, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno);
        }
        if (written == 0) {
            return make_error_code(DiskErrc::write_error);
        }
        cursor += written;
        offset += static_cast<std::uint64_t>(written);
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

std::error_code FileWriter::pre_allocate(std::uint64_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    // Reserve blocks up front so a full disk fails here, not mid-transfer
    int rc = ::posix_fallocate(fd, 0, static_cast<off_t>(size));
    if (rc == EOPNOTSUPP || rc == EINVAL) {
        if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
            return from_errno(errno);
        }
        return {};
    }
    return from_errno(rc);
}

std::error_code FileWriter::truncate(std::uint64_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        return from_errno(errno);
    }
    return {};
}

std::uint64_t FileWriter::size() const noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    struct stat st{};
    if (fd < 0 || ::fstat(fd, &st) != 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code FileWriter::flush() noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd) != 0) {
        return from_errno(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    // Atomic exchange guards against double-close
    int fd = fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace patchsync::disk
