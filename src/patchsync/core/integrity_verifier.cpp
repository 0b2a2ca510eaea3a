// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/integrity_verifier.hpp>
#include <patchsync/core/hasher.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/disk/error.hpp>

namespace patchsync::core {

namespace fs = std::filesystem;

IntegrityVerifier::IntegrityVerifier(ProgressStore& store)
    : store_(store) {}

void IntegrityVerifier::forget(const std::string& relative_path) {
    if (auto ec = store_.clear(relative_path)) {
        logger()->warn("Cannot clear progress for {}: {}", relative_path, ec.message());
    }
}

std::expected<Verdict, std::error_code>
IntegrityVerifier::verify(const std::string& relative_path,
                          const fs::path& part_path,
                          const fs::path& destination,
                          const std::string& expected_hash) {
    auto observed = sha256_file(part_path);
    if (!observed) {
        logger()->error("Cannot hash {}: {}", part_path.string(), observed.error().message());
        return std::unexpected(observed.error());
    }

    std::error_code ec;
    if (*observed != expected_hash) {
        logger()->error("{} is corrupted: expected {}, got {}", relative_path, expected_hash, *observed);
        fs::remove(part_path, ec);
        if (ec) {
            logger()->warn("Cannot delete {}: {}", part_path.string(), ec.message());
        }
        forget(relative_path);
        return Verdict::corrupted;
    }

    // A directory or symlink squatting on the destination is replaced
    auto status = fs::symlink_status(destination, ec);
    if (!ec && fs::exists(status) && !fs::is_regular_file(status)) {
        fs::remove_all(destination, ec);
        if (ec) {
            logger()->error("Cannot replace {}: {}", destination.string(), ec.message());
            return std::unexpected(disk::from_errno(ec.value()));
        }
    }

    fs::rename(part_path, destination, ec);
    if (ec) {
        logger()->error("Cannot move {} into place: {}", destination.string(), ec.message());
        return std::unexpected(make_error_code(disk::DiskErrc::rename_failed));
    }

    forget(relative_path);
    logger()->debug("{} verified", relative_path);
    return Verdict::verified;
}

} // namespace patchsync::core
