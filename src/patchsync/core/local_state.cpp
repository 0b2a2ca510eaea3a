// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/local_state.hpp>
#include <patchsync/core/config.hpp>
#include <patchsync/core/hasher.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/disk/error.hpp>

#include <algorithm>
#include <iterator>

namespace patchsync::core {

namespace fs = std::filesystem;

bool crosses_symlink(const fs::path& root, const std::string& relative_path) {
    const fs::path relative(relative_path);
    fs::path current = root;
    for (auto it = relative.begin(); it != relative.end(); ++it) {
        if (std::next(it) == relative.end()) break;  // Last component is checked by the caller
        current /= *it;

        std::error_code ec;
        auto status = fs::symlink_status(current, ec);
        if (ec || !fs::exists(status)) return false;  // Nothing further down exists yet
        if (fs::is_symlink(status)) return true;
    }
    return false;
}

LocalStateScanner::LocalStateScanner(fs::path root)
    : root_(std::move(root)) {}

fs::path LocalStateScanner::absolute(const std::string& relative_path) const {
    return root_ / fs::path(relative_path);
}

LocalFileRecord LocalStateScanner::stat(const std::string& relative_path) const {
    LocalFileRecord record;
    record.relative_path = relative_path;

    if (crosses_symlink(root_, relative_path)) {
        logger()->warn("{}: parent directory is a symlink, ignoring the local copy", relative_path);
        return record;
    }

    std::error_code ec;
    auto status = fs::symlink_status(absolute(relative_path), ec);
    if (ec || !fs::is_regular_file(status)) {
        return record;
    }

    auto size = fs::file_size(absolute(relative_path), ec);
    if (ec) {
        return record;
    }
    record.exists = true;
    record.size_bytes = size;
    return record;
}

std::vector<LocalFileRecord> LocalStateScanner::scan(const Manifest& manifest) const {
    std::vector<LocalFileRecord> records;
    records.reserve(manifest.size());
    for (const auto& entry : manifest.entries()) {
        records.push_back(stat(entry.relative_path));
    }
    return records;
}

std::expected<std::string, std::error_code> LocalStateScanner::hash(LocalFileRecord& record) {
    if (record.observed_hash) {
        return *record.observed_hash;
    }
    if (!record.exists) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    auto digest = sha256_file(absolute(record.relative_path));
    if (!digest) {
        logger()->warn("Cannot hash local file {}: {}", record.relative_path, digest.error().message());
        return std::unexpected(digest.error());
    }
    hashes_computed_.fetch_add(1, std::memory_order_relaxed);
    record.observed_hash = *digest;
    return *digest;
}

std::expected<std::vector<std::string>, std::error_code> LocalStateScanner::walk() const {
    std::vector<std::string> files;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return files;
    }

    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(disk::from_errno(ec.value()));
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(disk::from_errno(ec.value()));
        }
        const auto& path = it->path();
        if (path.filename() == STATE_DIR_NAME) {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_symlink(ec) || !it->is_regular_file(ec)) continue;

        auto relative = path.lexically_relative(root_).generic_string();
        if (relative.ends_with(PART_SUFFIX)) continue;
        files.push_back(std::move(relative));
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace patchsync::core
