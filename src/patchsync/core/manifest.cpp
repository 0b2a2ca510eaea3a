// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/manifest.hpp>
#include <patchsync/core/config.hpp>
#include <patchsync/core/hasher.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/disk/error.hpp>

#include <algorithm>
#include <cctype>

namespace patchsync::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Empty reason means the line is valid
std::string parse_line(std::string_view line, ManifestEntry& out) {
    auto comma = line.find(',');
    if (comma == std::string_view::npos) {
        return "expected 'path,hexdigest'";
    }
    if (line.find(',', comma + 1) != std::string_view::npos) {
        return "too many fields";
    }

    auto path = trim(line.substr(0, comma));
    auto digest = trim(line.substr(comma + 1));

    auto normalized = normalize_relative_path(path);
    if (normalized.empty()) {
        return "invalid relative path";
    }
    if (!is_sha256_hex(digest)) {
        return "digest is not 64 hex characters";
    }

    out.relative_path = std::move(normalized);
    out.expected_hash = to_lower(digest);
    return {};
}

} // namespace

//=============================================================================
// Manifest
//=============================================================================

const ManifestEntry* Manifest::find(std::string_view relative_path) const {
    auto it = index_.find(std::string(relative_path));
    return it == index_.end() ? nullptr : &entries_[it->second];
}

std::size_t Manifest::index_of(std::string_view relative_path) const {
    auto it = index_.find(std::string(relative_path));
    return it == index_.end() ? entries_.size() : it->second;
}

bool Manifest::upsert(ManifestEntry entry) {
    auto it = index_.find(entry.relative_path);
    if (it != index_.end()) {
        entries_[it->second].expected_hash = std::move(entry.expected_hash);
        return false;
    }
    index_.emplace(entry.relative_path, entries_.size());
    entries_.push_back(std::move(entry));
    return true;
}

//=============================================================================
// Parsing
//=============================================================================

std::expected<Manifest, ManifestError> parse_manifest(std::string_view text, ManifestPolicy policy) {
    Manifest manifest;
    std::size_t line_number = 0;

    while (!text.empty()) {
        auto newline = text.find('\n');
        auto raw = text.substr(0, newline);
        text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);
        ++line_number;

        auto line = trim(raw);
        if (line.empty()) continue;

        ManifestEntry entry;
        auto reason = parse_line(line, entry);
        if (!reason.empty()) {
            if (policy == ManifestPolicy::strict) {
                return std::unexpected(ManifestError{
                    make_error_code(SyncErrc::malformed_manifest), line_number, std::move(reason)});
            }
            logger()->warn("Manifest line {} rejected ({}): {}", line_number, reason, line);
            manifest.issues_.push_back({line_number, std::string(line), std::move(reason)});
            continue;
        }

        auto path = entry.relative_path;
        if (!manifest.upsert(std::move(entry))) {
            logger()->warn("Manifest line {} redefines '{}', later digest wins", line_number, path);
            manifest.duplicates_.push_back({line_number, std::string(line), "duplicate path"});
        }
    }

    return manifest;
}

std::string normalize_relative_path(std::string_view path) {
    std::string p(path);
    std::replace(p.begin(), p.end(), '\\', '/');
    if (p.empty() || p.front() == '/' || (p.size() > 1 && p[1] == ':')) {
        return {};
    }

    std::string out;
    std::size_t pos = 0;
    while (pos <= p.size()) {
        auto slash = p.find('/', pos);
        if (slash == std::string::npos) slash = p.size();
        auto segment = std::string_view(p).substr(pos, slash - pos);
        pos = slash + 1;

        if (segment.empty() || segment == ".") continue;
        if (segment == "..") return {};
        // Reserved for the engine's own bookkeeping
        if (segment == STATE_DIR_NAME) return {};

        if (!out.empty()) out += '/';
        out += segment;
    }
    if (out.ends_with(PART_SUFFIX)) {
        return {};
    }
    return out;
}

//=============================================================================
// Generation
//=============================================================================

std::expected<std::string, std::error_code> generate_manifest(const std::filesystem::path& root) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::vector<std::pair<std::string, fs::path>> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(disk::from_errno(ec.value()));
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(disk::from_errno(ec.value()));
        }
        if (it->path().filename() == STATE_DIR_NAME) {
            it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec) || it->is_symlink(ec)) continue;

        auto relative = normalize_relative_path(it->path().lexically_relative(root).generic_string());
        if (relative.empty()) continue;
        files.emplace_back(std::move(relative), it->path());
    }

    std::sort(files.begin(), files.end());

    std::string text;
    for (const auto& [relative, full] : files) {
        auto digest = sha256_file(full);
        if (!digest) {
            return std::unexpected(digest.error());
        }
        text += relative;
        text += ',';
        text += *digest;
        text += '\n';
    }
    return text;
}

} // namespace patchsync::core
