// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace patchsync::core {

// One expected file: "relative/path,<sha256 hex>"
struct ManifestEntry {
    std::string relative_path;   // '/'-separated, never absolute, no ".."
    std::string expected_hash;   // 64 lowercase hex digits
};

// A line that was rejected or overridden while parsing
struct ManifestIssue {
    std::size_t line_number{0};  // 1-based
    std::string line;
    std::string reason;
};

enum class ManifestPolicy : std::uint8_t {
    skip_invalid,  // Drop malformed lines, record them in issues
    strict,        // First malformed line fails the whole parse
};

struct ManifestError {
    std::error_code code;
    std::size_t line_number{0};
    std::string detail;
};

class Manifest {
public:
    [[nodiscard]] const std::vector<ManifestEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] const std::vector<ManifestIssue>& issues() const noexcept { return issues_; }

    // Lines that redefined an earlier path (the later digest won)
    [[nodiscard]] const std::vector<ManifestIssue>& duplicates() const noexcept { return duplicates_; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    // O(1) lookup; nullptr if the path is not listed
    [[nodiscard]] const ManifestEntry* find(std::string_view relative_path) const;

    // Declaration index of a path, or size() if absent
    [[nodiscard]] std::size_t index_of(std::string_view relative_path) const;

    // Add or override an entry. A repeated path keeps its first position
    // and takes the new digest. Returns true if the path was new.
    bool upsert(ManifestEntry entry);

private:
    friend std::expected<Manifest, ManifestError> parse_manifest(std::string_view, ManifestPolicy);

    std::vector<ManifestEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<ManifestIssue> issues_;
    std::vector<ManifestIssue> duplicates_;
};

// Parse manifest text. Blank lines are ignored, whitespace is trimmed,
// CRLF is accepted.
[[nodiscard]] std::expected<Manifest, ManifestError>
parse_manifest(std::string_view text, ManifestPolicy policy = ManifestPolicy::skip_invalid);

// Validate and normalise a manifest path. Returns an empty string if the path
// is empty, absolute or escapes the root.
[[nodiscard]] std::string normalize_relative_path(std::string_view path);

// Build manifest text for every regular file below root, sorted by path
[[nodiscard]] std::expected<std::string, std::error_code>
generate_manifest(const std::filesystem::path& root);

} // namespace patchsync::core
