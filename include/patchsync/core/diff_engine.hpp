// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/local_state.hpp>
#include <patchsync/core/manifest.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchsync::core {

enum class WorkKind : std::uint8_t {
    download,   // Missing or different locally
    skip,       // Hash already matches
    remove,     // Local file not listed in the manifest
};

[[nodiscard]] std::string_view to_string(WorkKind kind) noexcept;

struct WorkItem {
    WorkKind kind{WorkKind::download};
    std::string relative_path;
    std::string expected_hash;                 // Empty for remove
    std::size_t manifest_index{0};             // Removes are numbered after the manifest
    std::uint64_t local_size{0};
    std::optional<std::uint64_t> remote_size;
};

struct WorkPlan {
    std::vector<WorkItem> items;   // Manifest order, removes last

    [[nodiscard]] std::size_t count(WorkKind kind) const noexcept;
};

// Remote size lookup for a manifest path. nullopt when unknown.
using RemoteSizeProbe = std::function<std::optional<std::uint64_t>(const ManifestEntry&)>;

struct DiffOptions {
    bool delete_extraneous{false};
    RemoteSizeProbe probe;         // Optional, only asked about files that exist
};

class DiffEngine {
public:
    explicit DiffEngine(DiffOptions options = {});

    [[nodiscard]] WorkPlan plan(const Manifest& manifest, LocalStateScanner& scanner) const;

private:
    [[nodiscard]] WorkItem classify(const ManifestEntry& entry, std::size_t index,
                                    LocalFileRecord& record, LocalStateScanner& scanner) const;

    DiffOptions options_;
};

} // namespace patchsync::core
