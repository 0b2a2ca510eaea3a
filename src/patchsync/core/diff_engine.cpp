// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/diff_engine.hpp>
#include <patchsync/core/log.hpp>

#include <algorithm>

namespace patchsync::core {

std::string_view to_string(WorkKind kind) noexcept {
    switch (kind) {
        case WorkKind::download: return "download";
        case WorkKind::skip:     return "skip";
        case WorkKind::remove:   return "remove";
    }
    return "unknown";
}

std::size_t WorkPlan::count(WorkKind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(items.begin(), items.end(),
        [kind](const WorkItem& item) { return item.kind == kind; }));
}

DiffEngine::DiffEngine(DiffOptions options)
    : options_(std::move(options)) {}

WorkItem DiffEngine::classify(const ManifestEntry& entry, std::size_t index,
                              LocalFileRecord& record, LocalStateScanner& scanner) const {
    WorkItem item;
    item.relative_path = entry.relative_path;
    item.expected_hash = entry.expected_hash;
    item.manifest_index = index;
    item.local_size = record.size_bytes;

    if (!record.exists) {
        logger()->debug("{}: missing locally", entry.relative_path);
        item.kind = WorkKind::download;
        return item;
    }

    if (options_.probe) {
        item.remote_size = options_.probe(entry);
    }
    if (item.remote_size && *item.remote_size != record.size_bytes) {
        logger()->debug("{}: size differs (local {}, remote {})",
                        entry.relative_path, record.size_bytes, *item.remote_size);
        item.kind = WorkKind::download;
        return item;
    }

    auto observed = scanner.hash(record);
    if (!observed) {
        item.kind = WorkKind::download;
        return item;
    }
    if (*observed == entry.expected_hash) {
        logger()->debug("{}: up to date", entry.relative_path);
        item.kind = WorkKind::skip;
    } else {
        logger()->debug("{}: content differs", entry.relative_path);
        item.kind = WorkKind::download;
    }
    return item;
}

WorkPlan DiffEngine::plan(const Manifest& manifest, LocalStateScanner& scanner) const {
    WorkPlan plan;
    auto records = scanner.scan(manifest);
    plan.items.reserve(records.size());

    const auto& entries = manifest.entries();
    for (std::size_t i = 0; i < entries.size(); ++i) {
        plan.items.push_back(classify(entries[i], i, records[i], scanner));
    }

    if (options_.delete_extraneous) {
        auto files = scanner.walk();
        if (!files) {
            logger()->error("Cannot list {} for extraneous files: {}",
                            scanner.root().string(), files.error().message());
        } else {
            std::size_t next_index = entries.size();
            for (auto& path : *files) {
                if (manifest.find(path)) continue;
                WorkItem item;
                item.kind = WorkKind::remove;
                item.local_size = scanner.stat(path).size_bytes;
                item.relative_path = std::move(path);
                item.manifest_index = next_index++;
                plan.items.push_back(std::move(item));
            }
        }
    }

    logger()->info("Plan: {} to download, {} up to date, {} to remove",
                   plan.count(WorkKind::download), plan.count(WorkKind::skip),
                   plan.count(WorkKind::remove));
    return plan;
}

} // namespace patchsync::core
