// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/progress_store.hpp>
#include <patchsync/core/hasher.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/disk/error.hpp>
#include <patchsync/version.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace patchsync::core {

namespace fs = std::filesystem;

bool ProgressRecord::valid() const noexcept {
    if (bytes_confirmed > total_bytes) return false;
    for (const auto& range : ranges) {
        if (range.downloaded > range.size) return false;
        if (range.offset >= total_bytes || range.size > total_bytes - range.offset) return false;
    }
    return true;
}

std::string to_json_text(const ProgressRecord& record) {
    nlohmann::json j;
    j["format"] = PROGRESS_RECORD_FORMAT;
    j["path"] = record.relative_path;
    j["bytesConfirmed"] = record.bytes_confirmed;
    j["totalBytes"] = record.total_bytes;
    j["lastUpdated"] = record.last_updated;

    if (!record.ranges.empty()) {
        auto& ranges = j["ranges"] = nlohmann::json::array();
        for (const auto& range : record.ranges) {
            ranges.push_back({{"offset", range.offset},
                              {"size", range.size},
                              {"downloaded", range.downloaded}});
        }
    }
    return j.dump();
}

std::expected<ProgressRecord, std::error_code> from_json_text(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        if (j.value("format", PROGRESS_RECORD_FORMAT) != PROGRESS_RECORD_FORMAT) {
            logger()->debug("Progress record format {} is not {}", j["format"].dump(), PROGRESS_RECORD_FORMAT);
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }

        ProgressRecord record;
        record.relative_path = j.at("path").get<std::string>();
        record.bytes_confirmed = j.at("bytesConfirmed").get<std::uint64_t>();
        record.total_bytes = j.at("totalBytes").get<std::uint64_t>();
        record.last_updated = j.at("lastUpdated").get<std::int64_t>();

        if (j.contains("ranges") && j["ranges"].is_array()) {
            for (const auto& r : j["ranges"]) {
                record.ranges.push_back({r.at("offset").get<std::uint64_t>(),
                                         r.at("size").get<std::uint64_t>(),
                                         r.at("downloaded").get<std::uint64_t>()});
            }
        }
        return record;
    } catch (const nlohmann::json::exception& e) {
        logger()->debug("Unreadable progress record: {}", e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

//=============================================================================
// MemoryBackend
//=============================================================================

std::expected<std::optional<std::string>, std::error_code>
MemoryBackend::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::optional<std::string>{};
    return std::optional<std::string>{it->second};
}

std::error_code MemoryBackend::put(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    values_[key] = value;
    return {};
}

std::error_code MemoryBackend::erase(const std::string& key) {
    std::lock_guard lock(mutex_);
    values_.erase(key);
    return {};
}

std::size_t MemoryBackend::size() const {
    std::lock_guard lock(mutex_);
    return values_.size();
}

//=============================================================================
// FileBackend
//=============================================================================

FileBackend::FileBackend(fs::path directory)
    : directory_(std::move(directory)) {}

fs::path FileBackend::path_for(const std::string& key) const {
    return directory_ / (sha256_hex(key) + ".json");
}

std::expected<std::optional<std::string>, std::error_code>
FileBackend::get(const std::string& key) {
    auto path = path_for(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::optional<std::string>{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::access_denied));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
    return std::optional<std::string>{contents.str()};
}

std::error_code FileBackend::put(const std::string& key, const std::string& value) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return disk::from_errno(ec.value());
    }

    auto path = path_for(key);
    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::access_denied);
        }
        file << value;
        file.flush();
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
    }

    // Rename is atomic, a crash leaves either the old or the new record
    fs::rename(temp, path, ec);
    if (ec) {
        fs::remove(temp, ec);
        return make_error_code(disk::DiskErrc::rename_failed);
    }
    return {};
}

std::error_code FileBackend::erase(const std::string& key) {
    std::error_code ec;
    fs::remove(path_for(key), ec);
    return ec ? disk::from_errno(ec.value()) : std::error_code{};
}

//=============================================================================
// ProgressStore
//=============================================================================

std::int64_t system_unix_time() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

ProgressStore::ProgressStore(std::shared_ptr<KeyValueBackend> backend,
                             std::chrono::seconds max_age,
                             UnixClock clock)
    : backend_(std::move(backend))
    , max_age_(max_age)
    , clock_(std::move(clock)) {}

std::optional<ProgressRecord> ProgressStore::load(const std::string& relative_path) {
    auto stored = backend_->get(relative_path);
    if (!stored) {
        logger()->warn("Cannot read progress for {}: {}", relative_path, stored.error().message());
        return std::nullopt;
    }
    if (!stored->has_value()) {
        return std::nullopt;
    }

    auto discard = [&](std::string_view why) {
        logger()->warn("Discarding progress for {}: {}", relative_path, why);
        if (auto ec = backend_->erase(relative_path)) {
            logger()->warn("Cannot erase progress for {}: {}", relative_path, ec.message());
        }
    };

    auto record = from_json_text(**stored);
    if (!record) {
        discard("unreadable record");
        return std::nullopt;
    }
    if (record->relative_path != relative_path || !record->valid()) {
        discard("inconsistent record");
        return std::nullopt;
    }
    if (now() - record->last_updated > max_age_.count()) {
        discard("record is stale");
        return std::nullopt;
    }
    return *record;
}

std::error_code ProgressStore::save(ProgressRecord record) {
    record.last_updated = now();
    if (!record.valid()) {
        return make_error_code(SyncErrc::invalid_range);
    }
    return backend_->put(record.relative_path, to_json_text(record));
}

std::error_code ProgressStore::save(const std::string& relative_path,
                                    std::uint64_t bytes_confirmed,
                                    std::uint64_t total_bytes) {
    ProgressRecord record;
    record.relative_path = relative_path;
    record.bytes_confirmed = bytes_confirmed;
    record.total_bytes = total_bytes;
    return save(std::move(record));
}

std::error_code ProgressStore::clear(const std::string& relative_path) {
    return backend_->erase(relative_path);
}

} // namespace patchsync::core
