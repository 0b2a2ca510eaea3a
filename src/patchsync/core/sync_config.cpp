// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/sync_config.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/core/url.hpp>
#include <patchsync/disk/error.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <sstream>

namespace patchsync::core {

namespace {

constexpr std::array LOG_LEVELS{"trace", "debug", "info", "warning", "warn", "error", "critical", "off"};

std::error_code invalid(std::string_view what) {
    logger()->error("Invalid configuration: {}", what);
    return make_error_code(SyncErrc::invalid_config);
}

// Read an unsigned integer that must fit T
template<typename T>
bool read_unsigned(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return true;
    const auto& value = j[key];
    if (!value.is_number_unsigned()) return false;
    auto v = value.get<std::uint64_t>();
    if (v > std::numeric_limits<T>::max()) return false;
    out = static_cast<T>(v);
    return true;
}

bool read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) return false;
    out = j[key].get<bool>();
    return true;
}

bool read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) return false;
    out = j[key].get<std::string>();
    return true;
}

} // namespace

std::error_code SyncConfig::validate() const {
    auto base = Url::parse(server_base_url);
    if (!base || !base->is_directory()) {
        return invalid("serverBaseUrl must be an http(s) URL ending in '/'");
    }
    if (!Url::parse(file_list_url)) {
        return invalid("fileListUrl is not a valid URL");
    }
    if (target_folder.empty()) {
        return invalid("targetFolder is empty");
    }
    // The limiter works in bytes per second
    if (download_speed_limit_kbs > std::numeric_limits<std::uint64_t>::max() / 1024) {
        return invalid("downloadSpeedLimitKBs is too large");
    }
    if (multithreading_threshold_bytes == 0) {
        return invalid("multithreadingThresholdBytes must be positive");
    }
    if (progress_max_age_sec == 0) {
        return invalid("progressMaxAgeSeconds must be positive");
    }
    if (worker_count == 0 || range_workers == 0) {
        return invalid("workerCount and rangeWorkers must be positive");
    }
    if (stall_timeout_sec == 0 || connect_timeout_sec == 0) {
        return invalid("timeouts must be positive");
    }
    if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), log_level) == LOG_LEVELS.end()) {
        return invalid("unknown logLevel");
    }
    return {};
}

std::expected<SyncConfig, std::error_code> parse_config(std::string_view json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        logger()->error("Configuration is not valid JSON: {}", e.what());
        return std::unexpected(make_error_code(SyncErrc::invalid_config));
    }
    if (!j.is_object()) {
        return std::unexpected(invalid("top level must be an object"));
    }

    SyncConfig config;
    std::string target;
    std::string log_file;

    const bool ok =
        read_string(j, "serverBaseUrl", config.server_base_url) &&
        read_string(j, "targetFolder", target) &&
        read_string(j, "fileListUrl", config.file_list_url) &&
        read_unsigned(j, "downloadSpeedLimitKBs", config.download_speed_limit_kbs) &&
        read_unsigned(j, "multithreadingThresholdBytes", config.multithreading_threshold_bytes) &&
        read_unsigned(j, "progressMaxAgeSeconds", config.progress_max_age_sec) &&
        read_unsigned(j, "workerCount", config.worker_count) &&
        read_unsigned(j, "rangeWorkers", config.range_workers) &&
        read_unsigned(j, "retryCount", config.retry_count) &&
        read_unsigned(j, "stallTimeoutSeconds", config.stall_timeout_sec) &&
        read_unsigned(j, "connectTimeoutSeconds", config.connect_timeout_sec) &&
        read_bool(j, "deleteExtraneous", config.delete_extraneous) &&
        read_bool(j, "strictManifest", config.strict_manifest) &&
        read_bool(j, "probeRemoteSizes", config.probe_remote_sizes) &&
        read_string(j, "logFile", log_file) &&
        read_string(j, "logLevel", config.log_level);
    if (!ok) {
        return std::unexpected(invalid("a field has the wrong type or is out of range"));
    }

    for (const char* required : {"serverBaseUrl", "targetFolder", "fileListUrl"}) {
        if (!j.contains(required)) {
            return std::unexpected(invalid(std::string("missing ") + required));
        }
    }

    config.target_folder = target;
    if (!log_file.empty()) {
        config.log_file = log_file;
    }

    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return config;
}

std::expected<SyncConfig, std::error_code> load_config(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        logger()->error("Cannot open configuration file {}", path.string());
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_config(contents.str());
}

} // namespace patchsync::core
