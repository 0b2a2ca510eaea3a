// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/log.hpp>
#include <patchsync/disk/error.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>
#include <vector>

namespace patchsync::core {

namespace {

constexpr const char* LOGGER_NAME = "patchsync";
constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S - %l - %v";

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks) {
    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    log->set_pattern(LOG_PATTERN);
    log->set_level(spdlog::level::info);
    log->flush_on(spdlog::level::warn);
    return log;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock(logger_mutex());
    auto& slot = logger_slot();
    if (!slot) {
        slot = make_logger({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()});
    }
    return slot;
}

std::error_code init_logging(const std::optional<std::filesystem::path>& log_file,
                             std::string_view level,
                             bool console) {
    std::vector<spdlog::sink_ptr> sinks;
    if (console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    std::error_code result;
    if (log_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false));
        } catch (const spdlog::spdlog_ex&) {
            result = make_error_code(disk::DiskErrc::access_denied);
        }
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto log = make_logger(std::move(sinks));
    log->set_level(spdlog::level::from_str(std::string(level)));

    std::lock_guard lock(logger_mutex());
    logger_slot() = std::move(log);
    return result;
}

} // namespace patchsync::core
