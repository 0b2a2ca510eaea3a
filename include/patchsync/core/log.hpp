// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

namespace patchsync::core {

// Shared engine logger. Created on first use with a stderr sink.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Rebuild the engine logger with a stderr sink and, if given, a file sink.
// Returns an error if the log file cannot be opened; the stderr sink is kept.
[[nodiscard]] std::error_code init_logging(const std::optional<std::filesystem::path>& log_file,
                                           std::string_view level,
                                           bool console = true);

} // namespace patchsync::core
