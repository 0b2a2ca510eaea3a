// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace patchsync {

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 3;
    std::uint32_t patch = 0;

    constexpr auto operator<=>(const Version&) const = default;

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
} version;

constexpr std::string_view USER_AGENT = "patchsync/0.3";

// Bump when the layout of persisted progress records changes; records with
// another format are discarded and their files restart from byte 0
constexpr std::uint32_t PROGRESS_RECORD_FORMAT = 2;

} // namespace patchsync
