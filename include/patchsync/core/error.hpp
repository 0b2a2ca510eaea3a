// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace patchsync::core {

enum class SyncErrc {
    success = 0,
    malformed_manifest,
    manifest_unavailable,
    network_transient,
    transfer_failed,
    range_unsupported,
    integrity_mismatch,
    http_error,
    not_found,
    stall_detected,
    invalid_url,
    invalid_range,
    invalid_config,
    cancelled,
    already_claimed,
};

namespace detail {

struct SyncErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "patchsync::sync";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<SyncErrc>(ev)) {
            case SyncErrc::success:              return "Success";
            case SyncErrc::malformed_manifest:   return "Malformed manifest";
            case SyncErrc::manifest_unavailable: return "Manifest could not be fetched";
            case SyncErrc::network_transient:    return "Transient network error";
            case SyncErrc::transfer_failed:      return "Transfer failed after retries";
            case SyncErrc::range_unsupported:    return "Server ignored the range request";
            case SyncErrc::integrity_mismatch:   return "Content hash mismatch";
            case SyncErrc::http_error:           return "HTTP error";
            case SyncErrc::not_found:            return "Resource not found (404)";
            case SyncErrc::stall_detected:       return "Transfer stalled";
            case SyncErrc::invalid_url:          return "Invalid URL";
            case SyncErrc::invalid_range:        return "Invalid byte range";
            case SyncErrc::invalid_config:       return "Invalid configuration";
            case SyncErrc::cancelled:            return "Cancelled";
            case SyncErrc::already_claimed:      return "Path already claimed by another worker";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::SyncErrcCategory& sync_errc_category() noexcept {
    static detail::SyncErrcCategory category;
    return category;
}

inline std::error_code make_error_code(SyncErrc e) noexcept {
    return {static_cast<int>(e), sync_errc_category()};
}

} // namespace patchsync::core

namespace std {

template<>
struct is_error_code_enum<patchsync::core::SyncErrc> : true_type {};

} // namespace std

namespace patchsync::core {

// Errors worth another attempt on the same byte range
[[nodiscard]] inline bool is_transient(const std::error_code& ec) noexcept {
    return ec == SyncErrc::network_transient || ec == SyncErrc::stall_detected;
}

} // namespace patchsync::core
