// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace patchsync::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }

    [[nodiscard]] std::string full() const;

    // Path ends with '/', so relative paths can be appended
    [[nodiscard]] bool is_directory() const noexcept { return !path_.empty() && path_.back() == '/'; }

    // Append a '/'-separated relative path to a directory URL, percent-encoding
    // each segment. Fails with invalid_url if this URL is not a directory.
    [[nodiscard]] std::expected<Url, std::error_code> join(std::string_view relative_path) const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

// Percent-encode one path segment (RFC 3986 unreserved characters pass through)
[[nodiscard]] std::string encode_path_segment(std::string_view segment);

} // namespace patchsync::core
