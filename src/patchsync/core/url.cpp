// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace patchsync::core {

namespace {

bool is_unreserved(unsigned char c) noexcept {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(SyncErrc::invalid_url));
    }

    try {
        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }
        if (url.scheme_ != "http" && url.scheme_ != "https" && url.scheme_ != "file") {
            return std::unexpected(make_error_code(SyncErrc::invalid_url));
        }

        auto rest_start = scheme_end + 3;

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) path_start = url_str.length();

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) query_start = url_str.length();

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) fragment_start = url_str.length();

        auto host_end = std::min({path_start, query_start, fragment_start});

        // Skip user:pass@ in the authority
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto authority = url_str.substr(authority_start, host_end - authority_start);
        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(SyncErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
                url.port_ = std::string(authority.substr(bracket_end + 2));
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                url.host_ = std::string(authority.substr(0, colon));
                url.port_ = std::string(authority.substr(colon + 1));
            } else {
                url.host_ = std::string(authority);
            }
        }

        if (!url.port_.empty() &&
            !std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(SyncErrc::invalid_url));
        }

        if (path_start >= url_str.length() || path_start > std::min(query_start, fragment_start)) {
            url.path_ = "/";
        } else {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        }

        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        // file:// URLs carry no host
        if (url.host_.empty() && url.scheme_ != "file") {
            return std::unexpected(make_error_code(SyncErrc::invalid_url));
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    return url;
}

std::string Url::full() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ':';
        result += port_;
    }
    result += path_;
    if (!query_.empty()) {
        result += '?';
        result += query_;
    }
    return result;
}

std::expected<Url, std::error_code> Url::join(std::string_view relative_path) const {
    if (!is_directory() || relative_path.empty() || relative_path.front() == '/') {
        return std::unexpected(make_error_code(SyncErrc::invalid_url));
    }

    Url joined = *this;
    std::size_t pos = 0;
    while (pos <= relative_path.size()) {
        auto slash = relative_path.find('/', pos);
        if (slash == std::string_view::npos) slash = relative_path.size();
        joined.path_ += encode_path_segment(relative_path.substr(pos, slash - pos));
        if (slash < relative_path.size()) joined.path_ += '/';
        pos = slash + 1;
    }
    return joined;
}

std::string encode_path_segment(std::string_view segment) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (char ch : segment) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out += ch;
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

} // namespace patchsync::core
