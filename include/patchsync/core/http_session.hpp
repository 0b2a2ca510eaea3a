// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/config.hpp>
#include <patchsync/core/transport.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace patchsync::core {

struct HttpOptions {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};   // No bytes for this long aborts
    std::string user_agent;                               // Empty: library default
};

// libcurl transport. Every call runs on its own easy handle, so one session
// can serve all workers and sub-ranges at once.
class HttpSession final : public Transport {
public:
    explicit HttpSession(HttpOptions options = {});
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<RemoteInfo, std::error_code>
    head(const std::string& url, std::stop_token stop) override;

    [[nodiscard]] std::expected<std::string, std::error_code>
    get_text(const std::string& url, std::stop_token stop) override;

    [[nodiscard]] std::error_code
    fetch(const FetchRequest& request,
          const HeadHandler& on_head,
          const BodyHandler& on_body,
          std::stop_token stop) override;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Map an HTTP status >= 400 to an error
    [[nodiscard]] static std::error_code status_error(long http_code) noexcept;

    // Parse "bytes a-b/total" (total may be '*')
    struct ContentRange {
        std::uint64_t first{0};
        std::uint64_t last{0};
        std::optional<std::uint64_t> total;
    };
    [[nodiscard]] static std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

private:
    HttpOptions options_;
};

} // namespace patchsync::core
