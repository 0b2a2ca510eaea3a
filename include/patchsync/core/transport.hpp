// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <stop_token>
#include <string>

namespace patchsync::core {

// Result of a HEAD request
struct RemoteInfo {
    std::int32_t status_code{0};
    std::optional<std::uint64_t> content_length;
};

// What the server answered before the first body byte
struct ResponseHead {
    std::int32_t status_code{0};
    bool partial{false};                      // 206 (or a protocol that honours ranges)
    std::uint64_t range_start{0};             // Content-Range start when partial
    std::optional<std::uint64_t> total_size;  // Full resource size if the server told us
};

// Byte range request. No Range header is sent for offset 0 with no last byte.
struct FetchRequest {
    std::string url;
    std::uint64_t offset{0};
    std::optional<std::uint64_t> last_byte;   // Inclusive

    [[nodiscard]] bool wants_range() const noexcept { return offset > 0 || last_byte.has_value(); }
};

// Returning an error from either handler aborts the transfer with that error
using HeadHandler = std::function<std::error_code(const ResponseHead&)>;
using BodyHandler = std::function<std::error_code(std::span<const std::byte>)>;

// Range-capable transfer interface. Implementations must be safe to call from
// several threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::expected<RemoteInfo, std::error_code>
    head(const std::string& url, std::stop_token stop) = 0;

    // Whole body as text (manifest download)
    [[nodiscard]] virtual std::expected<std::string, std::error_code>
    get_text(const std::string& url, std::stop_token stop) = 0;

    // Stream a body. on_head runs once before the first body byte (or at the end
    // for an empty body); on_body receives the bytes in order.
    [[nodiscard]] virtual std::error_code
    fetch(const FetchRequest& request,
          const HeadHandler& on_head,
          const BodyHandler& on_body,
          std::stop_token stop) = 0;
};

} // namespace patchsync::core
