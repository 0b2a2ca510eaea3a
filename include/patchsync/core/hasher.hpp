// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/error.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace patchsync::core {

// Incremental SHA-256 (OpenSSL EVP)
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    void update(std::span<const std::byte> data);
    void update(std::string_view data);

    // Lowercase hex digest; the hasher cannot be updated afterwards
    [[nodiscard]] std::string finish();

private:
    struct Context;
    std::unique_ptr<Context> ctx_;
};

[[nodiscard]] std::string sha256_hex(std::string_view data);

// Hash a whole file, streaming in READ_BUFFER_SIZE blocks
[[nodiscard]] std::expected<std::string, std::error_code>
sha256_file(const std::filesystem::path& path) noexcept;

// 64 hex digits, either case
[[nodiscard]] bool is_sha256_hex(std::string_view text) noexcept;

} // namespace patchsync::core
