// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/hasher.hpp>
#include <patchsync/core/config.hpp>
#include <patchsync/disk/error.hpp>

#include <openssl/evp.h>

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace patchsync::core {

namespace {

std::string to_hex(const unsigned char* data, std::size_t size) {
    static constexpr char HEX_DIGITS[] = "0123456789abcdef";
    std::string result(size * 2, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        result[2 * i] = HEX_DIGITS[(data[i] >> 4) & 0x0F];
        result[2 * i + 1] = HEX_DIGITS[data[i] & 0x0F];
    }
    return result;
}

} // namespace

struct Sha256::Context {
    EVP_MD_CTX* md{nullptr};

    Context() : md(EVP_MD_CTX_new()) {
        if (!md || EVP_DigestInit_ex(md, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(md);
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }
    ~Context() { EVP_MD_CTX_free(md); }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
};

Sha256::Sha256() : ctx_(std::make_unique<Context>()) {}
Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

void Sha256::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(ctx_->md, data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

void Sha256::update(std::string_view data) {
    update(std::as_bytes(std::span<const char>(data.data(), data.size())));
}

std::string Sha256::finish() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_->md, digest, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return to_hex(digest, length);
}

std::string sha256_hex(std::string_view data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finish();
}

std::expected<std::string, std::error_code>
sha256_file(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            std::error_code ec;
            return std::unexpected(std::filesystem::exists(path, ec)
                ? make_error_code(disk::DiskErrc::access_denied)
                : make_error_code(disk::DiskErrc::file_not_found));
        }

        Sha256 hasher;
        std::vector<char> buffer(READ_BUFFER_SIZE);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto count = static_cast<std::size_t>(file.gcount());
            if (count > 0) {
                hasher.update(std::string_view(buffer.data(), count));
            }
        }
        if (file.bad()) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }
        return hasher.finish();
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::allocation_failed));
    } catch (const std::runtime_error&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

bool is_sha256_hex(std::string_view text) noexcept {
    if (text.size() != SHA256_HEX_LENGTH) return false;
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace patchsync::core
