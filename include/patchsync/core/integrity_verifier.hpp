// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <patchsync/core/progress_store.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

namespace patchsync::core {

enum class Verdict : std::uint8_t {
    verified,
    corrupted,
};

// Confirms a finished part file against the manifest digest and moves it into place
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(ProgressStore& store);

    // verified: the part file now sits at destination and the progress record is gone.
    // corrupted: the part file is deleted and the progress record cleared.
    // An error means the file could not be read or moved.
    [[nodiscard]] std::expected<Verdict, std::error_code>
    verify(const std::string& relative_path,
           const std::filesystem::path& part_path,
           const std::filesystem::path& destination,
           const std::string& expected_hash);

private:
    void forget(const std::string& relative_path);

    ProgressStore& store_;
};

} // namespace patchsync::core
