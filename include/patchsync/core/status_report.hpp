// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace patchsync::core {

struct VerificationReport {
    std::vector<std::string> verified;
    std::vector<std::string> corrupted;
};

// Outcome of one run. Every list is in manifest order.
struct StatusReport {
    std::vector<std::string> updated;
    std::vector<std::string> skipped;
    std::vector<std::string> failed;
    std::vector<std::string> removed;
    VerificationReport verification;
    std::map<std::string, std::string> errors;   // Failed path -> reason
    bool cancelled{false};

    [[nodiscard]] bool ok() const noexcept { return failed.empty() && !cancelled; }

    // {"updated": [...], "skipped": [...], "failed": [...],
    //  "verification": {"verified": [...], "corrupted": [...]}, ...}
    [[nodiscard]] std::string to_json(int indent = 4) const;
};

} // namespace patchsync::core
