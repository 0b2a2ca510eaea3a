// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/status_report.hpp>
#include <nlohmann/json.hpp>

namespace patchsync::core {

std::string StatusReport::to_json(int indent) const {
    nlohmann::ordered_json j;
    j["updated"] = updated;
    j["skipped"] = skipped;
    j["failed"] = failed;
    j["verification"]["verified"] = verification.verified;
    j["verification"]["corrupted"] = verification.corrupted;
    j["removed"] = removed;
    j["errors"] = errors;
    j["cancelled"] = cancelled;
    return j.dump(indent);
}

} // namespace patchsync::core
