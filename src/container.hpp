#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace iopatch {

enum class Severity {
    Notice,     // Informational, nothing at risk
    Warning,    // Result may not load as intended
    Critical    // Files left inconsistent with each other
};

struct Warning {
    Severity severity;
    std::string message;
};

// One .utoc/.ucas pair as seen by the resolver
struct Container {
    std::string name;                   // File stem
    uint64_t oldId = 0;                 // Container id found on disk
    uint64_t newId = 0;                 // Replacement id, 0 if unchanged
    std::vector<uint64_t> packageIds;   // Non-header chunk ids, in table order

    bool reassigned() const { return newId != 0; }
};

} // namespace iopatch
