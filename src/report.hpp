#pragma once

#include "batch.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace iopatch {

// 0x-prefixed, 16 hex digits
std::string formatId(uint64_t id);

const char* toString(Severity severity);

// Comma-separated container names; a name held by several containers gets its
// .utoc path in parentheses
std::string describeContainers(const std::vector<PackageRef>& refs);

// Human-readable batch summary: reassignments, failures, warnings and shared package ids
void renderReport(const BatchReport& report, std::ostream& out);

} // namespace iopatch
