#include "report.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace iopatch {

std::string formatId(uint64_t id)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setw(16) << std::setfill('0') << id;
    return oss.str();
}

const char* toString(Severity severity)
{
    switch (severity) {
        case Severity::Notice:   return "note";
        case Severity::Warning:  return "warning";
        case Severity::Critical: return "CRITICAL";
    }
    return "?";
}

std::string describeContainers(const std::vector<PackageRef>& refs)
{
    std::string out;
    for (const auto& ref : refs) {
        if (!out.empty()) out += ", ";
        out += ref.container;

        auto sameName = std::count_if(refs.begin(), refs.end(),
                                      [&ref](const PackageRef& other) { return other.container == ref.container; });
        if (sameName > 1) {
            out += " (" + ref.tocPath.string() + ")";
        }
    }
    return out;
}

void renderReport(const BatchReport& report, std::ostream& out)
{
    out << "Processed " << report.processedCount() << " container(s): "
        << report.reassignments.size() << " reassigned, "
        << report.failedCount() << " failed\n";

    if (!report.reassignments.empty()) {
        out << "\nReassigned container ids:\n";
        for (const auto& r : report.reassignments) {
            out << "  " << r.name << ": " << formatId(r.oldId) << " -> " << formatId(r.newId) << "\n";
        }
    }

    bool anyFailed = false;
    for (const auto& c : report.containers) {
        if (!c.failed()) continue;
        if (!anyFailed) {
            out << "\nSkipped (files left untouched):\n";
            anyFailed = true;
        }
        out << "  " << c.name << " [" << toString(c.status) << "]: " << c.error << "\n";
    }

    bool anyWarning = false;
    for (const auto& c : report.containers) {
        for (const auto& w : c.warnings) {
            if (!anyWarning) {
                out << "\nWarnings:\n";
                anyWarning = true;
            }
            out << "  [" << toString(w.severity) << "] " << c.name << ": " << w.message << "\n";
        }
    }

    auto shared = report.packageIds.shared();
    if (!shared.empty()) {
        out << "\nPackage ids referenced by more than one container (not rewritten):\n";
        for (const auto& [id, refs] : shared) {
            out << "  " << formatId(id) << ": " << describeContainers(refs) << "\n";
        }
    }
}

} // namespace iopatch
