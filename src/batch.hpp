#pragma once

#include "collision_resolver.hpp"
#include "container.hpp"
#include "id_registry.hpp"
#include "patcher.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace iopatch {

struct FilePair {
    std::filesystem::path tocPath;    // .utoc
    std::filesystem::path bulkPath;   // .ucas
};

enum class FileStatus {
    Unchanged,
    Reassigned,
    FormatError,
    TruncatedFile,
    ConsistencyError,
    IoError
};

const char* toString(FileStatus status);

struct ContainerReport {
    std::string name;
    FilePair files;
    FileStatus status = FileStatus::Unchanged;
    uint64_t oldId = 0;
    uint64_t newId = 0;                 // 0 unless reassigned
    std::vector<Warning> warnings;
    std::string error;                  // Set when the file was skipped

    bool failed() const {
        return status != FileStatus::Unchanged && status != FileStatus::Reassigned;
    }
    bool hasCritical() const;
};

struct Reassignment {
    std::string name;
    uint64_t oldId;
    uint64_t newId;
};

// One container referencing a package id
struct PackageRef {
    std::string container;              // Display name, the file stem
    std::filesystem::path tocPath;      // Identity; stems repeat across mod folders
};

/**
 * Package/chunk id -> containers referencing it.
 * Iterates in first-insertion order so reports are reproducible.
 */
class PackageIdIndex
{
private:
    std::vector<uint64_t> order;
    std::unordered_map<uint64_t, std::vector<PackageRef>> refs;

public:
    // Adds the container once per id, keyed by its .utoc path
    void add(uint64_t id, const std::string& container, const std::filesystem::path& tocPath);

    // Containers referencing `id`, empty if unknown
    const std::vector<PackageRef>& containersFor(uint64_t id) const;

    // Ids referenced by more than one container, in insertion order
    std::vector<std::pair<uint64_t, std::vector<PackageRef>>> shared() const;

    const std::vector<uint64_t>& ids() const { return order; }
    size_t size() const { return order.size(); }
};

struct BatchReport {
    std::vector<ContainerReport> containers;     // One per processed pair, in input order
    std::vector<Reassignment> reassignments;     // In processing order
    PackageIdIndex packageIds;

    size_t processedCount() const { return containers.size(); }
    size_t failedCount() const;
    size_t criticalCount() const;
};

struct BatchOptions {
    bool forceReassign = false;
};

/**
 * Processes file pairs strictly in the given order. The first file to carry
 * an id keeps it; later files with the same id are reassigned.
 *
 * Per-file errors are recorded in the report and the batch continues.
 * AllocationExhausted escapes run(); report() keeps what was done so far.
 */
class BatchCoordinator
{
private:
    CollisionResolver resolver;
    Patcher patcher;
    BatchReport report_;

public:
    BatchCoordinator(IdRegistry& registry, BatchOptions options = {});

    const BatchReport& run(const std::vector<FilePair>& pairs);

    // Parse, resolve and patch one pair. The result is appended to report();
    // the returned reference is valid until the next call.
    const ContainerReport& process(const FilePair& pair);

    const BatchReport& report() const { return report_; }
};

// Whole file as bytes
// @throws IoError
std::vector<uint8_t> readFile(const std::filesystem::path& path);

} // namespace iopatch
