#include "batch.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "toc_document.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace iopatch {

const char* toString(FileStatus status)
{
    switch (status) {
        case FileStatus::Unchanged:        return "unchanged";
        case FileStatus::Reassigned:       return "reassigned";
        case FileStatus::FormatError:      return "format error";
        case FileStatus::TruncatedFile:    return "truncated file";
        case FileStatus::ConsistencyError: return "consistency error";
        case FileStatus::IoError:          return "I/O error";
    }
    return "unknown";
}

bool ContainerReport::hasCritical() const
{
    return std::any_of(warnings.begin(), warnings.end(),
                       [](const Warning& w) { return w.severity == Severity::Critical; });
}

void PackageIdIndex::add(uint64_t id, const std::string& container, const std::filesystem::path& tocPath)
{
    auto [it, inserted] = refs.try_emplace(id);
    if (inserted) {
        order.push_back(id);
    }
    auto& list = it->second;
    auto same = [&tocPath](const PackageRef& ref) { return ref.tocPath == tocPath; };
    if (std::none_of(list.begin(), list.end(), same)) {
        list.push_back({container, tocPath});
    }
}

const std::vector<PackageRef>& PackageIdIndex::containersFor(uint64_t id) const
{
    static const std::vector<PackageRef> none;
    auto it = refs.find(id);
    return it == refs.end() ? none : it->second;
}

std::vector<std::pair<uint64_t, std::vector<PackageRef>>> PackageIdIndex::shared() const
{
    std::vector<std::pair<uint64_t, std::vector<PackageRef>>> result;
    for (uint64_t id : order) {
        const auto& list = refs.at(id);
        if (list.size() > 1) {
            result.emplace_back(id, list);
        }
    }
    return result;
}

size_t BatchReport::failedCount() const
{
    return static_cast<size_t>(std::count_if(containers.begin(), containers.end(),
                                             [](const ContainerReport& c) { return c.failed(); }));
}

size_t BatchReport::criticalCount() const
{
    return static_cast<size_t>(std::count_if(containers.begin(), containers.end(),
                                             [](const ContainerReport& c) { return c.hasCritical(); }));
}

std::vector<uint8_t> readFile(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Could not open file: " + path.string());
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IoError("Could not read file: " + path.string());
    }
    return bytes;
}

BatchCoordinator::BatchCoordinator(IdRegistry& registry, BatchOptions options)
    : resolver(registry, ResolveOptions{options.forceReassign})
{
}

const BatchReport& BatchCoordinator::run(const std::vector<FilePair>& pairs)
{
    int current = 0;
    const int total = static_cast<int>(pairs.size());
    for (const auto& pair : pairs) {
        process(pair);
        log_progress("Processing", ++current, total);
    }
    return report_;
}

const ContainerReport& BatchCoordinator::process(const FilePair& pair)
{
    ContainerReport entry;
    entry.name = pair.tocPath.stem().string();
    entry.files = pair;

    log_message(LogLevel::Debug, "Parsing %s", pair.tocPath.string().c_str());

    try {
        auto image = readFile(pair.tocPath);
        auto doc = TocDocument::parse(image);
        entry.oldId = doc.containerId();
        log_message(LogLevel::Debug, "%s: %llu bytes, %zu entries, %zu blocks, %zu compression method(s)",
                    entry.name.c_str(), static_cast<unsigned long long>(doc.fileSize()),
                    doc.entryCount(), doc.compressedBlocks().size(), doc.compressionMethods().size());

        auto resolution = resolver.resolve(doc, entry.name);
        entry.warnings = resolution.warnings;

        if (resolution.reassigned()) {
            auto patched = patcher.apply(pair.tocPath, resolution.tocWrites,
                                         pair.bulkPath, resolution.bulkWrites);
            entry.warnings.insert(entry.warnings.end(), patched.warnings.begin(), patched.warnings.end());
            entry.newId = resolution.container.newId;
            entry.status = FileStatus::Reassigned;
            report_.reassignments.push_back({entry.name, entry.oldId, entry.newId});
            log_message(LogLevel::Debug, "%s: container id %016llx -> %016llx, .ucas copy at offset %llu",
                        entry.name.c_str(),
                        static_cast<unsigned long long>(entry.oldId),
                        static_cast<unsigned long long>(entry.newId),
                        static_cast<unsigned long long>(resolution.bulkOffset));
        } else {
            entry.status = FileStatus::Unchanged;
            log_message(LogLevel::Debug, "%s: no collision", entry.name.c_str());
        }

        for (uint64_t id : resolution.container.packageIds) {
            report_.packageIds.add(id, entry.name, pair.tocPath);
        }
    } catch (const TruncatedFileError& e) {
        entry.status = FileStatus::TruncatedFile;
        entry.error = e.what();
    } catch (const FormatError& e) {
        entry.status = FileStatus::FormatError;
        entry.error = e.what();
    } catch (const ConsistencyError& e) {
        entry.status = FileStatus::ConsistencyError;
        entry.error = e.what();
    } catch (const IoError& e) {
        entry.status = FileStatus::IoError;
        entry.error = e.what();
    }

    if (entry.failed()) {
        log_message(LogLevel::Error, "%s skipped (%s): %s",
                    entry.name.c_str(), toString(entry.status), entry.error.c_str());
    }
    for (const auto& warning : entry.warnings) {
        if (warning.severity == Severity::Critical) {
            log_message(LogLevel::Error, "%s: %s", entry.name.c_str(), warning.message.c_str());
        }
    }

    report_.containers.push_back(std::move(entry));
    return report_.containers.back();
}

} // namespace iopatch
