#include "collision_resolver.hpp"
#include "binary_layout.hpp"
#include "errors.hpp"
#include <sstream>
#include <unordered_set>

using namespace iostore;

namespace iopatch {

Resolution CollisionResolver::resolve(TocDocument& doc, const std::string& name)
{
    Resolution resolution;
    resolution.container.name = name;
    resolution.container.oldId = doc.containerId();

    const uint64_t containerId = doc.containerId();
    if (!options.forceReassign && !registry.isClaimed(IdScope::Container, containerId)) {
        registry.markSeen(IdScope::Container, containerId);
    } else {
        planReassignment(doc, resolution);
    }

    collectPackageIds(doc, resolution);
    addFormatNotes(doc, resolution);
    return resolution;
}

void CollisionResolver::planReassignment(TocDocument& doc, Resolution& resolution)
{
    const uint64_t oldId = doc.containerId();

    auto index = doc.findEntry(oldId, CONTAINER_HEADER_TAG);
    if (!index) {
        std::ostringstream oss;
        oss << "No container-header entry (type " << static_cast<int>(CONTAINER_HEADER_TAG)
            << ") carries container id 0x" << std::hex << oldId;
        throw ConsistencyError(oss.str());
    }

    // Locate the .ucas copy before claiming, so a bad block table leaves the
    // registry untouched
    const DataLocation location = doc.dataLocation(*index);
    const uint64_t bulkOffset = doc.physicalOffsetFor(location.offset);
    const CompressedBlock& block = doc.compressedBlocks()[location.offset / doc.header().compression_block_size];

    const uint64_t newId = registry.claim(IdScope::Container);
    const auto bytes = encodeUint64Le(newId);

    resolution.tocWrites.push_back({TOC_CONTAINER_ID_OFFSET, bytes});
    resolution.tocWrites.push_back({doc.entryOffset(*index), bytes});
    resolution.bulkWrites.push_back({bulkOffset, bytes});
    resolution.bulkOffset = bulkOffset;

    doc.setContainerId(newId);
    doc.setEntryId(*index, newId);
    resolution.container.newId = newId;

    if (location.length < ID_SIZE) {
        resolution.warnings.push_back({
            Severity::Warning,
            "Container header chunk is only " + std::to_string(location.length) +
                " bytes; the bulk-data id copy extends past it"
        });
    }
    if (block.compressionMethod != 0) {
        resolution.warnings.push_back({
            Severity::Warning,
            "Container header block uses compression method '" +
                doc.compressionMethodName(block.compressionMethod) +
                "'; the bulk-data id copy was written into compressed bytes"
        });
    }
}

void CollisionResolver::collectPackageIds(const TocDocument& doc, Resolution& resolution)
{
    std::unordered_set<uint64_t> seen;
    for (const auto& entry : doc.entries()) {
        if (entry.is_container_header()) {
            continue;
        }
        const uint64_t id = entry.id;
        registry.markSeen(IdScope::Chunk, id);
        if (seen.insert(id).second) {
            resolution.container.packageIds.push_back(id);
        }
    }
}

void CollisionResolver::addFormatNotes(const TocDocument& doc, Resolution& resolution)
{
    if (doc.isEncrypted()) {
        resolution.warnings.push_back({
            Severity::Notice,
            "Container is encrypted; only the table of contents was inspected"
        });
    }
    if (doc.hasPerfectHashTables()) {
        resolution.warnings.push_back({
            Severity::Warning,
            "Perfect-hash tables present; the compressed block table is assumed to follow the data locations directly"
        });
    }
}

} // namespace iopatch
