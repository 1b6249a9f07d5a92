#pragma once

#include "container.hpp"
#include "id_registry.hpp"
#include "patcher.hpp"
#include "toc_document.hpp"
#include <string>
#include <vector>

namespace iopatch {

struct ResolveOptions {
    // Reassign even when the id has not been seen before
    bool forceReassign = false;
};

// Everything the patcher needs for one file, plus what the report shows
struct Resolution {
    Container container;
    std::vector<PatchWrite> tocWrites;
    std::vector<PatchWrite> bulkWrites;
    std::vector<Warning> warnings;
    uint64_t bulkOffset = 0;   // Physical offset of the .ucas id copy, if reassigned

    bool reassigned() const { return container.reassigned(); }
};

/**
 * Decides whether a container id collides with the batch so far and plans
 * the rewrite.
 *
 * Unseen ids are recorded and left alone. A colliding (or forced) id gets a
 * fresh value, which is written to:
 *   - the header's container id field
 *   - the identifier of the container-header entry (type 10)
 *   - the first 8 bytes of that entry's payload in the .ucas file
 *
 * Chunk ids of all other entries are collected for the batch report but never
 * rewritten: they are referenced from inside the payload, which is not parsed.
 */
class CollisionResolver
{
private:
    IdRegistry& registry;
    ResolveOptions options;

    void planReassignment(TocDocument& doc, Resolution& resolution);
    void collectPackageIds(const TocDocument& doc, Resolution& resolution);
    void addFormatNotes(const TocDocument& doc, Resolution& resolution);

public:
    explicit CollisionResolver(IdRegistry& registry, ResolveOptions options = {})
        : registry(registry), options(options) {}

    /**
     * Resolve one parsed document. On success the registry holds the
     * container's final id and the document reflects the planned writes.
     * @throws ConsistencyError if the document cannot be patched safely;
     *         the registry gains no new claim in that case
     * @throws AllocationExhausted if no fresh id can be generated
     */
    Resolution resolve(TocDocument& doc, const std::string& name);
};

} // namespace iopatch
