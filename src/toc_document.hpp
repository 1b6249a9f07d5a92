#pragma once

#include "iostore.hpp"
#include "binary_layout.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace iopatch {

/**
 * Parsed view of one .utoc file.
 *
 * Owns copies of the header and the three fixed-width tables. The trailing
 * tables (directory index, chunk metas, signatures) are only bounds-checked
 * where the header describes them and are never modified.
 */
class TocDocument
{
private:
    iostore::TocHeader header_;
    std::vector<iostore::TocChunkId> entries_;
    std::vector<DataLocation> dataLocations_;
    std::vector<CompressedBlock> compressedBlocks_;
    std::vector<std::string> compressionMethods_;
    uint64_t fileSize_ = 0;

    TocDocument() = default;

public:
    /**
     * Parse a complete .utoc image.
     * @throws FormatError on bad magic or unsupported record sizes
     * @throws TruncatedFileError if any table extends past `image.size()`
     */
    static TocDocument parse(const std::vector<uint8_t>& image);

    const iostore::TocHeader& header() const { return header_; }
    const std::vector<iostore::TocChunkId>& entries() const { return entries_; }
    const std::vector<DataLocation>& dataLocations() const { return dataLocations_; }
    const std::vector<CompressedBlock>& compressedBlocks() const { return compressedBlocks_; }
    const std::vector<std::string>& compressionMethods() const { return compressionMethods_; }
    uint64_t fileSize() const { return fileSize_; }

    uint64_t containerId() const { return header_.container_id; }
    size_t entryCount() const { return entries_.size(); }

    // Index of the first entry with this id and type tag
    std::optional<size_t> findEntry(uint64_t id, uint8_t typeTag) const;

    // @throws ConsistencyError if `index` is out of range
    DataLocation dataLocation(size_t index) const;

    /**
     * Map a logical .ucas offset to the physical byte offset in the file.
     * @throws FormatError if the header's compression block size is zero
     * @throws ConsistencyError if the owning block is not in the block table
     */
    uint64_t physicalOffsetFor(uint64_t logicalOffset) const;

    // Absolute byte offset of entry `index` in the .utoc file
    uint64_t entryOffset(size_t index) const { return iostore::entry_offset(index); }

    // Name of a block's compression method, "None" for method 0
    std::string compressionMethodName(uint8_t methodIndex) const;

    bool isEncrypted() const;
    bool hasPerfectHashTables() const;

    // --- In-memory mutation, mirrors the bytes the patcher writes ---
    void setContainerId(uint64_t id) { header_.container_id = id; }
    void setEntryId(size_t index, uint64_t id);
};

} // namespace iopatch
