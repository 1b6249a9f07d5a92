#include "toc_document.hpp"
#include "errors.hpp"
#include <algorithm>

using namespace iostore;

namespace iopatch {

namespace {

// Fail with TruncatedFileError unless [offset, offset + length) lies inside the image
void requireRange(uint64_t fileSize, uint64_t offset, uint64_t length, const char* what)
{
    if (offset > fileSize || length > fileSize - offset) {
        throw TruncatedFileError(std::string(what) + " needs bytes up to " +
                                 std::to_string(offset + length) + " but file is only " +
                                 std::to_string(fileSize) + " bytes");
    }
}

} // namespace

TocDocument TocDocument::parse(const std::vector<uint8_t>& image)
{
    TocDocument doc;
    doc.fileSize_ = image.size();
    const uint8_t* base = image.data();

    requireRange(doc.fileSize_, 0, TOC_HEADER_SIZE, "Header");
    doc.header_ = decodeHeader(base);
    const TocHeader& header = doc.header_;

    if (!header.is_valid()) {
        throw FormatError("Invalid table-of-contents magic");
    }
    if (header.toc_header_size != TOC_HEADER_SIZE) {
        throw FormatError("Unsupported header size " + std::to_string(header.toc_header_size));
    }
    if (header.toc_compressed_block_entry_count > 0 &&
        header.toc_compressed_block_entry_size != TOC_COMPRESSED_BLOCK_SIZE) {
        throw FormatError("Unsupported compressed block entry size " +
                          std::to_string(header.toc_compressed_block_entry_size));
    }

    const uint64_t entryCount = header.toc_entry_count;
    const uint64_t blockCount = header.toc_compressed_block_entry_count;

    // Entry table
    requireRange(doc.fileSize_, entry_table_offset(), entryCount * TOC_ENTRY_SIZE, "Entry table");
    doc.entries_.reserve(entryCount);
    for (uint64_t i = 0; i < entryCount; ++i) {
        doc.entries_.push_back(decodeEntry(base + entry_offset(i)));
    }

    // Data location table, parallel to the entries
    const uint64_t locationsAt = data_location_table_offset(entryCount);
    requireRange(doc.fileSize_, locationsAt, entryCount * TOC_DATA_LOCATION_SIZE, "Data location table");
    doc.dataLocations_.reserve(entryCount);
    for (uint64_t i = 0; i < entryCount; ++i) {
        doc.dataLocations_.push_back(decodeDataLocation(base + locationsAt + i * TOC_DATA_LOCATION_SIZE));
    }

    // Compressed block table
    const uint64_t blocksAt = compressed_block_table_offset(entryCount);
    requireRange(doc.fileSize_, blocksAt, blockCount * TOC_COMPRESSED_BLOCK_SIZE, "Compressed block table");
    doc.compressedBlocks_.reserve(blockCount);
    for (uint64_t i = 0; i < blockCount; ++i) {
        doc.compressedBlocks_.push_back(decodeCompressedBlock(base + blocksAt + i * TOC_COMPRESSED_BLOCK_SIZE));
    }

    // Compression method names: fixed-width, NUL padded
    const uint64_t namesAt = compression_method_table_offset(entryCount, blockCount);
    const uint64_t nameCount = header.compression_method_name_count;
    const uint64_t nameLength = header.compression_method_name_length;
    requireRange(doc.fileSize_, namesAt, nameCount * nameLength, "Compression method names");
    for (uint64_t i = 0; i < nameCount; ++i) {
        const char* raw = reinterpret_cast<const char*>(base + namesAt + i * nameLength);
        doc.compressionMethods_.emplace_back(raw, std::find(raw, raw + nameLength, '\0'));
    }

    return doc;
}

std::optional<size_t> TocDocument::findEntry(uint64_t id, uint8_t typeTag) const
{
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].id == id && entries_[i].type == typeTag) {
            return i;
        }
    }
    return std::nullopt;
}

DataLocation TocDocument::dataLocation(size_t index) const
{
    if (index >= dataLocations_.size()) {
        throw ConsistencyError("No data location for entry " + std::to_string(index));
    }
    return dataLocations_[index];
}

uint64_t TocDocument::physicalOffsetFor(uint64_t logicalOffset) const
{
    const uint64_t blockSize = header_.compression_block_size;
    if (blockSize == 0) {
        throw FormatError("Compression block size is zero");
    }

    const uint64_t blockIndex = logicalOffset / blockSize;
    if (blockIndex >= compressedBlocks_.size()) {
        throw ConsistencyError("Logical offset " + std::to_string(logicalOffset) +
                               " maps to block " + std::to_string(blockIndex) +
                               " but only " + std::to_string(compressedBlocks_.size()) +
                               " blocks exist");
    }
    return compressedBlocks_[blockIndex].offset + logicalOffset % blockSize;
}

std::string TocDocument::compressionMethodName(uint8_t methodIndex) const
{
    if (methodIndex == 0) return "None";
    if (methodIndex > compressionMethods_.size()) return "Unknown";
    return compressionMethods_[methodIndex - 1];
}

bool TocDocument::isEncrypted() const
{
    return header_.has_encryption_key() ||
           has_flag(header_.container_flags, ContainerFlag::ENCRYPTED);
}

bool TocDocument::hasPerfectHashTables() const
{
    return header_.toc_chunk_perfect_hash_seeds_count != 0 ||
           header_.toc_chunks_without_perfect_hash_count != 0;
}

void TocDocument::setEntryId(size_t index, uint64_t id)
{
    if (index >= entries_.size()) {
        throw ConsistencyError("No entry " + std::to_string(index));
    }
    entries_[index].id = id;
}

} // namespace iopatch
