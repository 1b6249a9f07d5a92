#pragma once

#include "iostore.hpp"
#include <array>
#include <cstdint>
#include <cstddef>

namespace iopatch {

enum class ByteOrder {
    Little,
    Big
};

// Decoded TocOffsetAndLength
struct DataLocation {
    uint64_t offset = 0;   // Logical offset into the .ucas address space
    uint64_t length = 0;
};

// Decoded TocCompressedBlock
struct CompressedBlock {
    uint64_t offset = 0;   // Physical offset in the .ucas file
    uint32_t compressedSize = 0;
    uint32_t uncompressedSize = 0;
    uint8_t compressionMethod = 0;
};

// --- Packed integers ---
// Each decoder reads exactly 5 or 3 bytes starting at `bytes`.
uint64_t decodeUint40(const uint8_t* bytes, ByteOrder order);
uint32_t decodeUint24(const uint8_t* bytes, ByteOrder order);

// Throw RangeError if `value` needs more than 40 / 24 bits
std::array<uint8_t, 5> encodeUint40(uint64_t value, ByteOrder order);
std::array<uint8_t, 3> encodeUint24(uint32_t value, ByteOrder order);

uint32_t readUint32Le(const uint8_t* bytes);
uint64_t readUint64Le(const uint8_t* bytes);
std::array<uint8_t, iostore::ID_SIZE> encodeUint64Le(uint64_t value);

// --- Records ---
// Callers are responsible for bounds: each reads the full record size.
iostore::TocHeader decodeHeader(const uint8_t* bytes);
iostore::TocChunkId decodeEntry(const uint8_t* bytes);
DataLocation decodeDataLocation(const uint8_t* bytes);
CompressedBlock decodeCompressedBlock(const uint8_t* bytes);

std::array<uint8_t, iostore::TOC_DATA_LOCATION_SIZE> encodeDataLocation(const DataLocation& location);
std::array<uint8_t, iostore::TOC_COMPRESSED_BLOCK_SIZE> encodeCompressedBlock(const CompressedBlock& block);

} // namespace iopatch
