#include "binary_layout.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>

namespace iopatch {

namespace {

// Shared by the 40- and 24-bit paths so both byte orders stay symmetric
uint64_t decodePacked(const uint8_t* bytes, size_t width, ByteOrder order)
{
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        size_t index = order == ByteOrder::Big ? i : width - 1 - i;
        value = (value << 8) | bytes[index];
    }
    return value;
}

template <size_t Width>
std::array<uint8_t, Width> encodePacked(uint64_t value, ByteOrder order)
{
    std::array<uint8_t, Width> out{};
    for (size_t i = 0; i < Width; ++i) {
        uint8_t byte = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
        if (order == ByteOrder::Little) {
            out[i] = byte;
        } else {
            out[Width - 1 - i] = byte;
        }
    }
    return out;
}

} // namespace

uint64_t decodeUint40(const uint8_t* bytes, ByteOrder order)
{
    return decodePacked(bytes, 5, order);
}

uint32_t decodeUint24(const uint8_t* bytes, ByteOrder order)
{
    return static_cast<uint32_t>(decodePacked(bytes, 3, order));
}

std::array<uint8_t, 5> encodeUint40(uint64_t value, ByteOrder order)
{
    if (value > iostore::UINT40_MAX) {
        throw RangeError("Value " + std::to_string(value) + " does not fit in 40 bits");
    }
    return encodePacked<5>(value, order);
}

std::array<uint8_t, 3> encodeUint24(uint32_t value, ByteOrder order)
{
    if (value > iostore::UINT24_MAX) {
        throw RangeError("Value " + std::to_string(value) + " does not fit in 24 bits");
    }
    return encodePacked<3>(value, order);
}

uint32_t readUint32Le(const uint8_t* bytes)
{
    return static_cast<uint32_t>(decodePacked(bytes, 4, ByteOrder::Little));
}

uint64_t readUint64Le(const uint8_t* bytes)
{
    return decodePacked(bytes, 8, ByteOrder::Little);
}

std::array<uint8_t, iostore::ID_SIZE> encodeUint64Le(uint64_t value)
{
    return encodePacked<iostore::ID_SIZE>(value, ByteOrder::Little);
}

iostore::TocHeader decodeHeader(const uint8_t* bytes)
{
    iostore::TocHeader header;
    std::memcpy(&header, bytes, sizeof(header));
    return header;
}

iostore::TocChunkId decodeEntry(const uint8_t* bytes)
{
    iostore::TocChunkId entry;
    std::memcpy(&entry, bytes, sizeof(entry));
    return entry;
}

DataLocation decodeDataLocation(const uint8_t* bytes)
{
    iostore::TocOffsetAndLength raw;
    std::memcpy(&raw, bytes, sizeof(raw));

    DataLocation location;
    location.offset = decodeUint40(raw.offset, ByteOrder::Big);
    location.length = decodeUint40(raw.length, ByteOrder::Big);
    return location;
}

CompressedBlock decodeCompressedBlock(const uint8_t* bytes)
{
    iostore::TocCompressedBlock raw;
    std::memcpy(&raw, bytes, sizeof(raw));

    CompressedBlock block;
    block.offset = decodeUint40(raw.offset, ByteOrder::Little);
    block.compressedSize = decodeUint24(raw.compressed_size, ByteOrder::Little);
    block.uncompressedSize = decodeUint24(raw.uncompressed_size, ByteOrder::Little);
    block.compressionMethod = raw.compression_method;
    return block;
}

std::array<uint8_t, iostore::TOC_DATA_LOCATION_SIZE> encodeDataLocation(const DataLocation& location)
{
    std::array<uint8_t, iostore::TOC_DATA_LOCATION_SIZE> out{};
    auto offset = encodeUint40(location.offset, ByteOrder::Big);
    auto length = encodeUint40(location.length, ByteOrder::Big);
    std::memcpy(out.data(), offset.data(), offset.size());
    std::memcpy(out.data() + offset.size(), length.data(), length.size());
    return out;
}

std::array<uint8_t, iostore::TOC_COMPRESSED_BLOCK_SIZE> encodeCompressedBlock(const CompressedBlock& block)
{
    iostore::TocCompressedBlock raw{};
    auto offset = encodeUint40(block.offset, ByteOrder::Little);
    auto compressed = encodeUint24(block.compressedSize, ByteOrder::Little);
    auto uncompressed = encodeUint24(block.uncompressedSize, ByteOrder::Little);
    std::memcpy(raw.offset, offset.data(), offset.size());
    std::memcpy(raw.compressed_size, compressed.data(), compressed.size());
    std::memcpy(raw.uncompressed_size, uncompressed.data(), uncompressed.size());
    raw.compression_method = block.compressionMethod;

    std::array<uint8_t, iostore::TOC_COMPRESSED_BLOCK_SIZE> out{};
    std::memcpy(out.data(), &raw, sizeof(raw));
    return out;
}

} // namespace iopatch
