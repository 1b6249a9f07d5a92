/**
 * @file iostore.hpp
 * @brief On-disk layout of IoStore table-of-contents (.utoc) files
 *
 * This header describes the fixed-width records of an IoStore container's
 * table-of-contents file and the relationship between those records and the
 * companion bulk-data (.ucas) file.
 *
 * DESIGN PRINCIPLES:
 * - Direct exposure of file structures, byte-for-byte
 * - No implementations beyond single-expression inline helpers
 * - Every table offset is derived from header counts, never stored
 *
 * FILE LAYOUT (.utoc):
 *   [TocHeader                        144 bytes]
 *   [TocChunkId            x EntryCount, 12 bytes each]
 *   [TocOffsetAndLength    x EntryCount, 10 bytes each]
 *   [TocCompressedBlock    x CompressedBlockEntryCount, 12 bytes each]
 *   [compression method names, directory index, ...  (opaque, never written)]
 */

#ifndef IOPATCH_IOSTORE_FORMAT_HPP
#define IOPATCH_IOSTORE_FORMAT_HPP

#include <bit>
#include <cstdint>
#include <cstddef>

// =============================================================================
// CRITICAL: BYTE ORDERING
// =============================================================================

/**
 * @brief BYTE ORDER IS MIXED WITHIN ONE FILE
 *
 * Little-endian:
 * - All TocHeader fields
 * - TocChunkId identifier
 * - TocCompressedBlock offset (40-bit), sizes (24-bit)
 * - The container id copy stored in the .ucas file
 *
 * Big-endian:
 * - TocOffsetAndLength offset and length (both 40-bit)
 *
 * Example: logical offset 0x0102030405 is stored in a TocOffsetAndLength as
 *          [0x01, 0x02, 0x03, 0x04, 0x05] but in a TocCompressedBlock as
 *          [0x05, 0x04, 0x03, 0x02, 0x01]
 */

static_assert(std::endian::native == std::endian::little,
    "Packed record overlays assume a little-endian host");

namespace iostore {

// =============================================================================
// FILE IDENTIFICATION
// =============================================================================

/**
 * @brief Magic signature at offset 0 of every .utoc file: "-==--==--==--==-"
 */
constexpr uint8_t TOC_MAGIC[16] = {
    0x2D, 0x3D, 0x3D, 0x2D, 0x2D, 0x3D, 0x3D, 0x2D,
    0x2D, 0x3D, 0x3D, 0x2D, 0x2D, 0x3D, 0x3D, 0x2D
};

/** @brief Size of the fixed header; also the offset of the entry table */
constexpr size_t TOC_HEADER_SIZE = 144;

/** @brief Size of one TocChunkId record */
constexpr size_t TOC_ENTRY_SIZE = 12;

/** @brief Size of one TocOffsetAndLength record */
constexpr size_t TOC_DATA_LOCATION_SIZE = 10;

/** @brief Size of one TocCompressedBlock record */
constexpr size_t TOC_COMPRESSED_BLOCK_SIZE = 12;

/** @brief Byte offset of the container id inside the header */
constexpr size_t TOC_CONTAINER_ID_OFFSET = 56;

/** @brief Width of a container or chunk identifier on disk */
constexpr size_t ID_SIZE = 8;

/** @brief Largest value a packed 40-bit field can hold */
constexpr uint64_t UINT40_MAX = (uint64_t{1} << 40) - 1;

/** @brief Largest value a packed 24-bit field can hold */
constexpr uint32_t UINT24_MAX = (uint32_t{1} << 24) - 1;

// =============================================================================
// CHUNK TYPES
// =============================================================================

/**
 * @brief Type tag stored in the last byte of a TocChunkId
 *
 * Only CONTAINER_HEADER has meaning to the patcher: its identifier must equal
 * the header's container id, and its payload in the .ucas file begins with
 * another copy of that id. Other values are listed for reporting.
 */
enum class ChunkType : uint8_t {
    INVALID             = 0,
    EXPORT_BUNDLE_DATA  = 1,
    BULK_DATA           = 2,
    OPTIONAL_BULK_DATA  = 3,
    MEMORY_MAPPED_BULK  = 4,
    SCRIPT_OBJECTS      = 5,
    CONTAINER_HEADER    = 10,  ///< One per container, carries the container id
    EXTERNAL_FILE       = 11,
    SHADER_CODE_LIBRARY = 12,
    SHADER_CODE         = 13,
    PACKAGE_STORE_ENTRY = 14
};

/** @brief Raw tag value of ChunkType::CONTAINER_HEADER */
constexpr uint8_t CONTAINER_HEADER_TAG = static_cast<uint8_t>(ChunkType::CONTAINER_HEADER);

// =============================================================================
// CONTAINER FLAGS
// =============================================================================

/**
 * @brief Bits of TocHeader::container_flags
 */
enum class ContainerFlag : uint8_t {
    NONE       = 0x00,
    COMPRESSED = 0x01,
    ENCRYPTED  = 0x02,  ///< Payload is encrypted; detected, never acted upon
    SIGNED     = 0x04,
    INDEXED    = 0x08,
    ON_DEMAND  = 0x10
};

constexpr inline bool has_flag(uint8_t flags, ContainerFlag flag) noexcept {
    return (flags & static_cast<uint8_t>(flag)) != 0;
}

// =============================================================================
// HEADER
// =============================================================================

/**
 * @brief Table-of-contents header (144 bytes, little-endian)
 *
 * Reserved fields are kept so that a decoded header can be compared against
 * the file byte-for-byte; the patcher never writes them.
 */
struct TocHeader {
    uint8_t  magic[16];                            ///< TOC_MAGIC
    uint8_t  version;
    uint8_t  reserved0;
    uint16_t reserved1;
    uint32_t toc_header_size;                      ///< Always TOC_HEADER_SIZE
    uint32_t toc_entry_count;
    uint32_t toc_compressed_block_entry_count;
    uint32_t toc_compressed_block_entry_size;      ///< Always TOC_COMPRESSED_BLOCK_SIZE
    uint32_t compression_method_name_count;
    uint32_t compression_method_name_length;
    uint32_t compression_block_size;               ///< Logical bytes per compressed block
    uint32_t directory_index_size;
    uint32_t partition_count;
    uint64_t container_id;                         ///< At TOC_CONTAINER_ID_OFFSET
    uint32_t encryption_key_guid[4];
    uint8_t  container_flags;                      ///< ContainerFlag bits
    uint8_t  reserved3;
    uint16_t reserved4;
    uint32_t toc_chunk_perfect_hash_seeds_count;
    uint64_t partition_size;
    uint32_t toc_chunks_without_perfect_hash_count;
    uint32_t reserved7;
    uint64_t reserved8[5];

    /**
     * @brief Validate the magic signature
     * @return true if the first 16 bytes equal TOC_MAGIC
     */
    bool is_valid() const noexcept {
        for (size_t i = 0; i < sizeof(magic); ++i) {
            if (magic[i] != TOC_MAGIC[i]) return false;
        }
        return true;
    }

    /**
     * @brief Check for a non-zero encryption key identifier
     */
    bool has_encryption_key() const noexcept {
        return (encryption_key_guid[0] | encryption_key_guid[1] |
                encryption_key_guid[2] | encryption_key_guid[3]) != 0;
    }
} __attribute__((packed));

// =============================================================================
// TABLE RECORDS
// =============================================================================

/**
 * @brief Chunk identifier record (12 bytes)
 *
 * Format in file:
 *   .quad id          (little-endian)
 *   .word index       (reserved to the patcher)
 *   .byt  padding     (reserved to the patcher)
 *   .byt  type        (ChunkType)
 */
struct TocChunkId {
    uint64_t id;
    uint16_t index;
    uint8_t  padding;
    uint8_t  type;

    ChunkType chunk_type() const noexcept {
        return static_cast<ChunkType>(type);
    }

    bool is_container_header() const noexcept {
        return type == CONTAINER_HEADER_TAG;
    }
} __attribute__((packed));

/**
 * @brief Data location record (10 bytes, BIG-ENDIAN 40-bit fields)
 *
 * Position of a chunk in the logical (uncompressed) address space of the
 * .ucas file. Parallel to the TocChunkId table: record i belongs to entry i.
 */
struct TocOffsetAndLength {
    uint8_t offset[5];
    uint8_t length[5];
} __attribute__((packed));

/**
 * @brief Compressed block record (12 bytes, LITTLE-ENDIAN packed fields)
 *
 * Block i covers logical bytes [i * compression_block_size,
 * (i + 1) * compression_block_size) and is stored at the physical offset
 * given here.
 */
struct TocCompressedBlock {
    uint8_t offset[5];             ///< Physical offset in the .ucas file
    uint8_t compressed_size[3];
    uint8_t uncompressed_size[3];
    uint8_t compression_method;    ///< 0 = none, n = method name n - 1
} __attribute__((packed));

// =============================================================================
// DERIVED TABLE OFFSETS
// =============================================================================

/**
 * @brief Absolute offset of the entry table
 */
constexpr inline uint64_t entry_table_offset() noexcept {
    return TOC_HEADER_SIZE;
}

/**
 * @brief Absolute offset of the data location table
 * @param entry_count TocHeader::toc_entry_count
 */
constexpr inline uint64_t data_location_table_offset(uint64_t entry_count) noexcept {
    return entry_table_offset() + entry_count * TOC_ENTRY_SIZE;
}

/**
 * @brief Absolute offset of the compressed block table
 * @param entry_count TocHeader::toc_entry_count
 */
constexpr inline uint64_t compressed_block_table_offset(uint64_t entry_count) noexcept {
    return data_location_table_offset(entry_count) + entry_count * TOC_DATA_LOCATION_SIZE;
}

/**
 * @brief Absolute offset of the compression method name table
 * @param entry_count TocHeader::toc_entry_count
 * @param block_count TocHeader::toc_compressed_block_entry_count
 */
constexpr inline uint64_t compression_method_table_offset(uint64_t entry_count,
                                                          uint64_t block_count) noexcept {
    return compressed_block_table_offset(entry_count) + block_count * TOC_COMPRESSED_BLOCK_SIZE;
}

/**
 * @brief Absolute offset of entry i's record
 */
constexpr inline uint64_t entry_offset(uint64_t index) noexcept {
    return entry_table_offset() + index * TOC_ENTRY_SIZE;
}

} // namespace iostore

// =============================================================================
// STATIC ASSERTIONS FOR STRUCTURE SIZES
// =============================================================================

static_assert(sizeof(iostore::TocHeader) == iostore::TOC_HEADER_SIZE,
    "TocHeader must be exactly 144 bytes");

static_assert(sizeof(iostore::TocChunkId) == iostore::TOC_ENTRY_SIZE,
    "TocChunkId must be 12 bytes (8 id + 2 index + 1 padding + 1 type)");

static_assert(sizeof(iostore::TocOffsetAndLength) == iostore::TOC_DATA_LOCATION_SIZE,
    "TocOffsetAndLength must be 10 bytes (5 offset + 5 length)");

static_assert(sizeof(iostore::TocCompressedBlock) == iostore::TOC_COMPRESSED_BLOCK_SIZE,
    "TocCompressedBlock must be 12 bytes (5 offset + 3 + 3 sizes + 1 method)");

static_assert(offsetof(iostore::TocHeader, container_id) == iostore::TOC_CONTAINER_ID_OFFSET,
    "container_id must sit at header offset 56");

#endif // IOPATCH_IOSTORE_FORMAT_HPP
