#pragma once
#include <gtest/gtest.h>
#include "batch.hpp"
#include "iostore.hpp"
#include "log.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>
#include <string>
#include <vector>

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Offset-prefixed hex dump, 16 bytes per row, starting at `from`
 */
inline std::string hexDump(const std::vector<uint8_t>& data, size_t from = 0, size_t maxBytes = 64) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    size_t end = std::min(data.size(), from + maxBytes);
    for (size_t i = from; i < end; ++i) {
        if (i == from || (i - from) % 16 == 0) {
            if (i != from) oss << "\n";
            oss << std::setw(6) << i << ":";
        }
        oss << " " << std::setw(2) << static_cast<int>(data[i]);
    }
    if (data.size() > end) {
        oss << " ... (" << std::dec << (data.size() - end) << " more bytes)";
    }
    return oss.str();
}

/**
 * @brief Compare byte images; on the first mismatch, dump both around it
 */
inline void expectBytes(const std::vector<uint8_t>& actual,
                        const std::vector<uint8_t>& expected,
                        const std::string& msg = "") {
    ASSERT_EQ(actual.size(), expected.size())
        << msg << " size mismatch: expected " << expected.size()
        << " bytes, got " << actual.size() << "\nactual:\n" << hexDump(actual);
    auto mismatch = std::mismatch(actual.begin(), actual.end(), expected.begin());
    if (mismatch.first == actual.end()) return;

    size_t at = static_cast<size_t>(mismatch.first - actual.begin());
    size_t from = at - at % 16;
    ADD_FAILURE() << msg << " byte mismatch at offset " << at
                  << ": expected 0x" << std::hex << static_cast<int>(expected[at])
                  << ", got 0x" << static_cast<int>(actual[at])
                  << "\nexpected:\n" << hexDump(expected, from, 32)
                  << "\nactual:\n" << hexDump(actual, from, 32);
}

/**
 * @brief Extract a range of bytes from a vector
 */
inline std::vector<uint8_t> extractBytes(const std::vector<uint8_t>& data,
                                         size_t start, size_t length) {
    if (start >= data.size()) return {};
    size_t end = std::min(start + length, data.size());
    return std::vector<uint8_t>(data.begin() + start, data.begin() + end);
}

/**
 * @brief Read a 64-bit little-endian value, 0 if out of range
 */
inline uint64_t readQuad(const std::vector<uint8_t>& data, size_t offset) {
    if (offset + 8 > data.size()) return 0;
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
    }
    return value;
}

inline std::vector<uint8_t> quadBytes(uint64_t value) {
    std::vector<uint8_t> out(8);
    for (size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return out;
}

// ============================================================================
// IOSTORE CONSTANTS FOR TESTING
// ============================================================================
namespace TestConstants {
    constexpr uint32_t BLOCK_SIZE = 0x10000;
    constexpr uint32_t METHOD_NAME_LENGTH = 32;
    constexpr uint8_t FILLER = 0xAB;
    constexpr uint8_t PACKAGE_TYPE = 2;    // BulkData
    constexpr size_t CONTAINER_ID_OFFSET = 56;
    constexpr size_t FIRST_ENTRY_OFFSET = 144;
}

// ============================================================================
// SYNTHETIC .utoc / .ucas IMAGES
// ============================================================================

/**
 * Builds byte-exact table-of-contents images and a matching bulk-data blob.
 *
 * Fields are written by hand rather than through the library encoders so a
 * decoding bug cannot hide behind the same bug in the builder.
 */
class TocImageBuilder {
public:
    struct Chunk {
        uint64_t id;
        uint8_t type;
        uint64_t logicalOffset;
        uint64_t length;
    };

    struct Block {
        uint64_t physicalOffset;
        uint32_t compressedSize;
        uint32_t uncompressedSize;
        uint8_t method;
    };

    /**
     * One container-header chunk at logical 0, one package chunk after it,
     * both in a single uncompressed block stored at physical offset 16.
     */
    static TocImageBuilder standard(uint64_t containerId, uint64_t packageId) {
        TocImageBuilder builder;
        builder.setContainerId(containerId)
               .addChunk(containerId, iostore::CONTAINER_HEADER_TAG, 0, 24)
               .addChunk(packageId, TestConstants::PACKAGE_TYPE, 24, 40)
               .addBlock(16, 64, 64, 0);
        return builder;
    }

    TocImageBuilder& setContainerId(uint64_t id) { containerId_ = id; return *this; }
    TocImageBuilder& setBlockSize(uint32_t size) { blockSize_ = size; return *this; }
    TocImageBuilder& setHeaderSize(uint32_t size) { headerSize_ = size; return *this; }
    TocImageBuilder& setBlockEntrySize(uint32_t size) { blockEntrySize_ = size; return *this; }
    TocImageBuilder& setFlags(uint8_t flags) { flags_ = flags; return *this; }
    TocImageBuilder& setEncryptionKey(uint32_t first) { keyGuid_ = first; return *this; }
    TocImageBuilder& setPerfectHashSeeds(uint32_t count) { perfectHashSeeds_ = count; return *this; }
    TocImageBuilder& corruptMagic() { corruptMagic_ = true; return *this; }

    // Header entry count differs from the number of chunks actually written
    TocImageBuilder& overrideEntryCount(uint32_t count) { entryCountOverride_ = count; return *this; }

    TocImageBuilder& addChunk(uint64_t id, uint8_t type, uint64_t logicalOffset, uint64_t length) {
        chunks_.push_back({id, type, logicalOffset, length});
        return *this;
    }

    TocImageBuilder& addBlock(uint64_t physicalOffset, uint32_t compressedSize,
                              uint32_t uncompressedSize, uint8_t method) {
        blocks_.push_back({physicalOffset, compressedSize, uncompressedSize, method});
        return *this;
    }

    TocImageBuilder& addCompressionMethod(const std::string& name) {
        methods_.push_back(name);
        return *this;
    }

    // Opaque bytes after the fixed tables (directory index and the like)
    TocImageBuilder& setTrailer(std::vector<uint8_t> bytes) { trailer_ = std::move(bytes); return *this; }

    const std::vector<Chunk>& chunks() const { return chunks_; }
    const std::vector<Block>& blocks() const { return blocks_; }

    std::vector<uint8_t> build() const {
        iostore::TocHeader header{};
        std::memcpy(header.magic, iostore::TOC_MAGIC, sizeof(header.magic));
        if (corruptMagic_) header.magic[0] = 'X';
        header.version = 3;
        header.toc_header_size = headerSize_;
        header.toc_entry_count = entryCountOverride_ >= 0
            ? static_cast<uint32_t>(entryCountOverride_)
            : static_cast<uint32_t>(chunks_.size());
        header.toc_compressed_block_entry_count = static_cast<uint32_t>(blocks_.size());
        header.toc_compressed_block_entry_size = blockEntrySize_;
        header.compression_method_name_count = static_cast<uint32_t>(methods_.size());
        header.compression_method_name_length = TestConstants::METHOD_NAME_LENGTH;
        header.compression_block_size = blockSize_;
        header.directory_index_size = static_cast<uint32_t>(trailer_.size());
        header.partition_count = 1;
        header.container_id = containerId_;
        header.encryption_key_guid[0] = keyGuid_;
        header.container_flags = flags_;
        header.toc_chunk_perfect_hash_seeds_count = perfectHashSeeds_;

        std::vector<uint8_t> image(sizeof(header));
        std::memcpy(image.data(), &header, sizeof(header));

        for (const auto& chunk : chunks_) {
            putLe(image, chunk.id, 8);
            putLe(image, 0, 2);           // index
            image.push_back(0);           // padding
            image.push_back(chunk.type);
        }
        for (const auto& chunk : chunks_) {
            putBe(image, chunk.logicalOffset, 5);
            putBe(image, chunk.length, 5);
        }
        for (const auto& block : blocks_) {
            putLe(image, block.physicalOffset, 5);
            putLe(image, block.compressedSize, 3);
            putLe(image, block.uncompressedSize, 3);
            image.push_back(block.method);
        }
        for (const auto& name : methods_) {
            std::vector<uint8_t> field(TestConstants::METHOD_NAME_LENGTH, 0);
            std::copy_n(name.begin(), std::min<size_t>(name.size(), field.size()), field.begin());
            image.insert(image.end(), field.begin(), field.end());
        }
        image.insert(image.end(), trailer_.begin(), trailer_.end());
        return image;
    }

    /**
     * Filler bytes with the container id copied at every container-header
     * chunk's physical offset.
     */
    std::vector<uint8_t> buildBulk() const {
        size_t size = 64;
        for (const auto& block : blocks_) {
            size = std::max<size_t>(size, block.physicalOffset +
                                          std::max(block.compressedSize, block.uncompressedSize));
        }
        std::vector<uint8_t> bulk(size, TestConstants::FILLER);

        for (const auto& chunk : chunks_) {
            if (chunk.type != iostore::CONTAINER_HEADER_TAG || blockSize_ == 0) continue;
            size_t blockIndex = chunk.logicalOffset / blockSize_;
            if (blockIndex >= blocks_.size()) continue;
            size_t at = blocks_[blockIndex].physicalOffset + chunk.logicalOffset % blockSize_;
            auto id = quadBytes(chunk.id);
            if (at + id.size() <= bulk.size()) {
                std::copy(id.begin(), id.end(), bulk.begin() + at);
            }
        }
        return bulk;
    }

private:
    static void putLe(std::vector<uint8_t>& out, uint64_t value, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            out.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    static void putBe(std::vector<uint8_t>& out, uint64_t value, size_t width) {
        for (size_t i = width; i > 0; --i) {
            out.push_back(static_cast<uint8_t>(value >> (8 * (i - 1))));
        }
    }

    uint64_t containerId_ = 0;
    uint32_t blockSize_ = TestConstants::BLOCK_SIZE;
    uint32_t headerSize_ = iostore::TOC_HEADER_SIZE;
    uint32_t blockEntrySize_ = iostore::TOC_COMPRESSED_BLOCK_SIZE;
    uint8_t flags_ = 0;
    uint32_t keyGuid_ = 0;
    uint32_t perfectHashSeeds_ = 0;
    bool corruptMagic_ = false;
    int64_t entryCountOverride_ = -1;
    std::vector<Chunk> chunks_;
    std::vector<Block> blocks_;
    std::vector<std::string> methods_;
    std::vector<uint8_t> trailer_;
};

// ============================================================================
// BASE TEST FIXTURE
// ============================================================================

/**
 * Fresh scratch directory per test, removed afterwards. Console logging is
 * off so expected failures do not clutter the test output.
 */
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::random_device device;
        dir = std::filesystem::temp_directory_path() /
              ("iopatch_" + std::string(info->test_suite_name()) + "_" +
               std::string(info->name()) + "_" + std::to_string(device()));
        std::filesystem::create_directories(dir);

        iopatch::LogOptions options;
        options.console = false;
        iopatch::log_init(options);
    }

    void TearDown() override {
        iopatch::log_shutdown();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    // --- File helpers ---

    std::filesystem::path writeFile(const std::filesystem::path& relative,
                                    const std::vector<uint8_t>& bytes) {
        auto path = dir / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        EXPECT_TRUE(out.good()) << "could not write " << path;
        return path;
    }

    std::vector<uint8_t> readBytes(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    // Writes <name>.utoc and <name>.ucas from one builder
    iopatch::FilePair writePair(const std::string& name, const TocImageBuilder& builder) {
        iopatch::FilePair pair;
        pair.tocPath = writeFile(name + ".utoc", builder.build());
        pair.bulkPath = writeFile(name + ".ucas", builder.buildBulk());
        return pair;
    }
};
