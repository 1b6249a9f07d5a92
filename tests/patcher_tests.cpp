/**
 * @file patcher_tests.cpp
 * @brief In-place writes against real files
 */

#include "binary_layout.hpp"
#include "errors.hpp"
#include "patcher.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace iopatch;

class PatcherTest : public TempDirTest {
protected:
    Patcher patcher;

    static PatchWrite idWrite(uint64_t offset, uint64_t id) {
        return {offset, encodeUint64Le(id)};
    }
};

TEST_F(PatcherTest, WriteInPlace_OverwritesExactBytes) {
    auto path = writeFile("blob.bin", std::vector<uint8_t>(32, 0xAA));

    Patcher::writeInPlace(path, {idWrite(8, 0x0807060504030201ULL)});

    auto bytes = readBytes(path);
    ASSERT_EQ(bytes.size(), 32u);
    expectBytes(extractBytes(bytes, 8, 8), {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08});
    expectBytes(extractBytes(bytes, 0, 8), std::vector<uint8_t>(8, 0xAA), "prefix");
    expectBytes(extractBytes(bytes, 16, 16), std::vector<uint8_t>(16, 0xAA), "suffix");
}

TEST_F(PatcherTest, WriteInPlace_LastEightBytesAllowed) {
    auto path = writeFile("blob.bin", std::vector<uint8_t>(16, 0));

    EXPECT_NO_THROW(Patcher::writeInPlace(path, {idWrite(8, 1)}));
    EXPECT_EQ(readQuad(readBytes(path), 8), 1u);
}

TEST_F(PatcherTest, WriteInPlace_OutOfRangeWritesNothing) {
    auto path = writeFile("blob.bin", std::vector<uint8_t>(16, 0xAA));

    // First write is valid, second crosses the end: neither may land
    EXPECT_THROW(Patcher::writeInPlace(path, {idWrite(0, 1), idWrite(12, 2)}), IoError);
    expectBytes(readBytes(path), std::vector<uint8_t>(16, 0xAA));
}

TEST_F(PatcherTest, WriteInPlace_MissingFileIsIoError) {
    EXPECT_THROW(Patcher::writeInPlace(dir / "absent.bin", {idWrite(0, 1)}), IoError);
    EXPECT_FALSE(std::filesystem::exists(dir / "absent.bin"));
}

TEST_F(PatcherTest, WriteInPlace_NoWritesDoesNotOpenFile) {
    EXPECT_NO_THROW(Patcher::writeInPlace(dir / "absent.bin", {}));
}

TEST_F(PatcherTest, Apply_PreservesLengths) {
    auto pair = writePair("pakchunk1", TocImageBuilder::standard(0x11, 0x22));
    auto tocSize = std::filesystem::file_size(pair.tocPath);
    auto bulkSize = std::filesystem::file_size(pair.bulkPath);

    auto result = patcher.apply(pair.tocPath, {idWrite(56, 0x99), idWrite(144, 0x99)},
                                pair.bulkPath, {idWrite(16, 0x99)});

    EXPECT_TRUE(result.tocPatched);
    EXPECT_TRUE(result.bulkPatched);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(std::filesystem::file_size(pair.tocPath), tocSize);
    EXPECT_EQ(std::filesystem::file_size(pair.bulkPath), bulkSize);
    EXPECT_EQ(readQuad(readBytes(pair.bulkPath), 16), 0x99u);
}

TEST_F(PatcherTest, Apply_MissingBulkFileIsPartialPatch) {
    auto pair = writePair("pakchunk1", TocImageBuilder::standard(0x11, 0x22));
    std::filesystem::remove(pair.bulkPath);

    auto result = patcher.apply(pair.tocPath, {idWrite(56, 0x99)}, pair.bulkPath, {idWrite(16, 0x99)});

    EXPECT_TRUE(result.tocPatched);
    EXPECT_FALSE(result.bulkPatched);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].severity, Severity::Critical);
    EXPECT_NE(result.warnings[0].message.find("Partial patch"), std::string::npos);
    EXPECT_EQ(readQuad(readBytes(pair.tocPath), 56), 0x99u);
}

TEST_F(PatcherTest, Apply_ShortBulkFileIsPartialPatch) {
    auto pair = writePair("pakchunk1", TocImageBuilder::standard(0x11, 0x22));
    writeFile("pakchunk1.ucas", std::vector<uint8_t>(4, 0));

    auto result = patcher.apply(pair.tocPath, {idWrite(56, 0x99)}, pair.bulkPath, {idWrite(16, 0x99)});

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].severity, Severity::Critical);
    EXPECT_EQ(std::filesystem::file_size(pair.bulkPath), 4u);
}

TEST_F(PatcherTest, Apply_TocFailureLeavesBulkUntouched) {
    auto pair = writePair("pakchunk1", TocImageBuilder::standard(0x11, 0x22));
    auto bulkBefore = readBytes(pair.bulkPath);

    EXPECT_THROW(patcher.apply(pair.tocPath, {idWrite(1u << 20, 0x99)}, pair.bulkPath, {idWrite(16, 0x99)}),
                 IoError);
    expectBytes(readBytes(pair.bulkPath), bulkBefore);
}
