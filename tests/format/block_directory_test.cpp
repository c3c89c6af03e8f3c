// =============================================================================
// lci - Block Directory Tests
// =============================================================================

#include "lci/format/block_directory.h"

#include <gtest/gtest.h>

#include "support/chunk_builder.h"

namespace lci::format::test {
namespace {

using lci::test::ChunkBuilder;

ChunkBuilder twoBlocks() {
    ChunkBuilder builder;
    builder.addBlock({{100, "first"}, {150, "second"}}).addBlock({{200, "third"}}, 190, 260);
    return builder;
}

void expectDirectoryError(ByteBuffer bytes, TrailerLayout layout) {
    const ChunkBody body = ChunkBody::fromBytes(std::move(bytes));
    try {
        (void)decodeBlockDirectory(body, layout);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kDirectoryDecodeError);
    }
}

TEST(BlockDirectoryTest, DecodesDescriptors) {
    const auto built = twoBlocks().buildBody();
    const ChunkBody body = ChunkBody::fromBytes(built.bytes);

    const BlockDirectory dir = decodeBlockDirectory(body, TrailerLayout::kChecksummed);
    EXPECT_EQ(dir.metaOffset, built.metaOffset);
    ASSERT_EQ(dir.descriptors.size(), 2u);
    EXPECT_EQ(dir.descriptors[0].numEntries, 2u);
    EXPECT_EQ(dir.descriptors[0].minT, 100);
    EXPECT_EQ(dir.descriptors[0].maxT, 150);
    EXPECT_EQ(dir.descriptors[0].dataOffset, kBodyPreambleSize);
    EXPECT_EQ(dir.descriptors[1].minT, 190);
    EXPECT_EQ(dir.descriptors[1].maxT, 260);
    EXPECT_EQ(dir.descriptors[1].dataOffset, built.descriptors[1].dataOffset);
    EXPECT_EQ(dir.descriptors[1].dataLength, built.descriptors[1].dataLength);

    ASSERT_TRUE(dir.storedChecksum.has_value());
    EXPECT_TRUE(dir.checksumOk());
}

TEST(BlockDirectoryTest, CorruptStoredChecksumIsReportedNotThrown) {
    auto bytes = twoBlocks().buildBody().bytes;
    bytes[bytes.size() - kMetaOffsetSize - 1] ^= 0x01;
    const ChunkBody body = ChunkBody::fromBytes(std::move(bytes));

    const BlockDirectory dir = decodeBlockDirectory(body, TrailerLayout::kChecksummed);
    EXPECT_FALSE(dir.checksumOk());
    EXPECT_EQ(dir.descriptors.size(), 2u);
}

TEST(BlockDirectoryTest, CorruptDirectoryByteIsReportedNotThrown) {
    const auto built = twoBlocks().buildBody();
    auto bytes = built.bytes;
    // Block 0 minT varint, after the block count and the entry count
    bytes[built.metaOffset + 2] ^= 0x02;
    const ChunkBody body = ChunkBody::fromBytes(std::move(bytes));

    const BlockDirectory dir = decodeBlockDirectory(body, TrailerLayout::kChecksummed);
    EXPECT_FALSE(dir.checksumOk());
    ASSERT_EQ(dir.descriptors.size(), 2u);
    EXPECT_EQ(dir.descriptors[0].minT, 101);
    EXPECT_EQ(dir.descriptors[1].dataOffset, built.descriptors[1].dataOffset);
}

TEST(BlockDirectoryTest, LegacyLayoutHasNoStoredChecksum) {
    auto builder = twoBlocks();
    builder.layout(TrailerLayout::kLegacy);
    const auto built = builder.buildBody();
    const ChunkBody body = ChunkBody::fromBytes(built.bytes);

    const BlockDirectory dir = decodeBlockDirectory(body, TrailerLayout::kLegacy);
    EXPECT_FALSE(dir.storedChecksum.has_value());
    EXPECT_TRUE(dir.checksumOk());
    ASSERT_EQ(dir.descriptors.size(), 2u);
    EXPECT_EQ(dir.descriptors[1].dataOffset, built.descriptors[1].dataOffset);
}

TEST(BlockDirectoryTest, EmptyChunkHasNoBlocks) {
    const auto built = ChunkBuilder{}.buildBody();
    const ChunkBody body = ChunkBody::fromBytes(built.bytes);
    const BlockDirectory dir = decodeBlockDirectory(body, TrailerLayout::kChecksummed);
    EXPECT_TRUE(dir.descriptors.empty());
    EXPECT_EQ(dir.metaOffset, kBodyPreambleSize);
    EXPECT_TRUE(dir.checksumOk());
}

TEST(BlockDirectoryTest, MetaOffsetBeyondDirectoryEnd) {
    auto bytes = twoBlocks().buildBody().bytes;
    for (std::size_t i = bytes.size() - kMetaOffsetSize; i < bytes.size(); ++i) {
        bytes[i] = 0x7f;
    }
    expectDirectoryError(std::move(bytes), TrailerLayout::kChecksummed);
}

TEST(BlockDirectoryTest, BodyTooShortForTrailer) {
    // Magic and selector only
    ByteBuffer bytes{0x01, 0x2e, 0xe5, 0x6a, kFormatV2, 0x00, 0x00, 0x00};
    expectDirectoryError(std::move(bytes), TrailerLayout::kChecksummed);
}

TEST(BlockDirectoryTest, TruncatedDescriptorIsDirectoryError) {
    // Declares one block but the directory holds only the count
    ChunkBuilder builder;
    auto built = builder.layout(TrailerLayout::kLegacy).buildBody();
    built.bytes[built.metaOffset] = 0x01;
    expectDirectoryError(std::move(built.bytes), TrailerLayout::kLegacy);
}

}  // namespace
}  // namespace lci::format::test
