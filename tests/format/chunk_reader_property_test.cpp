// =============================================================================
// lci - Chunk Reader Tests
// =============================================================================
// End-to-end decoding of synthetic chunks under every codec and layout,
// plus structural failures and block error isolation.
// =============================================================================

#include "lci/format/chunk_reader.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <sstream>
#include <string>

#include "lci/common/checksum.h"
#include "support/chunk_builder.h"

namespace lci::format::test {
namespace {

using lci::test::ChunkBuilder;

const std::vector<Entry> kSampleEntries = {{1000, "a"}, {2000, "bb"}};

ChunkFile readBytes(const ByteBuffer& bytes, ReaderOptions options = {}) {
    std::istringstream stream(std::string(bytes.begin(), bytes.end()));
    return ChunkReader(options).read(stream, "memory");
}

DecodedChunk decodeBytes(ByteBuffer bytes, ReaderOptions options = {}) {
    return ChunkReader(options).decodeBody(ChunkBody::fromBytes(std::move(bytes)));
}

// =============================================================================
// Well-formed Chunks
// =============================================================================

TEST(ChunkReaderTest, UncompressedSingleBlock) {
    ChunkBuilder builder;
    builder.codec(ChunkCodec::kNone).addBlock(kSampleEntries);
    const auto built = builder.buildBody();

    const DecodedChunk chunk = decodeBytes(built.bytes);
    EXPECT_EQ(chunk.codec(), ChunkCodec::kNone);
    EXPECT_EQ(chunk.formatVersion(), kFormatV2);
    EXPECT_TRUE(chunk.metadataChecksumOk());
    EXPECT_EQ(chunk.metaOffset(), built.metaOffset);
    ASSERT_EQ(chunk.blocks().size(), 1u);

    const Block& block = chunk.blocks()[0];
    EXPECT_TRUE(block.ok());
    EXPECT_EQ(block.descriptor.dataOffset, kBodyPreambleSize);
    EXPECT_EQ(block.descriptor.numEntries, 2u);
    EXPECT_EQ(block.descriptor.minT, 1000);
    EXPECT_EQ(block.descriptor.maxT, 2000);
    ASSERT_TRUE(block.storedChecksum.has_value());
    EXPECT_EQ(*block.storedChecksum, block.computedChecksum);
    EXPECT_EQ(block.entries, kSampleEntries);
    EXPECT_TRUE(block.boundsConsistent());
    EXPECT_TRUE(block.entryCountMatches());

    // Uncompressed payload digests coincide
    EXPECT_EQ(block.compressedDigest, block.uncompressedDigest);
    EXPECT_EQ(block.uncompressedLength, block.descriptor.dataLength);
    EXPECT_EQ(chunk.payload(block).size(), block.descriptor.dataLength);
}

TEST(ChunkReaderTest, ReadsHeaderAndBody) {
    lci::test::HeaderSpec spec;
    spec.userId = "tenant";
    spec.labels = {{"app", "api"}};
    spec.from = 1000;
    spec.through = 2000;

    ChunkBuilder builder;
    builder.codec(ChunkCodec::kSnappy).header(spec).addBlock(kSampleEntries);
    const auto bytes = builder.buildFile();

    const ChunkFile file = readBytes(bytes);
    EXPECT_EQ(file.path, "memory");
    EXPECT_EQ(file.fileSize, bytes.size());
    EXPECT_EQ(file.header.userId, "tenant");
    EXPECT_EQ(file.header.label("app").value(), "api");
    EXPECT_EQ(file.chunk.codec(), ChunkCodec::kSnappy);
    ASSERT_EQ(file.chunk.blocks().size(), 1u);
    EXPECT_EQ(file.chunk.blocks()[0].entries, kSampleEntries);
}

TEST(ChunkReaderTest, FormatOneImpliesGzip) {
    ChunkBuilder builder;
    builder.selector(kFormatV1, 0).addBlock(kSampleEntries);
    const DecodedChunk chunk = decodeBytes(builder.buildBody().bytes);
    EXPECT_EQ(chunk.codec(), ChunkCodec::kGzip);
    EXPECT_EQ(chunk.formatVersion(), kFormatV1);
    EXPECT_EQ(chunk.blocks()[0].entries, kSampleEntries);
}

TEST(ChunkReaderTest, LegacyLayoutHasNoChecksums) {
    ChunkBuilder builder;
    builder.codec(ChunkCodec::kLz4)
        .layout(TrailerLayout::kLegacy)
        .addBlock(kSampleEntries)
        .addBlock({{3000, "ccc"}});

    ReaderOptions options;
    options.legacyLayout = true;
    const DecodedChunk chunk = decodeBytes(builder.buildBody().bytes, options);
    EXPECT_FALSE(chunk.storedMetadataChecksum().has_value());
    ASSERT_EQ(chunk.blocks().size(), 2u);
    for (const auto& block : chunk.blocks()) {
        EXPECT_FALSE(block.storedChecksum.has_value());
        EXPECT_TRUE(block.ok());
    }
    EXPECT_EQ(chunk.blocks()[1].entries.front().line, "ccc");
}

TEST(ChunkReaderTest, SkipsEntriesWhenDisabled) {
    ChunkBuilder builder;
    builder.codec(ChunkCodec::kGzip).addBlock(kSampleEntries);

    ReaderOptions options;
    options.decodeEntries = false;
    const DecodedChunk chunk = decodeBytes(builder.buildBody().bytes, options);
    const Block& block = chunk.blocks()[0];
    EXPECT_TRUE(block.ok());
    EXPECT_TRUE(block.entries.empty());
    EXPECT_GT(block.uncompressedLength, 0u);
}

TEST(ChunkReaderTest, ReadFileReportsFileSize) {
    ChunkBuilder builder;
    builder.codec(ChunkCodec::kGzip).addBlock(kSampleEntries);
    const auto bytes = builder.buildFile();
    lci::test::TempFile file(bytes);

    const ChunkFile decoded = ChunkReader{}.readFile(file.path());
    EXPECT_EQ(decoded.path, file.path().string());
    EXPECT_EQ(decoded.fileSize, bytes.size());
    EXPECT_EQ(decoded.chunk.blocks()[0].entries, kSampleEntries);
}

TEST(ChunkReaderTest, MissingFileIsIOError) {
    EXPECT_THROW((void)ChunkReader{}.readFile("/nonexistent/lci/chunk"), IOError);
}

// =============================================================================
// Structural Failures
// =============================================================================

RC_GTEST_PROP(ChunkReaderProperty, AnyOtherMagicIsRejected, ()) {
    const auto magic = *rc::gen::suchThat(rc::gen::arbitrary<std::uint32_t>(),
                                          [](std::uint32_t m) { return m != kChunkMagic; });
    ChunkBuilder builder;
    builder.addBlock(kSampleEntries);
    auto bytes = builder.buildBody().bytes;
    for (std::size_t i = 0; i < kMagicSize; ++i) {
        bytes[i] = static_cast<std::uint8_t>(magic >> (24 - 8 * i));
    }

    try {
        (void)decodeBytes(std::move(bytes));
        RC_FAIL("expected BadMagicError");
    } catch (const BadMagicError& e) {
        RC_ASSERT(e.actual() == magic);
    }
}

TEST(ChunkReaderTest, DeclaredBodyLargerThanFileIsTruncated) {
    constexpr std::uint32_t kDeclared = 0xfffffff0;
    ByteBuffer bytes = lci::test::encodeHeaderMetadata(lci::test::HeaderSpec{});
    const std::uint64_t headerSize = bytes.size() + 4;
    for (int shift = 24; shift >= 0; shift -= 8) {
        bytes.push_back(static_cast<std::uint8_t>(kDeclared >> shift));
    }
    const ByteBuffer tail{0x01, 0x2e, 0xe5, 0x6a, kFormatV2, 0x00, 0x00};
    bytes.insert(bytes.end(), tail.begin(), tail.end());
    lci::test::TempFile file(bytes);

    try {
        (void)ChunkReader{}.readFile(file.path());
        FAIL() << "expected TruncatedError";
    } catch (const TruncatedError& e) {
        EXPECT_EQ(e.expected().value(), kDeclared);
        EXPECT_EQ(e.got().value(), tail.size());
        EXPECT_EQ(e.context().value().byteOffset.value(), headerSize);
    }

    // Streams of unknown length stop at the bytes actually present
    try {
        (void)readBytes(bytes);
        FAIL() << "expected TruncatedError";
    } catch (const TruncatedError& e) {
        EXPECT_EQ(e.expected().value(), kDeclared);
        EXPECT_EQ(e.got().value(), tail.size());
    }
}

TEST(ChunkReaderTest, UnknownCodec) {
    ChunkBuilder builder;
    builder.selector(kFormatV2, 9).addBlock(kSampleEntries);
    try {
        (void)decodeBytes(builder.buildBody().bytes);
        FAIL() << "expected UnknownCodecError";
    } catch (const UnknownCodecError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kUnknownCodec);
    }
}

TEST(ChunkReaderTest, UnknownFormatVersion) {
    ChunkBuilder builder;
    builder.selector(7, 0);
    EXPECT_THROW((void)decodeBytes(builder.buildBody().bytes), UnknownCodecError);
}

TEST(ChunkReaderTest, TruncatedBody) {
    ChunkBuilder builder;
    builder.codec(ChunkCodec::kGzip).addBlock(kSampleEntries);
    auto bytes = builder.buildFile();
    bytes.resize(bytes.size() - 5);

    try {
        (void)readBytes(bytes);
        FAIL() << "expected TruncatedError";
    } catch (const TruncatedError& e) {
        EXPECT_EQ(e.expected().value() - e.got().value(), 5u);
    }
}

// =============================================================================
// Checksums and Block Isolation
// =============================================================================

TEST(ChunkReaderTest, MetadataChecksumMismatchIsNotFatal) {
    ChunkBuilder builder;
    builder.addBlock(kSampleEntries);
    auto bytes = builder.buildBody().bytes;
    bytes[bytes.size() - kMetaOffsetSize - 2] ^= 0x10;

    const DecodedChunk chunk = decodeBytes(std::move(bytes));
    EXPECT_FALSE(chunk.metadataChecksumOk());
    EXPECT_NE(*chunk.storedMetadataChecksum(), chunk.computedMetadataChecksum());
    ASSERT_EQ(chunk.blocks().size(), 1u);
    EXPECT_TRUE(chunk.blocks()[0].ok());
}

TEST(ChunkReaderTest, CorruptDirectoryBytesFailMetadataChecksum) {
    ChunkBuilder builder;
    builder.addBlock(kSampleEntries);
    const auto built = builder.buildBody();
    auto bytes = built.bytes;
    // First byte of block 0's minT varint, after the block count and entry count
    bytes[built.metaOffset + 2] ^= 0x02;

    const DecodedChunk chunk = decodeBytes(std::move(bytes));
    EXPECT_FALSE(chunk.metadataChecksumOk());
    ASSERT_EQ(chunk.blocks().size(), 1u);
    const Block& block = chunk.blocks()[0];
    EXPECT_NE(block.descriptor.minT, 1000);
    EXPECT_TRUE(block.ok());
    EXPECT_TRUE(block.checksumOk());
    EXPECT_EQ(block.entries, kSampleEntries);
}

TEST(ChunkReaderTest, CorruptBlockIsIsolated) {
    ChunkBuilder builder;
    builder.codec(ChunkCodec::kGzip).addBlock(kSampleEntries).addBlock({{3000, "ccc"}});
    auto built = builder.buildBody();
    // Destroy the gzip magic of the first payload
    built.bytes[built.descriptors[0].dataOffset] = 0x00;

    const DecodedChunk chunk = decodeBytes(built.bytes);
    ASSERT_EQ(chunk.blocks().size(), 2u);
    EXPECT_EQ(chunk.failedBlockCount(), 1u);

    const Block& bad = chunk.blocks()[0];
    ASSERT_TRUE(bad.error.has_value());
    EXPECT_EQ(bad.error->code(), ErrorCode::kCodecInitError);
    EXPECT_FALSE(bad.checksumOk());

    const Block& good = chunk.blocks()[1];
    EXPECT_TRUE(good.ok());
    EXPECT_TRUE(good.checksumOk());
    EXPECT_EQ(good.entries.front().line, "ccc");
}

TEST(ChunkReaderTest, FailFastThrowsBlockError) {
    ChunkBuilder builder;
    builder.codec(ChunkCodec::kGzip).addBlock(kSampleEntries);
    auto built = builder.buildBody();
    built.bytes[built.descriptors[0].dataOffset] = 0x00;

    ReaderOptions options;
    options.failFast = true;
    EXPECT_THROW((void)decodeBytes(built.bytes, options), CodecError);
}

TEST(ChunkReaderTest, PayloadOutOfBoundsIsBlockError) {
    // Hand-made directory pointing past the end of the body
    ByteBuffer bytes{0x01, 0x2e, 0xe5, 0x6a, kFormatV2, 0x00};
    const std::uint64_t metaOffset = bytes.size();
    ByteBuffer directory;
    appendUvarint(directory, 1);
    appendUvarint(directory, 1);
    appendVarint(directory, 0);
    appendVarint(directory, 0);
    appendUvarint(directory, 6);
    appendUvarint(directory, 500);
    bytes.insert(bytes.end(), directory.begin(), directory.end());
    for (int shift = 56; shift >= 0; shift -= 8) {
        bytes.push_back(static_cast<std::uint8_t>(metaOffset >> shift));
    }

    ReaderOptions options;
    options.legacyLayout = true;
    const DecodedChunk chunk = decodeBytes(std::move(bytes), options);
    ASSERT_EQ(chunk.blocks().size(), 1u);
    ASSERT_TRUE(chunk.blocks()[0].error.has_value());
    EXPECT_EQ(chunk.blocks()[0].error->code(), ErrorCode::kDecodeError);
    EXPECT_TRUE(chunk.payload(chunk.blocks()[0]).empty());
}

TEST(ChunkReaderTest, DeclaredBoundsAreReportedNotEnforced) {
    ChunkBuilder builder;
    builder.addBlock(kSampleEntries, 1500, 1800);
    const DecodedChunk chunk = decodeBytes(builder.buildBody().bytes);
    const Block& block = chunk.blocks()[0];
    EXPECT_TRUE(block.ok());
    EXPECT_FALSE(block.boundsConsistent());
    EXPECT_EQ(block.entries.size(), 2u);
}

// =============================================================================
// Property Tests
// =============================================================================

rc::Gen<ChunkCodec> genCodec() {
    return rc::gen::element(ChunkCodec::kNone, ChunkCodec::kGzip, ChunkCodec::kDumb,
                            ChunkCodec::kLz4, ChunkCodec::kSnappy);
}

rc::Gen<std::vector<Entry>> genEntries() {
    return rc::gen::container<std::vector<Entry>>(rc::gen::map(
        rc::gen::pair(rc::gen::arbitrary<Timestamp>(), rc::gen::arbitrary<std::string>()),
        [](const std::pair<Timestamp, std::string>& p) { return Entry{p.first, p.second}; }));
}

RC_GTEST_PROP(ChunkReaderProperty, EveryCodecAndLayoutRoundTrips, ()) {
    const auto codec = *genCodec();
    const bool legacy = *rc::gen::arbitrary<bool>();
    const auto blocks = *rc::gen::resize(8, rc::gen::container<std::vector<std::vector<Entry>>>(
                                                genEntries()));

    ChunkBuilder builder;
    builder.codec(codec).layout(legacy ? TrailerLayout::kLegacy : TrailerLayout::kChecksummed);
    for (const auto& entries : blocks) {
        builder.addBlock(entries);
    }

    ReaderOptions options;
    options.legacyLayout = legacy;
    const DecodedChunk chunk = decodeBytes(builder.buildBody().bytes, options);

    RC_ASSERT(chunk.codec() == codec);
    RC_ASSERT(chunk.metadataChecksumOk());
    RC_ASSERT(chunk.blocks().size() == blocks.size());
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        const Block& block = chunk.blocks()[i];
        RC_ASSERT(block.ok());
        RC_ASSERT(block.checksumOk());
        RC_ASSERT(block.entries == blocks[i]);
        RC_ASSERT(block.boundsConsistent());
        RC_ASSERT(block.compressedDigest == sha256(chunk.payload(block)));
    }
}

RC_GTEST_PROP(ChunkReaderProperty, DigestsAreDeterministic, ()) {
    const auto codec = *genCodec();
    const auto entries = *genEntries();

    ChunkBuilder builder;
    builder.codec(codec).addBlock(entries);
    const auto bytes = builder.buildBody().bytes;

    const DecodedChunk first = decodeBytes(bytes);
    const DecodedChunk second = decodeBytes(bytes);
    RC_ASSERT(first.blocks()[0].compressedDigest == second.blocks()[0].compressedDigest);
    RC_ASSERT(first.blocks()[0].uncompressedDigest == second.blocks()[0].uncompressedDigest);
    RC_ASSERT(first.blocks()[0].uncompressedDigest == sha256(lci::test::encodeEntries(entries)));
}

}  // namespace
}  // namespace lci::format::test
