// =============================================================================
// lci - Info Command Tests
// =============================================================================

#include "commands/info_command.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

#include "support/chunk_builder.h"

namespace lci::commands::test {
namespace {

using lci::test::ChunkBuilder;
using lci::test::TempFile;

format::ChunkFile readBytes(const ByteBuffer& bytes, std::string name = "sample.chunk") {
    std::istringstream stream(std::string(bytes.begin(), bytes.end()));
    return format::ChunkReader{}.read(stream, std::move(name));
}

ByteBuffer sampleFile() {
    lci::test::HeaderSpec spec;
    spec.userId = "tenant";
    spec.labels = {{"job", "varlogs"}, {"app", "api"}};
    spec.from = 1'000;
    spec.through = 91'000;

    ChunkBuilder builder;
    builder.codec(format::ChunkCodec::kGzip)
        .header(spec)
        .addBlock({{1'000'000'000, "  first line\n"}, {2'000'000'000, "second"}})
        .addBlock({{3'000'000'000, "third"}});
    return builder.buildFile();
}

// =============================================================================
// Formatting
// =============================================================================

TEST(FormatTimestampTest, FormatsEpochNanos) {
    EXPECT_EQ(formatTimestamp(0), "1970-01-01 00:00:00.000000 UTC");
    EXPECT_EQ(formatTimestamp(1'500'000'000), "1970-01-01 00:00:01.500000 UTC");
    EXPECT_EQ(formatTimestamp(1'600'000'000'123'456'789), "2020-09-13 12:26:40.123456 UTC");
    EXPECT_EQ(formatTimestamp(-1'000), "1969-12-31 23:59:59.999999 UTC");
}

TEST(FormatDurationTest, SubSecond) {
    EXPECT_EQ(formatDuration(0), "0s");
    EXPECT_EQ(formatDuration(999), "999ns");
    EXPECT_EQ(formatDuration(1'500), "1.5µs");
    EXPECT_EQ(formatDuration(500'000'000), "500ms");
}

TEST(FormatDurationTest, SecondsAndLarger) {
    EXPECT_EQ(formatDuration(1'500'000'000), "1.5s");
    EXPECT_EQ(formatDuration(90'000'000'000), "1m30s");
    EXPECT_EQ(formatDuration(3'600'000'000'000), "1h0m0s");
    EXPECT_EQ(formatDuration(-2'000'000'000), "-2s");
}

TEST(DurationBetweenTest, SaturatesInsteadOfOverflowing) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    EXPECT_EQ(durationBetween(1'000, 91'000), 90'000);
    EXPECT_EQ(durationBetween(91'000, 1'000), -90'000);
    EXPECT_EQ(durationBetween(-modelTimeToNanos(kMaxModelTime), modelTimeToNanos(kMaxModelTime)),
              kMax);
    EXPECT_EQ(durationBetween(modelTimeToNanos(kMaxModelTime), -modelTimeToNanos(kMaxModelTime)),
              kMin);
    EXPECT_EQ(durationBetween(kMin, 0), kMax);
}

// =============================================================================
// Text Report
// =============================================================================

TEST(RenderChunkTextTest, SummaryWithoutBlockDetails) {
    const auto file = readBytes(sampleFile());
    const std::string text = renderChunkText(file, false, false);

    EXPECT_NE(text.find("Chunks file: sample.chunk\n"), std::string::npos);
    EXPECT_NE(text.find("UserID: tenant\n"), std::string::npos);
    EXPECT_NE(text.find("From: 1970-01-01 00:00:01.000000 UTC\n"), std::string::npos);
    EXPECT_NE(text.find("Through: 1970-01-01 00:01:31.000000 UTC (1m30s)\n"), std::string::npos);
    EXPECT_NE(text.find("\t app = api\n"), std::string::npos);
    EXPECT_LT(text.find("app = api"), text.find("job = varlogs"));
    EXPECT_NE(text.find("Encoding: gzip\n"), std::string::npos);
    EXPECT_NE(text.find(" OK\n"), std::string::npos);
    EXPECT_NE(text.find("Found 2 block(s), use -b to show block details\n"), std::string::npos);
    EXPECT_EQ(text.find("Block    0: position"), std::string::npos);
    EXPECT_NE(text.find("Total size of uncompressed data: "), std::string::npos);
}

TEST(RenderChunkTextTest, BlockDetailsAndLines) {
    const auto file = readBytes(sampleFile());
    const std::string text = renderChunkText(file, true, true);

    EXPECT_NE(text.find("Found 2 block(s)\n\n"), std::string::npos);
    EXPECT_NE(text.find("Block    0: position:        6,"), std::string::npos);
    EXPECT_NE(text.find("Block    1: digest compressed: "), std::string::npos);
    EXPECT_NE(text.find("1970-01-01 00:00:01.000000 UTC\tfirst line\n"), std::string::npos);
    EXPECT_NE(text.find("1970-01-01 00:00:03.000000 UTC\tthird\n"), std::string::npos);
}

TEST(RenderChunkTextTest, ReportsBlockErrors) {
    ChunkBuilder builder;
    builder.codec(format::ChunkCodec::kGzip).addBlock({{1, "x"}});
    auto body = builder.buildBody();
    body.bytes[body.descriptors[0].dataOffset] = 0x00;

    const format::ChunkFile file{
        "broken", body.bytes.size(), format::ChunkHeader{},
        format::ChunkReader{}.decodeBody(format::ChunkBody::fromBytes(body.bytes))};
    const std::string text = renderChunkText(file, false, false);
    EXPECT_NE(text.find("Block    0: error: "), std::string::npos);
}

TEST(ChunkToJsonTest, CarriesHeaderAndBlocks) {
    const auto file = readBytes(sampleFile());
    const auto j = chunkToJson(file, true, true);

    EXPECT_EQ(j["file"], "sample.chunk");
    EXPECT_EQ(j["userID"], "tenant");
    EXPECT_EQ(j["labels"]["job"], "varlogs");
    EXPECT_EQ(j["encoding"], "gzip");
    EXPECT_EQ(j["blockCount"], 2);
    EXPECT_TRUE(j["metadataChecksum"]["ok"].get<bool>());
    ASSERT_EQ(j["blocks"].size(), 2u);
    EXPECT_EQ(j["blocks"][0]["position"], 6);
    EXPECT_EQ(j["blocks"][0]["entries"][0]["line"], "first line");
    EXPECT_FALSE(j["blocks"][1].contains("error"));
}

TEST(RenderChunkTextTest, ExtremeHeaderTimesRender) {
    lci::test::HeaderSpec spec;
    spec.from = -kMaxModelTime;
    spec.through = kMaxModelTime;
    ChunkBuilder builder;
    builder.header(spec).addBlock({{1, "x"}});
    const auto file = readBytes(builder.buildFile());

    EXPECT_EQ(file.header.from, -kMaxModelTime);
    EXPECT_NE(renderChunkText(file, false, false).find("(2562047h47m16.854775807s)\n"),
              std::string::npos);
    EXPECT_EQ(chunkToJson(file, false, false)["duration"], "2562047h47m16.854775807s");
}

TEST(ChunkToJsonTest, OmitsBlocksByDefault) {
    const auto j = chunkToJson(readBytes(sampleFile()), false, false);
    EXPECT_FALSE(j.contains("blocks"));
    EXPECT_GT(j["totalUncompressedSize"].get<std::uint64_t>(), 0u);
}

// =============================================================================
// Info Command
// =============================================================================

TEST(InfoCommandTest, ExitCodeReflectsFirstFailure) {
    TempFile good(sampleFile());

    InfoOptions options;
    options.inputPaths = {good.path().string()};
    options.threads = 1;
    EXPECT_EQ(createInfoCommand(options)->execute(), 0);

    auto truncated = sampleFile();
    truncated.resize(truncated.size() - 1);
    TempFile bad(truncated);
    options.inputPaths = {good.path().string(), bad.path().string()};
    EXPECT_EQ(createInfoCommand(options)->execute(), toExitCode(ErrorCode::kTruncated));
}

TEST(InfoCommandTest, MissingFileDoesNotStopTheOthers) {
    TempFile good(sampleFile());

    InfoOptions options;
    options.inputPaths = {"/nonexistent/lci/missing.chunk", good.path().string()};
    options.threads = 1;
    options.jsonOutput = true;

    testing::internal::CaptureStdout();
    const int exitCode = createInfoCommand(options)->execute();
    const std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(exitCode, toExitCode(ErrorCode::kIOError));
    const auto report = nlohmann::json::parse(output);
    ASSERT_EQ(report.size(), 2u);
    EXPECT_EQ(report[0]["file"], "/nonexistent/lci/missing.chunk");
    EXPECT_EQ(report[0]["error"]["code"], std::string(errorCodeToString(ErrorCode::kIOError)));
    EXPECT_EQ(report[1]["file"], good.path().string());
    EXPECT_EQ(report[1]["blockCount"], 2);
}

}  // namespace
}  // namespace lci::commands::test
