// =============================================================================
// lci - Decompressing Streams
// =============================================================================
// Streaming decompression of block payloads and header metadata.
//
// This module provides:
// - GzipStreamBuf: RFC 1952 gzip (zlib), concatenated members accepted
// - Lz4FrameStreamBuf: LZ4 frame format (liblz4)
// - SnappyFramedStreamBuf: snappy framing format (libsnappy for chunk bodies)
// - DecompressingStream: std::istream over one of the above
//
// Every stream buffer borrows its source stream; the source must outlive it.
// Corrupt input surfaces as CodecError(kDecodeError) from underflow(), which
// readAll() propagates to the caller.
//
// Usage:
//   std::ispanstream payload(bytes);
//   DecompressingStream stream(payload, CompressionFormat::kGzip);
//   ByteBuffer plain = readAll(stream);
// =============================================================================

#ifndef LCI_IO_COMPRESSED_STREAM_H
#define LCI_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <istream>
#include <memory>
#include <streambuf>
#include <string_view>
#include <vector>

#include "lci/common/error.h"
#include "lci/common/types.h"

namespace lci::io {

// =============================================================================
// Compression Formats
// =============================================================================

/// @brief Stream compression formats understood by DecompressingStream.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,          ///< Pass-through
    kGzip = 1,          ///< gzip (RFC 1952)
    kLz4Frame = 2,      ///< LZ4 frame format
    kSnappyFramed = 3   ///< snappy framing format
};

/// @brief Get human-readable name for compression format.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format) noexcept;

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Stream buffer for gzip decompression.
/// @note Uses zlib for streaming decompression.
class GzipStreamBuf : public std::streambuf {
public:
    /// @brief Construct a gzip stream buffer.
    /// @param source Source stream to decompress.
    /// @param bufferSize Internal buffer size.
    /// @throws CodecError (kCodecInitError) if zlib cannot be initialized or
    ///         the source does not start with a gzip member header.
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    void initZlib();

    void cleanupZlib();

    /// @brief Read more compressed bytes from the source.
    /// @return Number of bytes read (0 at end of source).
    std::size_t fillInput();

    /// @brief Decompress more data into output buffer.
    /// @return Number of bytes decompressed, 0 at end of stream.
    std::size_t decompress();

    std::istream* source_ = nullptr;

    std::vector<std::uint8_t> inputBuffer_;

    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    /// @brief The current gzip member has been fully inflated.
    bool memberDone_ = false;

    bool streamEnd_ = false;
};

// =============================================================================
// Lz4FrameStreamBuf
// =============================================================================

/// @brief Stream buffer for LZ4 frame decompression.
/// @note Uses the liblz4 frame API; consecutive frames are decoded in turn.
class Lz4FrameStreamBuf : public std::streambuf {
public:
    /// @throws CodecError (kCodecInitError) if the decompression context
    ///         cannot be created.
    explicit Lz4FrameStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~Lz4FrameStreamBuf() override;

    Lz4FrameStreamBuf(const Lz4FrameStreamBuf&) = delete;
    Lz4FrameStreamBuf& operator=(const Lz4FrameStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    std::size_t fillInput();

    std::size_t decompress();

    std::istream* source_ = nullptr;

    std::vector<char> inputBuffer_;

    std::size_t inputPos_ = 0;

    std::size_t inputEnd_ = 0;

    std::vector<char> outputBuffer_;

    /// @brief LZ4F decompression context (opaque pointer).
    void* dctx_ = nullptr;

    /// @brief A frame has been started but not completed.
    bool frameOpen_ = false;
};

// =============================================================================
// SnappyFramedStreamBuf
// =============================================================================

/// @brief Stream buffer for the snappy framing format.
/// @note Each data chunk carries a masked CRC32C of its uncompressed bytes,
///       which is verified before the chunk is exposed.
class SnappyFramedStreamBuf : public std::streambuf {
public:
    explicit SnappyFramedStreamBuf(std::istream& source);

    SnappyFramedStreamBuf(const SnappyFramedStreamBuf&) = delete;
    SnappyFramedStreamBuf& operator=(const SnappyFramedStreamBuf&) = delete;

    /// @brief Largest uncompressed chunk allowed by the framing format.
    static constexpr std::size_t kMaxBlockSize = 65536;

protected:
    int_type underflow() override;

private:
    /// @brief Read exactly size bytes from the source.
    /// @return false on a clean end of source before the first byte.
    /// @throws CodecError (kDecodeError) on a partial read.
    bool readExact(char* buffer, std::size_t size);

    /// @brief Decode chunks until one yields data.
    /// @return Number of bytes placed in outputBuffer_, 0 at end of stream.
    std::size_t decompressChunk();

    std::istream* source_ = nullptr;

    std::vector<char> chunkBuffer_;

    std::vector<char> outputBuffer_;

    bool sawStreamIdentifier_ = false;

    bool streamEnd_ = false;
};

// =============================================================================
// DecompressingStream
// =============================================================================

/// @brief Input stream that decompresses a borrowed source stream.
class DecompressingStream : public std::istream {
public:
    /// @brief Construct over a source stream.
    /// @param source Source stream (must outlive this object).
    /// @param format Compression format of the source.
    /// @throws CodecError (kCodecInitError) if the decompressor cannot be constructed.
    DecompressingStream(std::istream& source, CompressionFormat format);

    ~DecompressingStream() override;

    DecompressingStream(const DecompressingStream&) = delete;
    DecompressingStream& operator=(const DecompressingStream&) = delete;
    DecompressingStream(DecompressingStream&&) = delete;
    DecompressingStream& operator=(DecompressingStream&&) = delete;

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

private:
    std::unique_ptr<std::streambuf> decompressBuf_;

    CompressionFormat format_ = CompressionFormat::kNone;
};

/// @brief Drain a stream into a byte buffer.
/// @throws CodecError (kDecodeError) raised by a decompressing stream buffer.
[[nodiscard]] ByteBuffer readAll(std::istream& stream);

}  // namespace lci::io

#endif  // LCI_IO_COMPRESSED_STREAM_H
