// =============================================================================
// lci - Decompressing Streams Implementation
// =============================================================================

#include "lci/io/compressed_stream.h"

#include <lz4frame.h>
#include <snappy.h>
#include <zlib.h>

#include <array>
#include <cstring>
#include <string>

#include "lci/common/checksum.h"
#include "lci/common/logger.h"

namespace lci::io {

namespace {

// Gzip member header: magic 0x1f 0x8b, method 8 (deflate), 10 bytes minimum
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b, 0x08};
constexpr std::size_t kGzipMinHeaderSize = 10;

// Snappy framing chunk types
constexpr std::uint8_t kChunkTypeCompressed = 0x00;
constexpr std::uint8_t kChunkTypeUncompressed = 0x01;
constexpr std::uint8_t kChunkTypeStreamIdentifier = 0xff;
constexpr std::uint8_t kFirstSkippableChunk = 0x80;
constexpr std::string_view kSnappyMagicBody = "sNaPpY";
constexpr std::size_t kChunkHeaderSize = 4;
constexpr std::size_t kChunkChecksumSize = 4;

std::uint32_t readLittleEndian32(const char* p) noexcept {
    const auto* b = reinterpret_cast<const std::uint8_t*>(p);
    return static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8) |
           (static_cast<std::uint32_t>(b[2]) << 16) | (static_cast<std::uint32_t>(b[3]) << 24);
}

[[noreturn]] void throwCorrupt(std::string_view codec, std::string_view what) {
    throw CodecError(ErrorCode::kDecodeError,
                     std::string(codec) + " stream corrupt: " + std::string(what));
}

}  // namespace

std::string_view compressionFormatName(CompressionFormat format) noexcept {
    switch (format) {
        case CompressionFormat::kNone:
            return "none";
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kLz4Frame:
            return "lz4";
        case CompressionFormat::kSnappyFramed:
            return "snappy";
    }
    return "unknown";
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initZlib();

    // Validate the first member header up front so that a payload that is not
    // gzip at all fails construction rather than the first read.
    auto* stream = static_cast<z_stream*>(zlibStream_);
    while (stream->avail_in < kGzipMinHeaderSize && fillInput() > 0) {
    }
    if (stream->avail_in < kGzipMinHeaderSize ||
        std::memcmp(stream->next_in, kGzipMagic, sizeof(kGzipMagic)) != 0) {
        cleanupZlib();
        throw CodecError(ErrorCode::kCodecInitError, "invalid gzip header");
    }
}

GzipStreamBuf::~GzipStreamBuf() { cleanupZlib(); }

void GzipStreamBuf::initZlib() {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    // 16 + MAX_WBITS selects the gzip wrapper
    int ret = inflateInit2(stream, 16 + MAX_WBITS);
    if (ret != Z_OK) {
        delete stream;
        throw CodecError(ErrorCode::kCodecInitError,
                         "Failed to initialize zlib: " + std::string(zError(ret)));
    }

    zlibStream_ = stream;
}

void GzipStreamBuf::cleanupZlib() {
    if (zlibStream_) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

std::size_t GzipStreamBuf::fillInput() {
    auto* stream = static_cast<z_stream*>(zlibStream_);

    // Keep unconsumed bytes at the front of the buffer
    std::size_t pending = stream->avail_in;
    if (pending > 0 && stream->next_in != inputBuffer_.data()) {
        std::memmove(inputBuffer_.data(), stream->next_in, pending);
    }
    if (pending == inputBuffer_.size()) {
        return 0;
    }

    source_->read(reinterpret_cast<char*>(inputBuffer_.data() + pending),
                  static_cast<std::streamsize>(inputBuffer_.size() - pending));
    auto bytesRead = static_cast<std::size_t>(source_->gcount());

    stream->next_in = inputBuffer_.data();
    stream->avail_in = static_cast<uInt>(pending + bytesRead);
    return bytesRead;
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    if (streamEnd_) {
        return traits_type::eof();
    }

    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t GzipStreamBuf::decompress() {
    auto* stream = static_cast<z_stream*>(zlibStream_);

    stream->avail_out = static_cast<uInt>(outputBuffer_.size());
    stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());

    while (stream->avail_out == outputBuffer_.size()) {
        // inflate may still hold pending output once the source is drained
        bool sourceDrained = false;
        if (stream->avail_in == 0 && fillInput() == 0) {
            if (memberDone_) {
                streamEnd_ = true;
                break;
            }
            sourceDrained = true;
        }

        if (memberDone_) {
            // Another member follows the one just finished
            inflateReset(stream);
            memberDone_ = false;
        }

        int ret = inflate(stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            memberDone_ = true;
        } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw CodecError(ErrorCode::kDecodeError,
                             "gzip decompression failed: " +
                                 std::string(stream->msg ? stream->msg : zError(ret)));
        }
        if (sourceDrained && !memberDone_ && stream->avail_out == outputBuffer_.size()) {
            throw CodecError(ErrorCode::kDecodeError, "unexpected end of gzip stream");
        }
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// Lz4FrameStreamBuf Implementation
// =============================================================================

Lz4FrameStreamBuf::Lz4FrameStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    LZ4F_dctx* dctx = nullptr;
    const LZ4F_errorCode_t err = LZ4F_createDecompressionContext(&dctx, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
        throw CodecError(ErrorCode::kCodecInitError,
                         "failed to create lz4 decompression context: " +
                             std::string(LZ4F_getErrorName(err)));
    }
    dctx_ = dctx;
}

Lz4FrameStreamBuf::~Lz4FrameStreamBuf() {
    if (dctx_) {
        LZ4F_freeDecompressionContext(static_cast<LZ4F_dctx*>(dctx_));
    }
}

std::size_t Lz4FrameStreamBuf::fillInput() {
    source_->read(inputBuffer_.data(), static_cast<std::streamsize>(inputBuffer_.size()));
    inputPos_ = 0;
    inputEnd_ = static_cast<std::size_t>(source_->gcount());
    return inputEnd_;
}

Lz4FrameStreamBuf::int_type Lz4FrameStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t Lz4FrameStreamBuf::decompress() {
    auto* dctx = static_cast<LZ4F_dctx*>(dctx_);

    std::size_t produced = 0;
    while (produced == 0) {
        // An open frame may still hold decoded bytes once the source is drained
        bool sourceDrained = false;
        if (inputPos_ == inputEnd_ && fillInput() == 0) {
            if (!frameOpen_) {
                return 0;
            }
            sourceDrained = true;
        }

        std::size_t dstSize = outputBuffer_.size();
        std::size_t srcSize = inputEnd_ - inputPos_;
        const std::size_t hint = LZ4F_decompress(dctx, outputBuffer_.data(), &dstSize,
                                                 inputBuffer_.data() + inputPos_, &srcSize,
                                                 nullptr);
        if (LZ4F_isError(hint)) {
            throw CodecError(ErrorCode::kDecodeError,
                             "lz4 decompression failed: " + std::string(LZ4F_getErrorName(hint)));
        }

        inputPos_ += srcSize;
        produced = dstSize;
        frameOpen_ = hint != 0;
        if (produced == 0 && sourceDrained) {
            throw CodecError(ErrorCode::kDecodeError, "unexpected end of lz4 frame");
        }
    }
    return produced;
}

// =============================================================================
// SnappyFramedStreamBuf Implementation
// =============================================================================

SnappyFramedStreamBuf::SnappyFramedStreamBuf(std::istream& source)
    : source_(&source), outputBuffer_(kMaxBlockSize) {}

bool SnappyFramedStreamBuf::readExact(char* buffer, std::size_t size) {
    if (size == 0) {
        return true;
    }
    source_->read(buffer, static_cast<std::streamsize>(size));
    auto bytesRead = static_cast<std::size_t>(source_->gcount());
    if (bytesRead == 0) {
        return false;
    }
    if (bytesRead != size) {
        throw CodecError(ErrorCode::kDecodeError, "unexpected end of snappy stream");
    }
    return true;
}

SnappyFramedStreamBuf::int_type SnappyFramedStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    if (streamEnd_) {
        return traits_type::eof();
    }

    std::size_t decompressed = decompressChunk();
    if (decompressed == 0) {
        streamEnd_ = true;
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t SnappyFramedStreamBuf::decompressChunk() {
    for (;;) {
        std::array<char, kChunkHeaderSize> header{};
        if (!readExact(header.data(), header.size())) {
            return 0;
        }

        const auto chunkType = static_cast<std::uint8_t>(header[0]);
        const std::size_t chunkLen = static_cast<std::uint8_t>(header[1]) |
                                     (static_cast<std::size_t>(static_cast<std::uint8_t>(header[2])) << 8) |
                                     (static_cast<std::size_t>(static_cast<std::uint8_t>(header[3])) << 16);

        if (chunkType != kChunkTypeStreamIdentifier && !sawStreamIdentifier_) {
            throwCorrupt("snappy", "missing stream identifier");
        }

        chunkBuffer_.resize(chunkLen);
        if (!readExact(chunkBuffer_.data(), chunkLen)) {
            throw CodecError(ErrorCode::kDecodeError, "unexpected end of snappy stream");
        }

        if (chunkType == kChunkTypeStreamIdentifier) {
            if (std::string_view(chunkBuffer_.data(), chunkBuffer_.size()) != kSnappyMagicBody) {
                throwCorrupt("snappy", "bad stream identifier");
            }
            sawStreamIdentifier_ = true;
            continue;
        }

        if (chunkType == kChunkTypeCompressed || chunkType == kChunkTypeUncompressed) {
            if (chunkLen < kChunkChecksumSize) {
                throwCorrupt("snappy", "chunk too short");
            }
            const std::uint32_t storedCrc = readLittleEndian32(chunkBuffer_.data());
            const char* data = chunkBuffer_.data() + kChunkChecksumSize;
            const std::size_t dataLen = chunkLen - kChunkChecksumSize;

            std::size_t decodedLen = dataLen;
            if (chunkType == kChunkTypeCompressed) {
                if (!snappy::GetUncompressedLength(data, dataLen, &decodedLen) ||
                    decodedLen > kMaxBlockSize) {
                    throwCorrupt("snappy", "invalid chunk length");
                }
                if (!snappy::RawUncompress(data, dataLen, outputBuffer_.data())) {
                    throwCorrupt("snappy", "invalid compressed chunk");
                }
            } else {
                if (decodedLen > kMaxBlockSize) {
                    throwCorrupt("snappy", "invalid chunk length");
                }
                std::memcpy(outputBuffer_.data(), data, decodedLen);
            }

            ByteSpan decoded(reinterpret_cast<const std::uint8_t*>(outputBuffer_.data()), decodedLen);
            if (maskedCrc32c(decoded) != storedCrc) {
                throwCorrupt("snappy", "chunk checksum mismatch");
            }
            if (decodedLen == 0) {
                continue;
            }
            return decodedLen;
        }

        if (chunkType < kFirstSkippableChunk) {
            throwCorrupt("snappy", "reserved unskippable chunk");
        }
        // Skippable chunks (0x80-0xfe, padding included) are ignored
    }
}

// =============================================================================
// DecompressingStream Implementation
// =============================================================================

DecompressingStream::DecompressingStream(std::istream& source, CompressionFormat format)
    : std::istream(nullptr), format_(format) {
    switch (format_) {
        case CompressionFormat::kNone:
            rdbuf(source.rdbuf());
            break;

        case CompressionFormat::kGzip:
            decompressBuf_ = std::make_unique<GzipStreamBuf>(source);
            rdbuf(decompressBuf_.get());
            break;

        case CompressionFormat::kLz4Frame:
            decompressBuf_ = std::make_unique<Lz4FrameStreamBuf>(source);
            rdbuf(decompressBuf_.get());
            break;

        case CompressionFormat::kSnappyFramed:
            decompressBuf_ = std::make_unique<SnappyFramedStreamBuf>(source);
            rdbuf(decompressBuf_.get());
            break;

        default:
            throw CodecError(ErrorCode::kCodecInitError, "Unknown compression format");
    }
    LCI_LOG_TRACE("Opened {} decompressing stream", compressionFormatName(format_));
}

DecompressingStream::~DecompressingStream() = default;

ByteBuffer readAll(std::istream& stream) {
    ByteBuffer out;
    std::streambuf* buf = stream.rdbuf();
    if (buf == nullptr) {
        return out;
    }

    // Read through the stream buffer directly so codec exceptions propagate
    // instead of being converted into a badbit.
    std::array<char, 64 * 1024> chunk{};
    for (;;) {
        const std::streamsize n = buf->sgetn(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (n <= 0) {
            break;
        }
        out.insert(out.end(), reinterpret_cast<const std::uint8_t*>(chunk.data()),
                   reinterpret_cast<const std::uint8_t*>(chunk.data()) + n);
    }
    return out;
}

}  // namespace lci::io
