// =============================================================================
// lci - Error Handling Framework Implementation
// =============================================================================

#include "lci/common/error.h"

#include <format>
#include <sstream>

namespace lci {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: 0x" << std::hex << *byteOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// LCIException Implementation
// =============================================================================

void LCIException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string TruncatedError::formatTruncated(std::string_view what, std::uint64_t expected,
                                            std::uint64_t got) {
    return std::format("failed to read {}: expected {} bytes, got {}", what, expected, got);
}

std::string BadMagicError::formatBadMagic(std::uint32_t actual) {
    return std::format("invalid magic number: {:x}", actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kTruncated:
            throw TruncatedError(message_);
        case ErrorCode::kBadMagic:
            throw BadMagicError(message_);
        case ErrorCode::kUnknownCodec:
            throw UnknownCodecError(message_);
        case ErrorCode::kCodecInitError:
        case ErrorCode::kDecodeError:
            throw CodecError(code_, message_);
        case ErrorCode::kMalformedField:
        case ErrorCode::kMalformedVarint:
        case ErrorCode::kTruncatedEntry:
        case ErrorCode::kDirectoryDecodeError:
            throw FormatError(code_, message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kUsageError:
        case ErrorCode::kChecksumMismatch:
            break;
    }
    throw LCIException(code_, message_);
}

}  // namespace lci
