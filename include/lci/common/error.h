// =============================================================================
// lci - Error Handling Framework
// =============================================================================
// Error handling for the lci chunk decoding library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - LCIException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read failure)
// - 3-12: Decode failures, one code per malformed condition
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef LCI_COMMON_ERROR_H
#define LCI_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace lci {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read failure, permission denied, etc.
    kIOError = 2,

    /// @brief Premature end of input.
    /// @note The header frame or the declared body length could not be read.
    kTruncated = 3,

    /// @brief Body does not start with the chunk magic number.
    kBadMagic = 4,

    /// @brief Stored and computed checksums differ.
    /// @note Never raised by the decoder itself; used by verification.
    kChecksumMismatch = 5,

    /// @brief Unknown format byte or codec code.
    kUnknownCodec = 6,

    /// @brief A decompressor could not be constructed.
    kCodecInitError = 7,

    /// @brief A header field could not be decoded in its expected encoding.
    kMalformedField = 8,

    /// @brief A variable-length integer is truncated or overflows 64 bits.
    kMalformedVarint = 9,

    /// @brief An entry's declared line length exceeds the remaining bytes.
    kTruncatedEntry = 10,

    /// @brief The metadata directory could not be located or decoded.
    kDirectoryDecodeError = 11,

    /// @brief A block payload could not be sliced or decompressed.
    kDecodeError = 12
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kTruncated:
            return "truncated";
        case ErrorCode::kBadMagic:
            return "bad magic";
        case ErrorCode::kChecksumMismatch:
            return "checksum mismatch";
        case ErrorCode::kUnknownCodec:
            return "unknown codec";
        case ErrorCode::kCodecInitError:
            return "codec init error";
        case ErrorCode::kMalformedField:
            return "malformed field";
        case ErrorCode::kMalformedVarint:
            return "malformed varint";
        case ErrorCode::kTruncatedEntry:
            return "truncated entry";
        case ErrorCode::kDirectoryDecodeError:
            return "directory decode error";
        case ErrorCode::kDecodeError:
            return "decode error";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Provides detailed information about where and why an error occurred.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Byte offset in the body buffer where the error occurred.
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all lci errors.
/// @note Provides error code, message, and optional context.
class LCIException : public std::exception {
public:
    LCIException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    LCIException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~LCIException() override = default;

    LCIException(const LCIException&) = default;
    LCIException(LCIException&&) noexcept = default;
    LCIException& operator=(const LCIException&) = default;
    LCIException& operator=(LCIException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for file not found, read failures, permission denied, etc.
class IOError : public LCIException {
public:
    explicit IOError(std::string message)
        : LCIException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : LCIException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : LCIException(ErrorCode::kIOError, formatWithSystemError(message, ec)) {}

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);
};

/// @brief Exception for premature end of input (exit code 3).
class TruncatedError : public LCIException {
public:
    explicit TruncatedError(std::string message)
        : LCIException(ErrorCode::kTruncated, std::move(message)) {}

    TruncatedError(std::string message, ErrorContext context)
        : LCIException(ErrorCode::kTruncated, std::move(message), std::move(context)) {}

    /// @brief Construct with the number of bytes expected and actually read.
    /// @param what Name of the item being read.
    /// @param expected Bytes expected.
    /// @param got Bytes available.
    /// @param context Additional error context.
    TruncatedError(std::string_view what, std::uint64_t expected, std::uint64_t got,
                   ErrorContext context = {})
        : LCIException(ErrorCode::kTruncated, formatTruncated(what, expected, got),
                       std::move(context)),
          expected_(expected),
          got_(got) {}

    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }

    [[nodiscard]] std::optional<std::uint64_t> got() const noexcept { return got_; }

private:
    static std::string formatTruncated(std::string_view what, std::uint64_t expected,
                                       std::uint64_t got);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> got_;
};

/// @brief Exception for an invalid body magic number (exit code 4).
class BadMagicError : public LCIException {
public:
    explicit BadMagicError(std::string message)
        : LCIException(ErrorCode::kBadMagic, std::move(message)) {}

    /// @brief Construct with the magic number actually found.
    BadMagicError(std::uint32_t actual, ErrorContext context)
        : LCIException(ErrorCode::kBadMagic, formatBadMagic(actual), std::move(context)),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint32_t> actual() const noexcept { return actual_; }

private:
    static std::string formatBadMagic(std::uint32_t actual);

    std::optional<std::uint32_t> actual_;
};

/// @brief Exception for unknown format or codec selectors (exit code 6).
class UnknownCodecError : public LCIException {
public:
    explicit UnknownCodecError(std::string message)
        : LCIException(ErrorCode::kUnknownCodec, std::move(message)) {}

    UnknownCodecError(std::string message, ErrorContext context)
        : LCIException(ErrorCode::kUnknownCodec, std::move(message), std::move(context)) {}
};

/// @brief Exception raised by codecs (exit code 7 or 12).
/// @note kCodecInitError when the decompressor cannot be constructed,
///       kDecodeError when the compressed data is corrupt.
class CodecError : public LCIException {
public:
    CodecError(ErrorCode code, std::string message)
        : LCIException(code, std::move(message)) {}

    CodecError(ErrorCode code, std::string message, ErrorContext context)
        : LCIException(code, std::move(message), std::move(context)) {}
};

/// @brief Exception for structurally malformed data (exit codes 8-12).
/// @note Covers malformed header fields, varints, entries, and directories.
class FormatError : public LCIException {
public:
    explicit FormatError(std::string message)
        : LCIException(ErrorCode::kMalformedField, std::move(message)) {}

    FormatError(ErrorCode code, std::string message)
        : LCIException(code, std::move(message)) {}

    FormatError(ErrorCode code, std::string message, ErrorContext context)
        : LCIException(code, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
/// @note Lightweight error type, also stored on blocks that failed to decode.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an LCIException.
    explicit Error(const LCIException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

}  // namespace lci

#endif  // LCI_COMMON_ERROR_H
