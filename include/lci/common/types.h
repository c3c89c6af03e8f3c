// =============================================================================
// lci - Common Type Definitions
// =============================================================================
// Core type aliases and constants shared by the lci library.
//
// This module defines:
// - Timestamp, ModelTime: nanosecond and millisecond epoch timestamps
// - Checksum, Digest: CRC32C checksum and SHA-256 digest types
// - ByteBuffer, ByteSpan: owned and borrowed byte ranges
// - C++20 Concepts for type constraints
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef LCI_COMMON_TYPES_H
#define LCI_COMMON_TYPES_H

#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <vector>

namespace lci {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Entry and block timestamp, signed nanoseconds since the Unix epoch.
using Timestamp = std::int64_t;

/// @brief Compact header timestamp, milliseconds since the Unix epoch.
using ModelTime = std::int64_t;

/// @brief CRC32 (Castagnoli) checksum value.
using Checksum = std::uint32_t;

/// @brief Size of a SHA-256 digest in bytes.
inline constexpr std::size_t kDigestSize = 32;

/// @brief SHA-256 digest value.
using Digest = std::array<std::uint8_t, kDigestSize>;

/// @brief Owned contiguous byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Borrowed read-only view of bytes.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief Index of a block in directory order.
using BlockIndex = std::uint32_t;

/// @brief System clock time point with nanosecond resolution.
using TimePoint = std::chrono::sys_time<std::chrono::nanoseconds>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Invalid block index sentinel value.
inline constexpr BlockIndex kInvalidBlockIndex = std::numeric_limits<BlockIndex>::max();

/// @brief Nanoseconds per millisecond.
inline constexpr std::int64_t kNanosPerMilli = 1'000'000;

// =============================================================================
// Time Conversion
// =============================================================================

/// @brief Convert a nanosecond epoch timestamp to a time point.
[[nodiscard]] constexpr TimePoint toTimePoint(Timestamp nanos) noexcept {
    return TimePoint{std::chrono::nanoseconds{nanos}};
}

/// @brief Largest model time magnitude whose nanosecond value fits a Timestamp.
inline constexpr ModelTime kMaxModelTime = std::numeric_limits<Timestamp>::max() / kNanosPerMilli;

/// @brief Convert a millisecond model time to a nanosecond epoch timestamp.
/// @pre |millis| <= kMaxModelTime.
[[nodiscard]] constexpr Timestamp modelTimeToNanos(ModelTime millis) noexcept {
    return millis * kNanosPerMilli;
}

// =============================================================================
// Concepts
// =============================================================================

/// @brief Unsigned integer types that can be read from a big-endian field.
template <typename T>
concept BigEndianField = std::unsigned_integral<T> && (sizeof(T) == 1 || sizeof(T) == 2 ||
                                                       sizeof(T) == 4 || sizeof(T) == 8);

/// @brief Decode a big-endian unsigned integer from the start of a byte view.
/// @pre bytes.size() >= sizeof(T).
template <BigEndianField T>
[[nodiscard]] constexpr T readBigEndian(ByteSpan bytes) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | static_cast<T>(bytes[i]));
    }
    return value;
}

}  // namespace lci

#endif  // LCI_COMMON_TYPES_H
