// =============================================================================
// lci - Checksums and Digests Implementation
// =============================================================================

#include "lci/common/checksum.h"

#include <array>
#include <iterator>
#include <memory>

#include <openssl/evp.h>

#include <fmt/format.h>

#include "lci/common/error.h"

namespace lci {

namespace {

/// @brief Reflected Castagnoli polynomial.
constexpr std::uint32_t kCastagnoliPoly = 0x82F63B78;

/// @brief Snappy framing mask delta.
constexpr std::uint32_t kMaskDelta = 0xa282ead8;

constexpr std::array<std::uint32_t, 256> makeCrcTable() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int j = 0; j < 8; ++j) {
            c = (c >> 1) ^ (kCastagnoliPoly & (0U - (c & 1U)));
        }
        table[i] = c;
    }
    return table;
}

constexpr auto kCrcTable = makeCrcTable();

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

}  // namespace

Checksum crc32cExtend(Checksum crc, ByteSpan data) noexcept {
    std::uint32_t c = ~crc;
    for (std::uint8_t byte : data) {
        c = (c >> 8) ^ kCrcTable[(c ^ byte) & 0xFF];
    }
    return ~c;
}

Checksum crc32c(ByteSpan data) noexcept {
    return crc32cExtend(0, data);
}

Checksum maskedCrc32c(ByteSpan data) noexcept {
    const std::uint32_t c = crc32c(data);
    return ((c >> 15) | (c << 17)) + kMaskDelta;
}

Digest sha256(ByteSpan data) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw IOError("Failed to create SHA-256 digest context");
    }

    Digest digest{};
    unsigned int digestLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLen) != 1 ||
        digestLen != digest.size()) {
        throw IOError("SHA-256 digest computation failed");
    }
    return digest;
}

std::string toHex(const Digest& digest) {
    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t byte : digest) {
        fmt::format_to(std::back_inserter(out), "{:02x}", byte);
    }
    return out;
}

}  // namespace lci
