// =============================================================================
// lci - Header Decoder Implementation
// =============================================================================

#include "lci/format/header_decoder.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <format>
#include <spanstream>
#include <string>

#include <nlohmann/json.hpp>

#include "lci/common/logger.h"
#include "lci/io/compressed_stream.h"

namespace lci::format {

namespace {

using json = nlohmann::json;

/// @brief Whole seconds whose millisecond value stays within kMaxModelTime.
constexpr std::int64_t kMaxModelSeconds = kMaxModelTime / 1000;

/// @brief Read a 4-byte big-endian length field.
std::uint32_t readLengthField(std::istream& stream, std::string_view what) {
    std::array<std::uint8_t, kHeaderLengthFieldSize> bytes{};
    stream.read(reinterpret_cast<char*>(bytes.data()), bytes.size());
    const auto got = static_cast<std::uint64_t>(stream.gcount());
    if (got != bytes.size()) {
        throw TruncatedError(what, bytes.size(), got);
    }
    return readBigEndian<std::uint32_t>(bytes);
}

ModelTime modelTimeField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return 0;
    }
    if (it->is_string()) {
        auto parsed = parseModelTime(it->get_ref<const std::string&>());
        if (!parsed) {
            throw FormatError(std::format("header field '{}': {}", key, parsed.error().message()));
        }
        return *parsed;
    }
    if (it->is_number_unsigned()) {
        const auto seconds = it->get<std::uint64_t>();
        if (seconds > static_cast<std::uint64_t>(kMaxModelSeconds)) {
            throw FormatError(std::format("header field '{}': {} out of range", key, seconds));
        }
        return static_cast<ModelTime>(seconds) * 1000;
    }
    if (it->is_number_integer()) {
        const auto seconds = it->get<std::int64_t>();
        if (seconds < -kMaxModelSeconds || seconds > kMaxModelSeconds) {
            throw FormatError(std::format("header field '{}': {} out of range", key, seconds));
        }
        return seconds * 1000;
    }
    if (it->is_number_float()) {
        const double millis = it->get<double>() * 1000.0;
        if (!std::isfinite(millis) || std::fabs(millis) > static_cast<double>(kMaxModelTime)) {
            throw FormatError(std::format("header field '{}': {} out of range", key,
                                          it->get<double>()));
        }
        return static_cast<ModelTime>(std::llround(millis));
    }
    throw FormatError(std::format("header field '{}' is not a timestamp", key));
}

ChunkHeader headerFromJson(const json& object) {
    if (!object.is_object()) {
        throw FormatError("header metadata is not a JSON object");
    }

    ChunkHeader header;
    try {
        header.fingerprint = object.value("fingerprint", std::uint64_t{0});
        header.userId = object.value("userID", std::string{});
        header.encoding = object.value("encoding", std::uint8_t{0});

        if (auto metric = object.find("metric"); metric != object.end() && !metric->is_null()) {
            if (!metric->is_object()) {
                throw FormatError("header field 'metric' is not an object");
            }
            for (const auto& [name, value] : metric->items()) {
                header.labels.push_back(Label{name, value.get<std::string>()});
            }
        }
    } catch (const json::exception& e) {
        throw FormatError(std::format("malformed header metadata: {}", e.what()));
    }

    // JSON object keys are unique, only the order needs fixing
    std::sort(header.labels.begin(), header.labels.end(),
              [](const Label& a, const Label& b) { return a.name < b.name; });

    header.from = modelTimeField(object, "from");
    header.through = modelTimeField(object, "through");
    return header;
}

}  // namespace

Result<ModelTime> parseModelTime(std::string_view text) {
    auto malformed = [&] {
        return makeError<ModelTime>(ErrorCode::kMalformedField,
                                    std::format("invalid model time '{}'", text));
    };

    const auto dot = text.find('.');
    const std::string_view secondsText = text.substr(0, dot);
    std::string_view fractionText = dot == std::string_view::npos ? std::string_view{}
                                                                  : text.substr(dot + 1);

    std::int64_t seconds = 0;
    auto [end, ec] = std::from_chars(secondsText.data(), secondsText.data() + secondsText.size(),
                                     seconds);
    if (ec != std::errc{} || end != secondsText.data() + secondsText.size()) {
        return malformed();
    }

    if (seconds < -kMaxModelSeconds || seconds > kMaxModelSeconds) {
        return makeError<ModelTime>(ErrorCode::kMalformedField,
                                    std::format("model time '{}' out of range", text));
    }

    std::int64_t millis = 0;
    if (dot != std::string_view::npos) {
        if (fractionText.empty() || fractionText.size() > 3 ||
            !std::all_of(fractionText.begin(), fractionText.end(),
                         [](char c) { return c >= '0' && c <= '9'; })) {
            return malformed();
        }
        for (std::size_t i = 0; i < 3; ++i) {
            millis = millis * 10 + (i < fractionText.size() ? fractionText[i] - '0' : 0);
        }
    }

    const ModelTime value =
        secondsText.starts_with('-') ? seconds * 1000 - millis : seconds * 1000 + millis;
    if (value < -kMaxModelTime || value > kMaxModelTime) {
        return makeError<ModelTime>(ErrorCode::kMalformedField,
                                    std::format("model time '{}' out of range", text));
    }
    return value;
}

ChunkHeader decodeHeader(std::istream& stream) {
    const std::uint32_t metadataLength = readLengthField(stream, "metadata length");
    if (metadataLength < kHeaderLengthFieldSize) {
        throw FormatError(std::format("metadata length {} is smaller than its own field",
                                      metadataLength));
    }

    const std::size_t encodedSize = metadataLength - kHeaderLengthFieldSize;
    std::string encoded(encodedSize, '\0');
    stream.read(encoded.data(), static_cast<std::streamsize>(encodedSize));
    const auto got = static_cast<std::uint64_t>(stream.gcount());
    if (got != encodedSize) {
        throw TruncatedError("header metadata", encodedSize, got);
    }

    ByteBuffer plain;
    try {
        std::ispanstream encodedStream(std::span<char>(encoded.data(), encoded.size()));
        io::DecompressingStream metadata(encodedStream, io::CompressionFormat::kSnappyFramed);
        plain = io::readAll(metadata);
    } catch (const CodecError& e) {
        throw FormatError(std::format("header metadata: {}", e.message()));
    }

    json object = json::parse(plain.begin(), plain.end(), nullptr, false);
    if (object.is_discarded()) {
        throw FormatError("header metadata is not valid JSON");
    }

    ChunkHeader header = headerFromJson(object);
    header.metadataLength = metadataLength;
    header.dataLength = readLengthField(stream, "data length");

    LCI_LOG_DEBUG("Decoded header: user={}, labels={}, dataLength={}", header.userId,
                  header.labels.size(), header.dataLength);
    return header;
}

}  // namespace lci::format
