// =============================================================================
// lci - Header Decoder
// =============================================================================
// Decodes the header frame that precedes a chunk body.
//
// Frame layout:
//   BE32 metadataLength   (includes these 4 bytes)
//   metadataLength - 4    snappy-framed JSON object:
//                         {"fingerprint", "userID", "from", "through",
//                          "metric": {name: value}, "encoding"}
//   BE32 dataLength
//
// "from" and "through" are model times: seconds with a millisecond fraction,
// given either as a JSON number or a decimal string.
// =============================================================================

#ifndef LCI_FORMAT_HEADER_DECODER_H
#define LCI_FORMAT_HEADER_DECODER_H

#include <istream>
#include <string_view>

#include "lci/common/error.h"
#include "lci/format/chunk_format.h"

namespace lci::format {

/// @brief Decode a header frame, leaving the stream at the first body byte.
/// @throws TruncatedError if the stream ends inside the frame.
/// @throws FormatError (kMalformedField) if a field cannot be decoded.
[[nodiscard]] ChunkHeader decodeHeader(std::istream& stream);

/// @brief Parse a decimal model time ("1700000000.123") into milliseconds.
/// @return kMalformedField if text is not a decimal number.
[[nodiscard]] Result<ModelTime> parseModelTime(std::string_view text);

}  // namespace lci::format

#endif  // LCI_FORMAT_HEADER_DECODER_H
