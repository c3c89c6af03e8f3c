// =============================================================================
// lci - Entry Stream Decoder Implementation
// =============================================================================

#include "lci/format/entry_decoder.h"

#include <format>

namespace lci::format {

Result<std::optional<Entry>> EntryReader::next() {
    using R = std::optional<Entry>;

    if (cursor_.atEnd()) {
        return R{};
    }

    const std::size_t start = cursor_.position();
    auto fail = [&](std::string_view what) {
        return makeError<R>(ErrorCode::kTruncatedEntry,
                            std::format("entry {} at offset {}: {}", count_, start, what));
    };

    auto timestamp = cursor_.readVarint();
    if (!timestamp) {
        return fail(timestamp.error().message());
    }
    auto length = cursor_.readUvarint();
    if (!length) {
        return fail(length.error().message());
    }
    if (*length > cursor_.remaining()) {
        return fail(std::format("line length {} exceeds {} remaining bytes", *length,
                                cursor_.remaining()));
    }
    auto line = cursor_.readBytes(static_cast<std::size_t>(*length));
    if (!line) {
        return fail(line.error().message());
    }

    ++count_;
    return R{Entry{*timestamp, std::string(reinterpret_cast<const char*>(line->data()),
                                           line->size())}};
}

VoidResult decodeEntries(ByteSpan data, std::vector<Entry>& out) {
    EntryReader reader(data);
    for (;;) {
        auto entry = reader.next();
        if (!entry) {
            return std::unexpected(entry.error());
        }
        if (!entry->has_value()) {
            return makeVoidSuccess();
        }
        out.push_back(std::move(**entry));
    }
}

void appendEntry(ByteBuffer& out, const Entry& entry) {
    appendVarint(out, entry.timestamp);
    appendUvarint(out, entry.line.size());
    out.insert(out.end(), entry.line.begin(), entry.line.end());
}

}  // namespace lci::format
