// =============================================================================
// lci - Chunk Format Implementation
// =============================================================================

#include "lci/format/chunk_format.h"

#include <algorithm>

namespace lci::format {

std::optional<std::string_view> ChunkHeader::label(std::string_view name) const noexcept {
    auto it = std::lower_bound(labels.begin(), labels.end(), name,
                               [](const Label& l, std::string_view n) { return l.name < n; });
    if (it == labels.end() || it->name != name) {
        return std::nullopt;
    }
    return std::string_view(it->value);
}

bool Block::boundsConsistent() const noexcept {
    if (descriptor.minT > descriptor.maxT) {
        return false;
    }
    return std::all_of(entries.begin(), entries.end(), [this](const Entry& e) {
        return e.timestamp >= descriptor.minT && e.timestamp <= descriptor.maxT;
    });
}

}  // namespace lci::format
