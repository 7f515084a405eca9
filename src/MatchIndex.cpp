// MatchIndex.cpp – One-shot index construction and lookup.

#include "RegistryCodec/MatchIndex.hpp"

#include <utility>

namespace registry {

MatchIndex MatchIndex::build(std::span<const Entity> entities,
                             const NameNormalizer& normalizer) {
    std::map<std::string, std::string> entries;
    for (const auto& e : entities) {
        if (!e.documentNumber) continue;
        // operator[] assignment: last write wins on a shared key
        entries[normalizer.normalize(e.name)] = *e.documentNumber;
    }
    return MatchIndex(std::move(entries), normalizer);
}

std::optional<std::string> MatchIndex::lookup(std::string_view rawName) const {
    auto it = entries_.find(normalizer_.normalize(rawName));
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

} // namespace registry
