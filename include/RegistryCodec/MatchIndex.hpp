#pragma once
// MatchIndex.hpp – Read-only canonical-name → document-number index.
//
// Usage example:
//   NameNormalizer norm{NormalizerConfig::defaults()};
//   MatchIndex idx = MatchIndex::build(entities, norm);
//
//   if (auto doc = idx.lookup("Pelican Bay Foundation, Inc."))
//       use(*doc);

#include "NameNormalizer.hpp"
#include "Types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace registry {

class MatchIndex {
public:
    // Build from a finished batch.  For each entity with a document number,
    // in order, normalize(name) → documentNumber; when two entities share a
    // key the later one wins.  Entities without a document number are skipped.
    [[nodiscard]] static MatchIndex build(std::span<const Entity> entities,
                                          const NameNormalizer& normalizer);

    // Document number for normalize(rawName), or std::nullopt when absent.
    [[nodiscard]] std::optional<std::string> lookup(std::string_view rawName) const;

    [[nodiscard]] size_t size()  const noexcept { return entries_.size(); }
    [[nodiscard]] bool   empty() const noexcept { return entries_.empty(); }

    // Ordered view of all entries, for serialisation.
    [[nodiscard]] const std::map<std::string, std::string>& entries() const noexcept {
        return entries_;
    }

private:
    MatchIndex(std::map<std::string, std::string> entries, NameNormalizer normalizer)
        : entries_(std::move(entries)), normalizer_(std::move(normalizer)) {}

    std::map<std::string, std::string> entries_;
    NameNormalizer                     normalizer_;
};

} // namespace registry
