#pragma once
// NameNormalizer.hpp – Canonical matching key for registry entity names.
//
// normalize() = ASCII upper-case → collapse and trim whitespace → strip
// trailing corporate-suffix tokens until none matches.  The result is a
// fixed point: normalize(normalize(x)) == normalize(x).

#include <string>
#include <string_view>
#include <vector>

namespace registry {

struct NormalizerConfig {
    // Tried in order; the first token the name ends with is removed.  List a
    // longer token before any shorter token it ends with (", INC." before " INC").
    std::vector<std::string> suffixes;

    [[nodiscard]] static NormalizerConfig defaults();
};

class NameNormalizer {
public:
    // Suffix tokens are upper-cased and whitespace-collapsed on construction
    // so they compare against already-normalised text.
    explicit NameNormalizer(NormalizerConfig config);

    [[nodiscard]] std::string normalize(std::string_view name) const;

    [[nodiscard]] const std::vector<std::string>& suffixes() const noexcept { return suffixes_; }

private:
    std::vector<std::string> suffixes_;
};

} // namespace registry
