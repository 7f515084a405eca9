// NameNormalizer.cpp – Suffix-stripping canonicaliser for entity names.

#include "RegistryCodec/NameNormalizer.hpp"

#include <utility>

namespace registry {

// ─── ASCII helpers (no locale) ────────────────────────────────────────────────

static bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static char toUpper(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

// Upper-case, collapse whitespace runs to one space, trim both ends.
static std::string canonicalText(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (isSpace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(toUpper(c));
    }
    return out;
}

static bool endsWith(const std::string& s, const std::string& tail) {
    return s.size() >= tail.size() &&
           s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
}

static void trimRight(std::string& s) {
    while (!s.empty() && s.back() == ' ') s.pop_back();
}

// ─── NormalizerConfig ─────────────────────────────────────────────────────────

NormalizerConfig NormalizerConfig::defaults() {
    NormalizerConfig cfg;
    cfg.suffixes = {
        ", INCORPORATED", " INCORPORATED",
        ", INC.", ", INC", " INC.", " INC",
        ", L.L.C.", " L.L.C.", ", LLC", " LLC",
        ", CORPORATION", " CORPORATION",
        ", CORP.", ", CORP", " CORP.", " CORP",
        ", CO.", " CO.",
    };
    return cfg;
}

// ─── NameNormalizer ───────────────────────────────────────────────────────────

NameNormalizer::NameNormalizer(NormalizerConfig config) {
    suffixes_.reserve(config.suffixes.size());
    for (auto& token : config.suffixes) {
        // Keep the leading separator (", " or " ") that makes a token
        // match only at a word boundary; canonicalText would trim it.
        bool lead_space = !token.empty() && isSpace(token.front());
        std::string t = canonicalText(token);
        if (t.empty()) continue;
        if (lead_space) t.insert(t.begin(), ' ');
        suffixes_.push_back(std::move(t));
    }
}

std::string NameNormalizer::normalize(std::string_view name) const {
    std::string key = canonicalText(name);

    // Each pass removes one token; restart from the top of the list so that
    // the configured precedence applies to the new tail as well.
    bool stripped = true;
    while (stripped && !key.empty()) {
        stripped = false;
        for (const auto& token : suffixes_) {
            if (endsWith(key, token)) {
                key.resize(key.size() - token.size());
                trimRight(key);
                stripped = true;
                break;
            }
        }
    }
    return key;
}

} // namespace registry
