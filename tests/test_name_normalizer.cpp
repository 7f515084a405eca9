// test_name_normalizer.cpp – Canonical key rules for entity names.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_name_normalizer

#include "RegistryCodec/NameNormalizer.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace registry;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: default suffix list
// ─────────────────────────────────────────────────────────────────────────────
static void testDefaults(const NameNormalizer& n) {
    std::cout << "\n=== Test: default suffixes ===\n";

    CHECK(n.normalize("ABC ASSOCIATION, INC.") == "ABC ASSOCIATION", "', INC.' stripped");
    CHECK(n.normalize("ABC ASSOCIATION INC")   == "ABC ASSOCIATION", "' INC' stripped");
    CHECK(n.normalize("ABC ASSOCIATION, INC.") == n.normalize("ABC ASSOCIATION INC"),
          "both spellings share a key");
    CHECK(n.normalize("PELICAN BAY FOUNDATION INC") == "PELICAN BAY FOUNDATION",
          "Pelican Bay key");
    CHECK(n.normalize("pelican bay foundation inc.") == "PELICAN BAY FOUNDATION",
          "lower-case with ' INC.' reaches the same key");
    CHECK(n.normalize("Gulf Coast Management Group LLC") == "GULF COAST MANAGEMENT GROUP",
          "' LLC' stripped");
    CHECK(n.normalize("ACME HOLDINGS, INCORPORATED") == "ACME HOLDINGS",
          "', INCORPORATED' stripped whole");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: case folding and whitespace
// ─────────────────────────────────────────────────────────────────────────────
static void testWhitespace(const NameNormalizer& n) {
    std::cout << "\n=== Test: case and whitespace ===\n";

    CHECK(n.normalize("  pelican   bay\tfoundation  inc. ") == "PELICAN BAY FOUNDATION",
          "runs collapsed, ends trimmed, suffix stripped");
    CHECK(n.normalize("") == "", "empty stays empty");
    CHECK(n.normalize(" \t\n ") == "", "whitespace only → empty");
    CHECK(n.normalize("Café Royale") == "CAFé ROYALE", "non-ASCII bytes untouched");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: only whole trailing tokens are removed
// ─────────────────────────────────────────────────────────────────────────────
static void testTrailingOnly(const NameNormalizer& n) {
    std::cout << "\n=== Test: trailing tokens only ===\n";

    CHECK(n.normalize("ACME INCUBATOR") == "ACME INCUBATOR", "INC inside a word kept");
    CHECK(n.normalize("PRINCE") == "PRINCE", "word ending in INC-like letters kept");
    CHECK(n.normalize("INC") == "INC", "bare token without separator kept");
    CHECK(n.normalize("ABC INC OF FLORIDA") == "ABC INC OF FLORIDA", "non-trailing token kept");
    CHECK(n.normalize("ACME CORP INC") == "ACME", "stacked suffixes stripped in turn");
    CHECK(n.normalize("ACME INC INC") == "ACME", "repeated suffix stripped");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: configured order decides between overlapping tokens
// ─────────────────────────────────────────────────────────────────────────────
static void testOrdering() {
    std::cout << "\n=== Test: suffix precedence ===\n";

    NameNormalizer longest_first{NormalizerConfig{{", INC.", " INC."}}};
    CHECK(longest_first.normalize("ABC, INC.") == "ABC", "', INC.' first → clean key");

    NameNormalizer shortest_first{NormalizerConfig{{" INC.", ", INC."}}};
    CHECK(shortest_first.normalize("ABC, INC.") == "ABC,", "' INC.' first leaves a comma");

    NameNormalizer none{NormalizerConfig{}};
    CHECK(none.normalize("abc inc") == "ABC INC", "empty list: fold and trim only");

    NameNormalizer lower{NormalizerConfig{{" inc", "  llc"}}};
    CHECK(lower.suffixes().size() == 2, "two tokens kept");
    CHECK(lower.suffixes()[0] == " INC", "token upper-cased");
    CHECK(lower.suffixes()[1] == " LLC", "token whitespace collapsed");
    CHECK(lower.normalize("Abc Inc") == "ABC", "lower-case token still matches");

    NameNormalizer blank{NormalizerConfig{{"   ", ""}}};
    CHECK(blank.suffixes().empty(), "blank tokens ignored");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: normalize(normalize(x)) == normalize(x)
// ─────────────────────────────────────────────────────────────────────────────
static void testIdempotence(const NameNormalizer& n) {
    std::cout << "\n=== Test: idempotence ===\n";
    const std::vector<std::string> samples = {
        "", " ", ", INC.", " INC", "INC", "ABC, INC", "ABC,INC.",
        "a  b  c corp.", "X INC INC", "THE  BROOKS\tCOMMUNITY ASSOCIATION INC",
        "Sunset Villas Condominium Association Inc", "ROYAL PALM, L.L.C.",
        "ACME CO. INC.", "  trailing  spaces   ", "MIXED, Inc. , LLC",
    };
    NameNormalizer shortest_first{NormalizerConfig{{" INC.", ", INC."}}};
    for (const auto& s : samples) {
        std::string once = n.normalize(s);
        CHECK(n.normalize(once) == once, "defaults idempotent for '" + s + "'");
        std::string alt = shortest_first.normalize(s);
        CHECK(shortest_first.normalize(alt) == alt, "alt list idempotent for '" + s + "'");
    }
}

int main() {
    NameNormalizer n{NormalizerConfig::defaults()};

    testDefaults(n);
    testWhitespace(n);
    testTrailingOnly(n);
    testOrdering();
    testIdempotence(n);

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
