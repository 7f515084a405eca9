#pragma once
// Types.hpp – Entity value types and layout descriptors for the registry codec.
// Every decoded record and every layout definition flows through these structures.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace registry {

// ─── Registry status column ──────────────────────────────────────────────────
// Registries add new status codes over time; anything not listed here
// decodes to Unknown instead of failing.
enum class EntityStatus {
    Active,   // 'A'
    Inactive, // 'I'
    Unknown,  // any other code, including blank
};

// ─── Officer role derived from the 4-character title code ────────────────────
enum class OfficerRole {
    President,     // "PRES"
    VicePresident, // "VICE", "VP"
    Treasurer,     // "TREA"
    Secretary,     // "SECR"
    Director,      // "DIRE"
    Other,
};

// ─── Date column, serialised as YYYYMMDD ─────────────────────────────────────
// Any eight digits decode to a Date, including the registry's "00000000"
// placeholder; isCalendarDate() tells a real Gregorian date apart.
struct Date {
    int year{0};
    int month{0};
    int day{0};

    [[nodiscard]] bool isCalendarDate() const noexcept;

    bool operator==(const Date&) const = default;
};

struct Address {
    std::string line1;
    std::string line2;
    std::string city;
    std::string state;
    std::string postalCode;
    std::string country;

    bool operator==(const Address&) const = default;
};

// Registered agent or property manager block.
struct Party {
    std::string name;
    std::string type;    // 'P' person / 'C' corporation by convention
    Address     address;

    bool operator==(const Party&) const = default;
};

struct Officer {
    std::string title;   // "PRES", "VICE", "TREA", "SECR", "DIRE", …
    std::string type;
    std::string name;
    Address     address;

    [[nodiscard]] OfficerRole role() const noexcept;

    bool operator==(const Officer&) const = default;
};

// ─── One registry record ─────────────────────────────────────────────────────
struct Entity {
    std::optional<std::string> documentNumber; // absent when the column is blank
    std::string                name;
    EntityStatus               status{EntityStatus::Unknown};
    std::string                entityType;
    Address                    principalAddress;
    Address                    mailingAddress;
    std::optional<Date>        fileDate;
    std::string                fileDateText; // column text when it is not YYYYMMDD digits
    Party                      registeredAgent;
    Party                      propertyManager;
    std::vector<Officer>       officers;

    bool operator==(const Entity&) const = default;
};

// ─── A single column declaration inside a layout ─────────────────────────────
// Spare columns carry no name and are always written as spaces.
struct FieldDef {
    std::string name;
    size_t      width{0};
    bool        is_spare{false};
};

// ─── Declarative layout description (input to FieldLayout) ───────────────────
struct LayoutDef {
    size_t                total_width{0};
    std::vector<FieldDef> head;          // fixed head region, in column order
    std::vector<FieldDef> officer;       // one officer stride, in column order
    size_t                max_officers{0};
};

// ─── Result of decoding one line of a batch ──────────────────────────────────
struct DecodedLine {
    size_t      index{0};  // 0-based position in the input batch
    Entity      entity;    // meaningful only when valid
    bool        valid{true};
    std::string error;
};

struct DecodedBatch {
    std::vector<DecodedLine> lines;
    size_t                   rejected{0};

    // Valid entities in input order.
    [[nodiscard]] std::vector<Entity> entities() const;
};

// Status helpers shared by the codec and its tests.
[[nodiscard]] EntityStatus statusFromCode(char code) noexcept;
[[nodiscard]] char         statusCode(EntityStatus status) noexcept;
[[nodiscard]] const char*  statusName(EntityStatus status) noexcept;

} // namespace registry
