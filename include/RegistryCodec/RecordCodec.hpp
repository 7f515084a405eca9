#pragma once
// RecordCodec.hpp – Fixed-width record encode / decode API.
//
// Usage example:
//   RecordCodec codec{cordataLayout()};
//
//   // Decode one line (newline already stripped):
//   Entity e = codec.decode(line);
//
//   // Re-serialise; the result is always layout().totalWidth() characters:
//   std::string out = codec.encode(e);

#include "FieldLayout.hpp"
#include "Types.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace registry {

enum class FormatErrorKind {
    LengthMismatch, // line length differs from the layout's total width
};

// Thrown by RecordCodec::decode for a line of the wrong length.  Per record: a batch
// decode turns it into an invalid DecodedLine and carries on.
class FormatError : public std::runtime_error {
public:
    FormatError(FormatErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] FormatErrorKind kind() const noexcept { return kind_; }

private:
    FormatErrorKind kind_;
};

class RecordCodec {
public:
    // Binds every named column of `layout` to an Entity member.
    // Throws LayoutError for a column name the codec does not know.
    explicit RecordCodec(FieldLayout layout);

    [[nodiscard]] const FieldLayout& layout() const noexcept { return layout_; }

    // ── Decode ───────────────────────────────────────────────────────────────
    // Decode one record.  Throws FormatError (LengthMismatch) if the line is
    // not exactly layout().totalWidth() characters.  A date column that is
    // not eight digits is kept in Entity::fileDateText.
    [[nodiscard]] Entity decode(std::string_view line) const;

    // Decode every line independently.  Results keep input order and carry
    // their line index; malformed lines are marked invalid, not thrown.
    [[nodiscard]] DecodedBatch decodeBatch(std::span<const std::string> lines) const;

    // ── Encode ───────────────────────────────────────────────────────────────
    // Encode one record.  Over-long values are truncated to their column,
    // officers beyond maxOfficers() are dropped.  Never fails.
    [[nodiscard]] std::string encode(const Entity& entity) const;

    // Column targets, resolved once from the layout's field names.
    enum class Target : uint8_t {
        DocumentNumber, Name, Status, EntityType, FileDate,
        PrincipalAddress, MailingAddress,
        AgentName, AgentType, AgentAddress,
        ManagerName, ManagerType, ManagerAddress,
        OfficerTitle, OfficerType, OfficerName, OfficerAddress,
    };

    enum class AddressPart : uint8_t {
        None, Line1, Line2, City, State, PostalCode, Country,
    };

private:
    struct Binding {
        FieldSlot   slot;
        Target      target{Target::Name};
        AddressPart part{AddressPart::None};
    };

    FieldLayout          layout_;
    std::vector<Binding> head_;
    std::vector<Binding> officer_;
    FieldSlot            title_;   // officer title column, valid when maxOfficers() > 0

    [[nodiscard]] static Binding bindHead(const FieldSlot& slot);
    [[nodiscard]] static Binding bindOfficer(const FieldSlot& slot);
};

} // namespace registry
