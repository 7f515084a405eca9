#pragma once
// FieldLayout.hpp – Validated column layout for one fixed-width record type.
//
// A record is a fixed head region followed by a tail of repeating officer
// strides:
//
//   [head field 0][head field 1]…[head field n][stride 0][stride 1]…[filler]
//    ^0                                         ^headEnd
//
// officerOffset(i) = headEnd + i × strideWidth.  Every offset is in
// characters from the start of the line.

#include "Types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace registry {

// Thrown when a layout (or a codec binding to it) is structurally invalid.
class LayoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A column with its resolved offset.  For officer columns the offset is
// relative to the start of the stride.
struct FieldSlot {
    std::string name;
    size_t      offset{0};
    size_t      width{0};
    bool        is_spare{false};
};

class FieldLayout {
public:
    // Validates `def` and computes all offsets.  Throws LayoutError.
    explicit FieldLayout(LayoutDef def);

    [[nodiscard]] size_t totalWidth()  const noexcept { return total_width_; }
    [[nodiscard]] size_t headEnd()     const noexcept { return head_end_; }
    [[nodiscard]] size_t strideWidth() const noexcept { return stride_width_; }
    [[nodiscard]] size_t maxOfficers() const noexcept { return max_officers_; }

    [[nodiscard]] const std::vector<FieldSlot>& headFields()    const noexcept { return head_; }
    [[nodiscard]] const std::vector<FieldSlot>& officerFields() const noexcept { return officer_; }

    // Offset of a named head field.  Throws LayoutError if not declared.
    [[nodiscard]] size_t offsetOf(std::string_view field) const;

    // Offset of a named officer field within one stride.
    [[nodiscard]] size_t officerFieldOffset(std::string_view field) const;

    // Start of officer stride `index`.  Throws LayoutError past maxOfficers().
    [[nodiscard]] size_t officerOffset(size_t index) const;

    [[nodiscard]] std::optional<FieldSlot> findHead(std::string_view field) const;
    [[nodiscard]] std::optional<FieldSlot> findOfficer(std::string_view field) const;

private:
    std::vector<FieldSlot> head_;
    std::vector<FieldSlot> officer_;
    size_t total_width_{0};
    size_t head_end_{0};
    size_t stride_width_{0};
    size_t max_officers_{0};
};

// The 1440-column corporate data layout (cordata*.txt extracts).
[[nodiscard]] LayoutDef   cordataLayoutDef();
[[nodiscard]] FieldLayout cordataLayout();

} // namespace registry
