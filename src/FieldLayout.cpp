// FieldLayout.cpp – Offset computation and validation for fixed-width layouts.

#include "RegistryCodec/FieldLayout.hpp"

#include <limits>
#include <set>
#include <string>

namespace registry {

// ─── Region helpers ───────────────────────────────────────────────────────────

// Lay out one region's columns back to back from offset 0, rejecting zero
// widths and duplicate names.  Returns the region width.
static size_t layRegion(const std::vector<FieldDef>& defs,
                        std::vector<FieldSlot>& out,
                        const char* region) {
    std::set<std::string> seen;
    size_t offset = 0;
    for (const auto& d : defs) {
        if (d.width == 0)
            throw LayoutError(std::string(region) + " field '" +
                              (d.is_spare ? std::string("<spare>") : d.name) +
                              "' has non-positive width");
        if (!d.is_spare) {
            if (d.name.empty())
                throw LayoutError(std::string(region) + " field at offset " +
                                  std::to_string(offset) + " has no name");
            if (!seen.insert(d.name).second)
                throw LayoutError(std::string(region) + " field '" + d.name +
                                  "' declared twice");
        }
        if (d.width > std::numeric_limits<size_t>::max() - offset)
            throw LayoutError(std::string(region) + " width overflows");

        out.push_back(FieldSlot{d.is_spare ? std::string{} : d.name, offset, d.width, d.is_spare});
        offset += d.width;
    }
    return offset;
}

static std::optional<FieldSlot> findSlot(const std::vector<FieldSlot>& slots,
                                         std::string_view field) {
    for (const auto& s : slots) {
        if (!s.is_spare && s.name == field) return s;
    }
    return std::nullopt;
}

// ─── Construction ─────────────────────────────────────────────────────────────

FieldLayout::FieldLayout(LayoutDef def)
    : total_width_(def.total_width),
      max_officers_(def.max_officers) {
    if (total_width_ == 0)
        throw LayoutError("Layout total width must be positive");

    head_end_     = layRegion(def.head, head_, "Head");
    stride_width_ = layRegion(def.officer, officer_, "Officer");

    if (max_officers_ > 0) {
        if (stride_width_ == 0)
            throw LayoutError("Officer stride is empty but max officers is " +
                              std::to_string(max_officers_));
        if (!findSlot(officer_, "title"))
            throw LayoutError("Officer stride has no 'title' field to terminate the list");
    }

    // headEnd + strideWidth × maxOfficers ≤ totalWidth, checked without wraparound.
    if (head_end_ > total_width_)
        throw LayoutError("Head region (" + std::to_string(head_end_) +
                          ") exceeds record width (" + std::to_string(total_width_) + ")");
    size_t room = total_width_ - head_end_;
    if (max_officers_ > 0 && stride_width_ > room / max_officers_)
        throw LayoutError("Officer region (" + std::to_string(stride_width_) + " x " +
                          std::to_string(max_officers_) + ") does not fit after head end " +
                          std::to_string(head_end_) + " in record width " +
                          std::to_string(total_width_));
}

// ─── Offset queries ───────────────────────────────────────────────────────────

std::optional<FieldSlot> FieldLayout::findHead(std::string_view field) const {
    return findSlot(head_, field);
}

std::optional<FieldSlot> FieldLayout::findOfficer(std::string_view field) const {
    return findSlot(officer_, field);
}

size_t FieldLayout::offsetOf(std::string_view field) const {
    auto s = findHead(field);
    if (!s)
        throw LayoutError("Head field '" + std::string(field) + "' not declared");
    return s->offset;
}

size_t FieldLayout::officerFieldOffset(std::string_view field) const {
    auto s = findOfficer(field);
    if (!s)
        throw LayoutError("Officer field '" + std::string(field) + "' not declared");
    return s->offset;
}

size_t FieldLayout::officerOffset(size_t index) const {
    if (index >= max_officers_)
        throw LayoutError("Officer index " + std::to_string(index) +
                          " out of range (max " + std::to_string(max_officers_) + ")");
    return head_end_ + index * stride_width_;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Corporate data layout
// ─────────────────────────────────────────────────────────────────────────────
// Columns 480–543 carry registry bookkeeping this library does not model and
// are kept as a spare.  Officers start at column 668, 128 characters each.

LayoutDef cordataLayoutDef() {
    LayoutDef def;
    def.total_width  = 1440;
    def.max_officers = 6;

    auto field = [](const char* name, size_t width) { return FieldDef{name, width, false}; };
    auto spare = [](size_t width) { return FieldDef{{}, width, true}; };

    def.head = {
        field("documentNumber", 12),
        field("name", 192),
        field("status", 1),
        field("entityType", 15),
    };
    for (const char* block : {"principalAddress", "mailingAddress"}) {
        std::string p(block);
        def.head.push_back(field((p + ".line1").c_str(), 42));
        def.head.push_back(field((p + ".line2").c_str(), 42));
        def.head.push_back(field((p + ".city").c_str(), 28));
        def.head.push_back(field((p + ".state").c_str(), 2));
        def.head.push_back(field((p + ".postalCode").c_str(), 10));
        def.head.push_back(field((p + ".country").c_str(), 2));
    }
    def.head.push_back(field("fileDate", 8));
    def.head.push_back(spare(64));
    def.head.push_back(field("registeredAgent.name", 42));
    def.head.push_back(field("registeredAgent.type", 1));
    def.head.push_back(field("registeredAgent.line1", 42));
    def.head.push_back(field("registeredAgent.city", 28));
    def.head.push_back(field("registeredAgent.state", 2));
    def.head.push_back(field("registeredAgent.postalCode", 9));

    def.officer = {
        field("title", 4),
        field("type", 1),
        field("name", 42),
        field("line1", 42),
        field("city", 28),
        field("state", 2),
        field("postalCode", 9),
    };
    return def;
}

FieldLayout cordataLayout() {
    return FieldLayout(cordataLayoutDef());
}

} // namespace registry
