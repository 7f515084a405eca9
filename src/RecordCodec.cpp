// RecordCodec.cpp – Fixed-width decode/encode engine driven by a FieldLayout.
//
// Record reminder:
//   Record  = [head columns…][officer stride × maxOfficers][filler]
//   Stride  = [title][type][name][address columns…]
//   A stride whose title column is entirely blank ends the officer list.
//
// Column names bind to Entity members as "<member>" or "<block>.<part>",
// e.g. "name", "principalAddress.city", "registeredAgent.type".

#include "RegistryCodec/RecordCodec.hpp"
#include "RegistryCodec/TextCursor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>

namespace registry {

using Target      = RecordCodec::Target;
using AddressPart = RecordCodec::AddressPart;

// ─────────────────────────────────────────────────────────────────────────────
//  Name resolution
// ─────────────────────────────────────────────────────────────────────────────

static AddressPart parseAddressPart(std::string_view s) {
    if (s == "line1")      return AddressPart::Line1;
    if (s == "line2")      return AddressPart::Line2;
    if (s == "city")       return AddressPart::City;
    if (s == "state")      return AddressPart::State;
    if (s == "postalCode") return AddressPart::PostalCode;
    if (s == "country")    return AddressPart::Country;
    return AddressPart::None;
}

// Split "block.part"; part is empty for a plain member name.
static std::pair<std::string_view, std::string_view> splitName(std::string_view name) {
    size_t dot = name.find('.');
    if (dot == std::string_view::npos) return {name, {}};
    return {name.substr(0, dot), name.substr(dot + 1)};
}

RecordCodec::Binding RecordCodec::bindHead(const FieldSlot& slot) {
    Binding b;
    b.slot = slot;
    auto [block, part] = splitName(slot.name);

    auto unknown = [&]() {
        return LayoutError("Unknown head field '" + slot.name + "'");
    };

    if (part.empty()) {
        if      (block == "documentNumber") b.target = Target::DocumentNumber;
        else if (block == "name")           b.target = Target::Name;
        else if (block == "status")         b.target = Target::Status;
        else if (block == "entityType")     b.target = Target::EntityType;
        else if (block == "fileDate")       b.target = Target::FileDate;
        else throw unknown();
        return b;
    }

    if (block == "principalAddress" || block == "mailingAddress") {
        b.target = block == "principalAddress" ? Target::PrincipalAddress : Target::MailingAddress;
        b.part   = parseAddressPart(part);
        if (b.part == AddressPart::None) throw unknown();
        return b;
    }

    bool agent   = block == "registeredAgent";
    bool manager = block == "propertyManager";
    if (!agent && !manager) throw unknown();

    if (part == "name") {
        b.target = agent ? Target::AgentName : Target::ManagerName;
    } else if (part == "type") {
        b.target = agent ? Target::AgentType : Target::ManagerType;
    } else {
        b.target = agent ? Target::AgentAddress : Target::ManagerAddress;
        b.part   = parseAddressPart(part);
        if (b.part == AddressPart::None) throw unknown();
    }
    return b;
}

RecordCodec::Binding RecordCodec::bindOfficer(const FieldSlot& slot) {
    Binding b;
    b.slot = slot;
    if      (slot.name == "title") b.target = Target::OfficerTitle;
    else if (slot.name == "type")  b.target = Target::OfficerType;
    else if (slot.name == "name")  b.target = Target::OfficerName;
    else {
        b.target = Target::OfficerAddress;
        b.part   = parseAddressPart(slot.name);
        if (b.part == AddressPart::None)
            throw LayoutError("Unknown officer field '" + slot.name + "'");
    }
    return b;
}

RecordCodec::RecordCodec(FieldLayout layout)
    : layout_(std::move(layout)) {
    for (const auto& s : layout_.headFields()) {
        if (s.is_spare) continue;
        head_.push_back(bindHead(s));
    }
    for (const auto& s : layout_.officerFields()) {
        if (s.is_spare) continue;
        officer_.push_back(bindOfficer(s));
    }
    if (layout_.maxOfficers() > 0)
        title_ = *layout_.findOfficer("title");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Member access
// ─────────────────────────────────────────────────────────────────────────────
// Templated on constness so encode and decode share one mapping table.

template <typename A>
static auto addressMember(A& a, AddressPart part) -> decltype(&a.line1) {
    switch (part) {
    case AddressPart::Line1:      return &a.line1;
    case AddressPart::Line2:      return &a.line2;
    case AddressPart::City:       return &a.city;
    case AddressPart::State:      return &a.state;
    case AddressPart::PostalCode: return &a.postalCode;
    case AddressPart::Country:    return &a.country;
    case AddressPart::None:       break;
    }
    return nullptr;
}

// Plain text members of an Entity.  DocumentNumber, Status and FileDate are
// converted separately and return nullptr here.
template <typename E>
static auto entityMember(E& e, Target target, AddressPart part) -> decltype(&e.name) {
    switch (target) {
    case Target::Name:             return &e.name;
    case Target::EntityType:       return &e.entityType;
    case Target::PrincipalAddress: return addressMember(e.principalAddress, part);
    case Target::MailingAddress:   return addressMember(e.mailingAddress, part);
    case Target::AgentName:        return &e.registeredAgent.name;
    case Target::AgentType:        return &e.registeredAgent.type;
    case Target::AgentAddress:     return addressMember(e.registeredAgent.address, part);
    case Target::ManagerName:      return &e.propertyManager.name;
    case Target::ManagerType:      return &e.propertyManager.type;
    case Target::ManagerAddress:   return addressMember(e.propertyManager.address, part);
    default:                       break;
    }
    return nullptr;
}

template <typename O>
static auto officerMember(O& o, Target target, AddressPart part) -> decltype(&o.name) {
    switch (target) {
    case Target::OfficerTitle:   return &o.title;
    case Target::OfficerType:    return &o.type;
    case Target::OfficerName:    return &o.name;
    case Target::OfficerAddress: return addressMember(o.address, part);
    default:                     break;
    }
    return nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Date columns (YYYYMMDD)
// ─────────────────────────────────────────────────────────────────────────────

// Eight digits split into year/month/day without calendar checks; anything
// else is not a Date and stays as column text.
static std::optional<Date> parseDate(const std::string& v) {
    if (v.size() != 8)
        return std::nullopt;
    for (char c : v) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    Date d;
    d.year  = std::stoi(v.substr(0, 4));
    d.month = std::stoi(v.substr(4, 2));
    d.day   = std::stoi(v.substr(6, 2));
    return d;
}

static std::string formatDate(const Date& d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d", d.year, d.month, d.day);
    return buf;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

Entity RecordCodec::decode(std::string_view line) const {
    if (line.size() != layout_.totalWidth())
        throw FormatError(FormatErrorKind::LengthMismatch,
                          "Record length " + std::to_string(line.size()) +
                          " does not match layout width " +
                          std::to_string(layout_.totalWidth()));

    ColumnReader rd{line};
    Entity e;

    // ── Head region ──────────────────────────────────────────────────────────
    for (const auto& b : head_) {
        std::string v = rd.read(b.slot.offset, b.slot.width);
        switch (b.target) {
        case Target::DocumentNumber:
            if (!v.empty()) e.documentNumber = std::move(v);
            break;
        case Target::Status:
            e.status = v.size() == 1 ? statusFromCode(v[0]) : EntityStatus::Unknown;
            break;
        case Target::FileDate:
            if (v.empty()) break;
            if (auto d = parseDate(v)) e.fileDate = *d;
            else                       e.fileDateText = std::move(v);
            break;
        default:
            if (auto* m = entityMember(e, b.target, b.part)) *m = std::move(v);
            break;
        }
    }

    // ── Officer tail: stop at maxOfficers or the first blank title ──────────
    for (size_t i = 0; i < layout_.maxOfficers(); ++i) {
        rd.rebase(layout_.officerOffset(i));
        if (rd.blank(title_.offset, title_.width)) break;

        Officer o;
        for (const auto& b : officer_) {
            if (auto* m = officerMember(o, b.target, b.part))
                *m = rd.read(b.slot.offset, b.slot.width);
        }
        e.officers.push_back(std::move(o));
    }

    return e;
}

DecodedBatch RecordCodec::decodeBatch(std::span<const std::string> lines) const {
    DecodedBatch batch;
    batch.lines.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        DecodedLine dl;
        dl.index = i;
        try {
            dl.entity = decode(lines[i]);
        } catch (const FormatError& ex) {
            dl.valid = false;
            dl.error = ex.what();
            ++batch.rejected;
        }
        batch.lines.push_back(std::move(dl));
    }
    return batch;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

std::string RecordCodec::encode(const Entity& entity) const {
    ColumnWriter wr{layout_.totalWidth()};

    for (const auto& b : head_) {
        const size_t off = b.slot.offset;
        const size_t w   = b.slot.width;
        switch (b.target) {
        case Target::DocumentNumber:
            if (entity.documentNumber) wr.write(off, w, *entity.documentNumber);
            break;
        case Target::Status:
            wr.write(off, w, std::string(1, statusCode(entity.status)));
            break;
        case Target::FileDate:
            if (entity.fileDate) wr.write(off, w, formatDate(*entity.fileDate));
            else                 wr.write(off, w, entity.fileDateText);
            break;
        default:
            if (const auto* m = entityMember(entity, b.target, b.part)) wr.write(off, w, *m);
            break;
        }
    }

    const size_t n = std::min(entity.officers.size(), layout_.maxOfficers());
    for (size_t i = 0; i < n; ++i) {
        wr.rebase(layout_.officerOffset(i));
        const Officer& o = entity.officers[i];
        for (const auto& b : officer_) {
            if (const auto* m = officerMember(o, b.target, b.part))
                wr.write(b.slot.offset, b.slot.width, *m);
        }
    }

    return wr.take();
}

} // namespace registry
