// Types.cpp – Small helpers attached to the entity value types.

#include "RegistryCodec/Types.hpp"

namespace registry {

bool Date::isCalendarDate() const noexcept {
    static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || month < 1 || month > 12 || day < 1) return false;
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    int days = (month == 2 && leap) ? 29 : kDays[month - 1];
    return day <= days;
}

OfficerRole Officer::role() const noexcept {
    if (title == "PRES")                  return OfficerRole::President;
    if (title == "VICE" || title == "VP") return OfficerRole::VicePresident;
    if (title == "TREA")                  return OfficerRole::Treasurer;
    if (title == "SECR")                  return OfficerRole::Secretary;
    if (title == "DIRE")                  return OfficerRole::Director;
    return OfficerRole::Other;
}

EntityStatus statusFromCode(char code) noexcept {
    switch (code) {
    case 'A': return EntityStatus::Active;
    case 'I': return EntityStatus::Inactive;
    default:  return EntityStatus::Unknown;
    }
}

// Unknown has no code of its own; it is written as a blank column.
char statusCode(EntityStatus status) noexcept {
    switch (status) {
    case EntityStatus::Active:   return 'A';
    case EntityStatus::Inactive: return 'I';
    case EntityStatus::Unknown:  break;
    }
    return ' ';
}

const char* statusName(EntityStatus status) noexcept {
    switch (status) {
    case EntityStatus::Active:   return "ACTIVE";
    case EntityStatus::Inactive: return "INACTIVE";
    case EntityStatus::Unknown:  break;
    }
    return "UNKNOWN";
}

std::vector<Entity> DecodedBatch::entities() const {
    std::vector<Entity> out;
    out.reserve(lines.size() - rejected);
    for (const auto& l : lines) {
        if (l.valid) out.push_back(l.entity);
    }
    return out;
}

} // namespace registry
