#include "regulation/ZoneTable.hpp"
#include <algorithm>

namespace site::regulation {

namespace {

struct ZoneEntry {
    ZoneType type;
    std::string_view name;
    ZoneRegulation regulation;
};

// 국토계획법 시행령 기준값
constexpr std::array<ZoneEntry, kZoneTypeCount> kZoneTable{{
    {ZoneType::R1Exclusive,   "ZONE_R1_EXCLUSIVE",   {"제1종전용주거지역", 50, 100, 10, 2, 3, 2, 1, 1}},
    {ZoneType::R2Exclusive,   "ZONE_R2_EXCLUSIVE",   {"제2종전용주거지역", 50, 150, 12, 3, 3, 2, 1, 1}},
    {ZoneType::R1General,     "ZONE_R1_GENERAL",     {"제1종일반주거지역", 60, 200, 15, 4, 2, 1.5, 0.5, 0.5}},
    {ZoneType::R2General,     "ZONE_R2_GENERAL",     {"제2종일반주거지역", 60, 250, 21, 7, 2, 1.5, 0.5, 0.5}},
    {ZoneType::R3General,     "ZONE_R3_GENERAL",     {"제3종일반주거지역", 50, 300, 30, 10, 2, 1.5, 0.5, 0.5}},
    {ZoneType::RSemi,         "ZONE_R_SEMI",         {"준주거지역", 70, 500, 45, 15, 2, 1, 0.5, 0.5}},
    {ZoneType::CCentral,      "ZONE_C_CENTRAL",      {"중심상업지역", 90, 1500, 0, 50, 0, 0, 0, 0}},
    {ZoneType::CGeneral,      "ZONE_C_GENERAL",      {"일반상업지역", 80, 1300, 0, 40, 1, 0, 0, 0}},
    {ZoneType::CNeighborhood, "ZONE_C_NEIGHBORHOOD", {"근린상업지역", 70, 900, 0, 25, 1, 0, 0, 0}},
    {ZoneType::CDistribution, "ZONE_C_DISTRIBUTION", {"유통상업지역", 80, 1100, 0, 30, 1, 0, 0, 0}},
    {ZoneType::IExclusive,    "ZONE_I_EXCLUSIVE",    {"전용공업지역", 70, 300, 0, 0, 3, 2, 1, 1}},
    {ZoneType::IGeneral,      "ZONE_I_GENERAL",      {"일반공업지역", 70, 350, 0, 0, 2, 1.5, 1, 1}},
    {ZoneType::ISemi,         "ZONE_I_SEMI",         {"준공업지역", 70, 400, 0, 0, 2, 1, 0.5, 0.5}},
    {ZoneType::GConservation, "ZONE_G_CONSERVATION", {"보전녹지지역", 20, 80, 10, 2, 5, 3, 2, 2}},
    {ZoneType::GProduction,   "ZONE_G_PRODUCTION",   {"생산녹지지역", 20, 100, 10, 2, 5, 3, 2, 2}},
    {ZoneType::GNatural,      "ZONE_G_NATURAL",      {"자연녹지지역", 20, 100, 10, 3, 5, 3, 2, 2}},
    {ZoneType::MConservation, "ZONE_M_CONSERVATION", {"보전관리지역", 20, 80, 10, 2, 5, 3, 2, 2}},
    {ZoneType::MProduction,   "ZONE_M_PRODUCTION",   {"생산관리지역", 20, 100, 10, 2, 5, 3, 2, 2}},
    {ZoneType::MPlanned,      "ZONE_M_PLANNED",      {"계획관리지역", 40, 100, 15, 3, 3, 2, 1, 1}},
    {ZoneType::Agriculture,   "ZONE_AGRICULTURE",    {"농림지역", 20, 80, 10, 2, 5, 3, 2, 2}},
}};

constexpr std::array<ZoneType, kZoneTypeCount> makeZoneList() {
    std::array<ZoneType, kZoneTypeCount> zones{};
    for (size_t i = 0; i < kZoneTypeCount; ++i) {
        zones[i] = kZoneTable[i].type;
    }
    return zones;
}

constexpr auto kAllZones = makeZoneList();

// 表按枚举顺序排列
constexpr bool tableMatchesEnum() {
    for (size_t i = 0; i < kZoneTypeCount; ++i) {
        if (static_cast<size_t>(kZoneTable[i].type) != i) {
            return false;
        }
    }
    return true;
}
static_assert(tableMatchesEnum(), "zone table order must follow ZoneType");

} // namespace

const ZoneRegulation& zoneRegulation(ZoneType zone) noexcept {
    return kZoneTable[static_cast<size_t>(zone)].regulation;
}

std::string_view zoneTypeName(ZoneType zone) noexcept {
    return kZoneTable[static_cast<size_t>(zone)].name;
}

std::expected<ZoneType, RegulationError> parseZoneType(std::string_view name) noexcept {
    auto it = std::find_if(kZoneTable.begin(), kZoneTable.end(),
                           [name](const ZoneEntry& entry) { return entry.name == name; });
    if (it == kZoneTable.end()) {
        return std::unexpected(RegulationError::InvalidZoneType);
    }
    return it->type;
}

const std::array<ZoneType, kZoneTypeCount>& allZoneTypes() noexcept {
    return kAllZones;
}

std::string_view regulationErrorName(RegulationError error) noexcept {
    switch (error) {
        case RegulationError::InvalidZoneType:   return "InvalidZoneType";
        case RegulationError::InvalidParcelArea: return "InvalidParcelArea";
    }
    return "Unknown";
}

} // namespace site::regulation
