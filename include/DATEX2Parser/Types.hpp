#pragma once
// Types.hpp – Output record types and the DATEX2 v3 namespace contract.
// Every extracted incident flows through Situation.

#include <optional>
#include <string>
#include <string_view>

namespace datex2 {

// ─── Namespace URIs consumed from the payload ─────────────────────────────────
// Prefixes in the document are irrelevant; matching is by URI.
namespace ns {
inline constexpr std::string_view Payload   = "http://levelC/schema/3/d2Payload";
inline constexpr std::string_view Situation = "http://levelC/schema/3/situation";
inline constexpr std::string_view Location  = "http://levelC/schema/3/locationReferencing";
inline constexpr std::string_view Common    = "http://levelC/schema/3/common";
inline constexpr std::string_view SpanishExtension =
    "http://levelC/schema/3/locationReferencingSpanishExtension";
} // namespace ns

// ─── Namespace-qualified element name ─────────────────────────────────────────
struct QName {
    std::string_view ns;    // namespace URI ("" = no namespace)
    std::string_view local; // local name, e.g. "situationRecord"
};

// ─── Point-level attributes resolved from one from/to/point element ───────────
// Every field is independently optional; a numeric field whose text does not
// parse is left unset.
struct PointInfo {
    std::optional<double>      latitude;
    std::optional<double>      longitude;
    std::optional<std::string> province;
    std::optional<std::string> municipality;
    std::optional<std::string> autonomous_community;
    std::optional<double>      km_point;

    bool hasCoordinates() const { return latitude.has_value() && longitude.has_value(); }
};

// ─── One geolocated incident (one situationRecord + its chosen point) ─────────
struct Situation {
    // Situation-level, shared by every record of the same <situation>
    std::string                id;       // "" if the attribute is missing
    std::optional<std::string> severity; // low / medium / high / highest

    // Point-level, always present on an emitted record
    double latitude{0.0};
    double longitude{0.0};

    std::optional<std::string> province;
    std::optional<std::string> municipality;
    std::optional<std::string> autonomous_community;

    // Record-level
    std::optional<std::string> road_name;
    std::optional<std::string> management_type; // roadOrCarriagewayOrLaneManagementType
    std::optional<std::string> cause_type;

    std::optional<double> km_point;

    bool operator==(const Situation&) const = default;
};

} // namespace datex2
