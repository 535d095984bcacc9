#pragma once
// Labels.hpp – Display names for DATEX2 enumerations and HTML text escaping,
// shared by the statistics report and the map writer.

#include <optional>
#include <string>
#include <string_view>

namespace datex2 {

// Group label used for a missing text field in reports.
inline constexpr std::string_view kUnspecified = "Sin especificar";

// low → "Baja", medium → "Media", high → "Alta", highest → "Muy Alta";
// nullopt for any other value.
std::optional<std::string> severityName(std::string_view severity);

// severityName(), or the value verbatim when it has no display name.
std::string severityLabel(std::string_view severity);

// laneClosures, roadClosed, singleAlternateLineTraffic, other; others verbatim.
std::string managementLabel(std::string_view type);

// roadMaintenance, roadOrCarriagewayOrLaneManagement; others verbatim.
std::string causeLabel(std::string_view cause);

// Marker colour: green / orange / red / darkred, "blue" when unknown or absent.
std::string_view severityColor(const std::optional<std::string>& severity);

// Escape &, <, >, " and ' for HTML text and attribute values.
std::string htmlEscape(std::string_view text);

} // namespace datex2
