#pragma once
// MapWriter.hpp – Renders situations as a standalone Leaflet HTML map.
// One circle marker per situation, coloured by severity, with an info popup.
// Markers are clustered by default.

#include "Types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace datex2 {

struct MapOptions {
    double      center_lat{40.4168};   // centre of Spain
    double      center_lon{-3.7038};
    int         zoom{6};
    std::string title{"Balizas V16 - Incidencias DGT"};
    bool        legend{true};
    bool        clustering{true};      // group nearby markers (leaflet.markercluster)
};

// Build the HTML page. Text from the payload is escaped.
[[nodiscard]] std::string renderMap(const std::vector<Situation>& situations,
                                    const MapOptions& opts = {});

// Write renderMap() to `path`. Throws WriteError on I/O failure.
void writeMap(const std::vector<Situation>& situations,
              const std::filesystem::path& path,
              const MapOptions& opts = {});

// Popup body for one marker (HTML fragment).
[[nodiscard]] std::string popupHtml(const Situation& s);

} // namespace datex2
