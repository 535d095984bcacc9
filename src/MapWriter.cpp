// MapWriter.cpp – Leaflet page generation for the extracted situations.
//
// Markers are emitted as one JavaScript array literal:
//   [[lat, lon, "colour", "popup html", "tooltip"], …]
// and drawn by a short loop in the page.

#include "DATEX2Parser/MapWriter.hpp"
#include "DATEX2Parser/Document.hpp"
#include "DATEX2Parser/Labels.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace datex2 {

// ─── Escaping helpers ─────────────────────────────────────────────────────────

// Double-quoted JavaScript string literal. "</" is broken up so the payload
// cannot close the surrounding <script>.
static std::string jsString(std::string_view text) {
    std::string out = "\"";
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '/':
                out += (i > 0 && text[i - 1] == '<') ? "\\/" : "/";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c);
                    out += hex.str();
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

static std::string orNA(const std::optional<std::string>& v) {
    return v ? htmlEscape(*v) : std::string("N/A");
}

// ─── Popup ────────────────────────────────────────────────────────────────────

std::string popupHtml(const Situation& s) {
    std::ostringstream os;

    // Absent severity and a value with no display name read differently
    std::string severity = s.severity ? severityName(*s.severity).value_or("N/A")
                                      : "No especificada";
    std::string management = s.management_type ? managementLabel(*s.management_type)
                                               : "No especificado";
    std::string cause = s.cause_type ? causeLabel(*s.cause_type) : "No especificada";

    os << "<div style=\"font-family: Arial, sans-serif; min-width: 250px;\">"
       << "<h4 style=\"margin: 0 0 10px 0; color: #333; border-bottom: 2px solid #007bff; "
          "padding-bottom: 5px;\">"
       << (s.road_name ? htmlEscape(*s.road_name) : "Carretera sin nombre") << "</h4>"
       << "<table style=\"width: 100%; font-size: 13px;\">"
       << "<tr><td><strong>Ubicación:</strong></td><td>" << orNA(s.municipality) << ", "
       << orNA(s.province) << "</td></tr>"
       << "<tr><td><strong>CCAA:</strong></td><td>" << orNA(s.autonomous_community)
       << "</td></tr>"
       << "<tr><td><strong>Severidad:</strong></td><td><span style=\"color: "
       << severityColor(s.severity) << "; font-weight: bold;\">" << htmlEscape(severity)
       << "</span></td></tr>"
       << "<tr><td><strong>Tipo:</strong></td><td>" << htmlEscape(management) << "</td></tr>"
       << "<tr><td><strong>Causa:</strong></td><td>" << htmlEscape(cause) << "</td></tr>"
       << "<tr><td><strong>PK:</strong></td><td>";
    if (s.km_point && *s.km_point != 0.0)
        os << *s.km_point;
    else
        os << "N/A";
    os << "</td></tr></table>"
       << "<div style=\"margin-top: 8px; font-size: 11px; color: #666;\">ID: "
       << htmlEscape(s.id) << "</div></div>";

    return os.str();
}

// ─── Page ─────────────────────────────────────────────────────────────────────

static constexpr const char* kLegend = R"(<div class="legend">
<h4>Severidad</h4>
<div><span class="dot" style="background-color: green;"></span>Baja</div>
<div><span class="dot" style="background-color: orange;"></span>Media</div>
<div><span class="dot" style="background-color: red;"></span>Alta</div>
<div><span class="dot" style="background-color: darkred;"></span>Muy Alta</div>
</div>
)";

static constexpr const char* kClusterDist =
    "https://unpkg.com/leaflet.markercluster@1.5.3/dist/";

std::string renderMap(const std::vector<Situation>& situations, const MapOptions& opts) {
    std::ostringstream os;
    os << std::setprecision(15);

    os << "<!DOCTYPE html>\n<html lang=\"es\">\n<head>\n<meta charset=\"UTF-8\">\n"
       << "<title>" << htmlEscape(opts.title) << "</title>\n"
       << "<link rel=\"stylesheet\" href=\"https://unpkg.com/leaflet@1.9.4/dist/leaflet.css\">\n"
       << "<script src=\"https://unpkg.com/leaflet@1.9.4/dist/leaflet.js\"></script>\n";
    if (opts.clustering)
        os << "<link rel=\"stylesheet\" href=\"" << kClusterDist << "MarkerCluster.css\">\n"
           << "<link rel=\"stylesheet\" href=\"" << kClusterDist << "MarkerCluster.Default.css\">\n"
           << "<script src=\"" << kClusterDist << "leaflet.markercluster.js\"></script>\n";
    os << "<style>\n"
          "html, body, #map { height: 100%; margin: 0; }\n"
          ".legend { position: fixed; bottom: 50px; left: 50px; z-index: 1000; background: white;"
          " padding: 15px; border-radius: 8px; box-shadow: 0 2px 10px rgba(0,0,0,0.2);"
          " font-family: Arial, sans-serif; font-size: 13px; }\n"
          ".legend h4 { margin: 0 0 10px 0; font-size: 14px; }\n"
          ".legend div { margin: 5px 0; }\n"
          ".dot { width: 15px; height: 15px; display: inline-block; border-radius: 50%;"
          " margin-right: 8px; vertical-align: middle; }\n"
          "</style>\n</head>\n<body>\n<div id=\"map\"></div>\n";

    if (opts.legend)
        os << kLegend;

    os << "<script>\nvar situations = [\n";
    for (const Situation& s : situations) {
        std::string tooltip = (s.road_name ? *s.road_name : "Sin nombre") + " - " +
                              (s.severity ? *s.severity : "Sin severidad");
        os << "  [" << s.latitude << ", " << s.longitude << ", "
           << jsString(severityColor(s.severity)) << ", " << jsString(popupHtml(s)) << ", "
           << jsString(tooltip) << "],\n";
    }
    os << "];\n"
       << "var map = L.map('map').setView([" << opts.center_lat << ", " << opts.center_lon
       << "], " << opts.zoom << ");\n"
       << "var osm = L.tileLayer('https://{s}.tile.openstreetmap.org/{z}/{x}/{y}.png', "
          "{attribution: '&copy; OpenStreetMap contributors'}).addTo(map);\n"
       << "var positron = L.tileLayer('https://{s}.basemaps.cartocdn.com/light_all/{z}/{x}/{y}.png', "
          "{attribution: '&copy; OpenStreetMap &copy; CARTO'});\n"
       << "var markers = " << (opts.clustering ? "L.markerClusterGroup()" : "L.layerGroup()")
       << ".addTo(map);\n"
       << "situations.forEach(function (s) {\n"
          "  L.circleMarker([s[0], s[1]], {radius: 7, color: s[2], fillColor: s[2], fillOpacity: 0.8})\n"
          "    .bindPopup(s[3], {maxWidth: 350}).bindTooltip(s[4]).addTo(markers);\n"
          "});\n"
       << "L.control.layers({'OpenStreetMap': osm, 'CartoDB Positron': positron}, "
          "{'Incidencias': markers}).addTo(map);\n"
       << "</script>\n</body>\n</html>\n";

    return os.str();
}

void writeMap(const std::vector<Situation>& situations,
              const std::filesystem::path& path,
              const MapOptions& opts) {
    std::ofstream out(path, std::ios::binary);
    if (!out)
        throw WriteError("Cannot open '" + path.string() + "' for writing");
    out << renderMap(situations, opts);
    if (!out)
        throw WriteError("Error writing '" + path.string() + "'");
}

} // namespace datex2
