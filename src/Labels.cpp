// Labels.cpp – Spanish display names for the enumerations shown in reports.

#include "DATEX2Parser/Labels.hpp"

#include <map>

namespace datex2 {

static std::string lookup(const std::map<std::string_view, std::string_view>& table,
                          std::string_view key) {
    auto it = table.find(key);
    return std::string(it == table.end() ? key : it->second);
}

std::optional<std::string> severityName(std::string_view severity) {
    static const std::map<std::string_view, std::string_view> table = {
        {"low",     "Baja"},
        {"medium",  "Media"},
        {"high",    "Alta"},
        {"highest", "Muy Alta"},
    };
    auto it = table.find(severity);
    if (it == table.end())
        return std::nullopt;
    return std::string(it->second);
}

std::string severityLabel(std::string_view severity) {
    return severityName(severity).value_or(std::string(severity));
}

std::string managementLabel(std::string_view type) {
    static const std::map<std::string_view, std::string_view> table = {
        {"laneClosures",               "Cierre de carril"},
        {"roadClosed",                 "Carretera cerrada"},
        {"singleAlternateLineTraffic", "Tráfico alterno"},
        {"other",                      "Otro"},
    };
    return lookup(table, type);
}

std::string causeLabel(std::string_view cause) {
    static const std::map<std::string_view, std::string_view> table = {
        {"roadMaintenance",                   "Mantenimiento de vía"},
        {"roadOrCarriagewayOrLaneManagement", "Gestión de tráfico"},
    };
    return lookup(table, cause);
}

std::string_view severityColor(const std::optional<std::string>& severity) {
    if (!severity)               return "blue";
    if (*severity == "low")      return "green";
    if (*severity == "medium")   return "orange";
    if (*severity == "high")     return "red";
    if (*severity == "highest")  return "darkred";
    return "blue";
}

std::string htmlEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;";  break;
            default:   out += c;        break;
        }
    }
    return out;
}

} // namespace datex2
