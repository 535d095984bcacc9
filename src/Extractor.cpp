// Extractor.cpp – Situation / record / point extraction over a DATEX2 tree.
//
// Layout consumed (prefixes are illustrative, matching is by URI):
//   sit:situation @id
//     sit:overallSeverity
//     sit:situationRecord …
//       loc:roadName                               (anywhere)
//       sit:roadOrCarriagewayOrLaneManagementType  (anywhere)
//       sit:causeType                              (anywhere)
//       sit:locationReference                      (direct child)
//         … loc:from | loc:to | loc:point
//             … loc:pointCoordinates / loc:latitude, loc:longitude
//             … loc:extendedTpegNonJunctionPoint / lse:province, …

#include "DATEX2Parser/Extractor.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <string>

namespace datex2 {

// ─── Element names ────────────────────────────────────────────────────────────

static constexpr QName kSituation       {ns::Situation, "situation"};
static constexpr QName kOverallSeverity {ns::Situation, "overallSeverity"};
static constexpr QName kSituationRecord {ns::Situation, "situationRecord"};
static constexpr QName kManagementType  {ns::Situation, "roadOrCarriagewayOrLaneManagementType"};
static constexpr QName kCauseType       {ns::Situation, "causeType"};
static constexpr QName kLocationRef     {ns::Situation, "locationReference"};

static constexpr QName kRoadName        {ns::Location, "roadName"};
static constexpr QName kFrom            {ns::Location, "from"};
static constexpr QName kTo              {ns::Location, "to"};
static constexpr QName kPoint           {ns::Location, "point"};
static constexpr QName kPointCoordinates{ns::Location, "pointCoordinates"};
static constexpr QName kLatitude        {ns::Location, "latitude"};
static constexpr QName kLongitude       {ns::Location, "longitude"};
static constexpr QName kExtendedPoint   {ns::Location, "extendedTpegNonJunctionPoint"};

static constexpr QName kProvince        {ns::SpanishExtension, "province"};
static constexpr QName kMunicipality    {ns::SpanishExtension, "municipality"};
static constexpr QName kCommunity       {ns::SpanishExtension, "autonomousCommunity"};
static constexpr QName kKilometerPoint  {ns::SpanishExtension, "kilometerPoint"};

// ─── Small helpers ────────────────────────────────────────────────────────────

static std::optional<std::string> textOf(Element e) {
    if (!e)
        return std::nullopt;
    return e.text();
}

static std::optional<double> numberOf(Element e) {
    std::optional<std::string> t = textOf(e);
    if (!t)
        return std::nullopt;
    return parseNumber(*t);
}

std::optional<double> parseNumber(std::string_view text) {
    std::string s(text);
    const char* begin = s.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end)))
        ++end;
    if (*end != '\0')
        return std::nullopt;
    return v;
}

// ─── Point ────────────────────────────────────────────────────────────────────

PointInfo extractPoint(Element point) {
    PointInfo info;

    if (Element coords = point.findFirst(kPointCoordinates)) {
        info.latitude  = numberOf(coords.child(kLatitude));
        info.longitude = numberOf(coords.child(kLongitude));
    }

    if (Element ext = point.findFirst(kExtendedPoint)) {
        info.province             = textOf(ext.child(kProvince));
        info.municipality         = textOf(ext.child(kMunicipality));
        info.autonomous_community = textOf(ext.child(kCommunity));
        info.km_point             = numberOf(ext.child(kKilometerPoint));
    }

    return info;
}

Element selectPoint(Element location_reference) {
    if (Element p = location_reference.findFirst(kFrom))  return p;
    if (Element p = location_reference.findFirst(kTo))    return p;
    return location_reference.findFirst(kPoint);
}

// ─── Record ───────────────────────────────────────────────────────────────────

std::optional<Situation> extractRecord(Element record, const SituationHeader& header) {
    Element location = record.child(kLocationRef);
    if (!location) {
        spdlog::debug("situation '{}': record without locationReference dropped", header.id);
        return std::nullopt;
    }

    Element point = selectPoint(location);
    if (!point) {
        spdlog::debug("situation '{}': record without from/to/point dropped", header.id);
        return std::nullopt;
    }

    PointInfo info = extractPoint(point);
    if (!info.hasCoordinates()) {
        spdlog::debug("situation '{}': record without usable coordinates dropped", header.id);
        return std::nullopt;
    }

    Situation s;
    s.id                   = header.id;
    s.severity             = header.severity;
    s.latitude             = *info.latitude;
    s.longitude            = *info.longitude;
    s.province             = std::move(info.province);
    s.municipality         = std::move(info.municipality);
    s.autonomous_community = std::move(info.autonomous_community);
    s.road_name            = textOf(record.findFirst(kRoadName));
    s.management_type      = textOf(record.findFirst(kManagementType));
    s.cause_type           = textOf(record.findFirst(kCauseType));
    s.km_point             = info.km_point;
    return s;
}

// ─── Situation ────────────────────────────────────────────────────────────────

SituationHeader readHeader(Element situation) {
    SituationHeader h;
    h.id = situation.attribute("id").value_or("");

    Element severity = situation.child(kOverallSeverity);
    if (!severity)
        severity = situation.findFirst(kOverallSeverity);
    h.severity = textOf(severity);
    return h;
}

// ─── Public entry point ───────────────────────────────────────────────────────

std::vector<Situation> extractSituations(const Document& doc) {
    Element root = doc.root();

    std::vector<Situation> out;
    size_t records = 0;

    for (Element sit : root.findAll(kSituation)) {
        SituationHeader header = readHeader(sit);
        for (Element record : sit.findAll(kSituationRecord)) {
            ++records;
            if (std::optional<Situation> s = extractRecord(record, header))
                out.push_back(std::move(*s));
        }
    }

    spdlog::debug("extracted {} situations from {} records ({} dropped)",
                  out.size(), records, records - out.size());
    return out;
}

} // namespace datex2
