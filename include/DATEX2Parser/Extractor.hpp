#pragma once
// Extractor.hpp – Turns a parsed DATEX2 document into a flat Situation list.
//
// Usage example:
//   Document doc = Document::parse(payload);
//   std::vector<Situation> sits = extractSituations(doc);
//
// Records that cannot be geolocated are dropped without error:
//   - no direct <locationReference> child
//   - no from / to / point under it
//   - latitude or longitude missing or unparsable

#include "Document.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace datex2 {

// Situation-level fields shared by all records of one <situation>.
struct SituationHeader {
    std::string                id;
    std::optional<std::string> severity;
};

// Extract every geolocated record, in document order.
// Throws NotLoadedError if `doc` holds no parsed tree.
[[nodiscard]] std::vector<Situation> extractSituations(const Document& doc);

// Read id and overallSeverity from a <situation> element.
[[nodiscard]] SituationHeader readHeader(Element situation);

// Build the Situation for one <situationRecord>; nullopt when it is dropped.
[[nodiscard]] std::optional<Situation> extractRecord(Element record,
                                                     const SituationHeader& header);

// Pick the record's point: first <from>, else <to>, else <point> under the
// location reference. Empty handle if none.
[[nodiscard]] Element selectPoint(Element location_reference);

// Coordinates and Spanish administrative extension of one point element.
[[nodiscard]] PointInfo extractPoint(Element point);

// Parse a whole decimal number, surrounding whitespace allowed.
// nullopt on empty or trailing garbage.
[[nodiscard]] std::optional<double> parseNumber(std::string_view text);

} // namespace datex2
