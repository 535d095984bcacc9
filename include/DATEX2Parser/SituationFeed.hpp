#pragma once
// SituationFeed.hpp – Holds one DATEX2 payload through load → parse → extract.
//
// Usage example:
//   SituationFeed feed;
//   feed.loadFile("datex2_v36.xml");   // or feed.setContent(bytes_from_http)
//   feed.parse();
//   for (const Situation& s : feed.situations()) …

#include "Document.hpp"
#include "Types.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace datex2 {

// Thrown by SituationFeed::parse() when no payload was supplied.
class NoContentError : public Datex2Error {
public:
    using Datex2Error::Datex2Error;
};

class SituationFeed {
public:
    // Hand over a complete payload from any origin. Discards a previous parse.
    void setContent(std::vector<uint8_t> bytes);

    // Read the payload from a local file. Throws LoadError.
    void loadFile(const std::filesystem::path& path);

    // Parse the held payload.
    // Throws NoContentError if none was supplied, MalformedDocumentError if
    // it is not XML (the previous parse, if any, is discarded either way).
    void parse();

    // Extract situations from the parsed document. Throws NotLoadedError.
    [[nodiscard]] std::vector<Situation> situations() const;

    [[nodiscard]] bool hasContent() const { return !content_.empty(); }
    [[nodiscard]] bool isParsed() const { return doc_.loaded(); }

    [[nodiscard]] const std::vector<uint8_t>& content() const { return content_; }

private:
    std::vector<uint8_t> content_;
    Document             doc_;
};

} // namespace datex2
