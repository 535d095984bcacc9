// SituationFeed.cpp – Payload holder around Document and the extractor.

#include "DATEX2Parser/SituationFeed.hpp"
#include "DATEX2Parser/Extractor.hpp"

#include <spdlog/spdlog.h>

namespace datex2 {

void SituationFeed::setContent(std::vector<uint8_t> bytes) {
    content_ = std::move(bytes);
    doc_     = Document{};
}

void SituationFeed::loadFile(const std::filesystem::path& path) {
    setContent(readFile(path));
    spdlog::debug("loaded {} bytes from '{}'", content_.size(), path.string());
}

void SituationFeed::parse() {
    doc_ = Document{};
    if (content_.empty())
        throw NoContentError("No DATEX2 content to parse; call setContent() or loadFile() first");
    doc_ = Document::parse(content_);
}

std::vector<Situation> SituationFeed::situations() const {
    if (!doc_.loaded())
        throw NotLoadedError("DATEX2 content not parsed; call parse() first");
    return extractSituations(doc_);
}

} // namespace datex2
