#pragma once
// Document.hpp – Parsed DATEX2 document and namespace-aware tree queries.
//
// Usage example:
//   Document doc = Document::loadFile("datex2_v36.xml");
//   for (Element sit : doc.root().findAll({ns::Situation, "situation"}))
//       std::cout << sit.attribute("id").value_or("") << '\n';

#include "Types.hpp"

#include <pugixml.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace datex2 {

// Base of every error raised by this library.
class Datex2Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown when the supplied bytes are empty or not well-formed XML: a syntax
// error, more than one document element, stray text at top level, or an
// element / attribute prefix with no xmlns declaration in scope.
class MalformedDocumentError : public Datex2Error {
public:
    using Datex2Error::Datex2Error;
};

// Thrown when a payload file cannot be opened or read.
class LoadError : public Datex2Error {
public:
    using Datex2Error::Datex2Error;
};

// Thrown when a report or map file cannot be written.
class WriteError : public Datex2Error {
public:
    using Datex2Error::Datex2Error;
};

// Thrown when a tree is queried before a document was successfully parsed.
class NotLoadedError : public Datex2Error {
public:
    using Datex2Error::Datex2Error;
};

// ─── Element: read-only handle on one node of a Document ──────────────────────
// Cheap to copy. Valid only while the owning Document is alive.
class Element {
public:
    Element() = default;
    explicit Element(pugi::xml_node node) : node_(node) {}

    explicit operator bool() const { return static_cast<bool>(node_); }

    // Name without its prefix, e.g. "latitude" for <loc:latitude>.
    [[nodiscard]] std::string_view localName() const;

    // URI bound to this element's prefix (or the default namespace) by the
    // nearest xmlns declaration on the element or its ancestors.
    // "" for an unprefixed element with no default namespace in scope.
    [[nodiscard]] std::string_view namespaceUri() const;

    [[nodiscard]] bool is(const QName& name) const;

    // Unqualified attribute value; nullopt when missing.
    [[nodiscard]] std::optional<std::string> attribute(std::string_view name) const;

    // Character data directly inside the element; nullopt when there is none.
    [[nodiscard]] std::optional<std::string> text() const;

    // First direct child with the given name, or an empty handle.
    [[nodiscard]] Element child(const QName& name) const;

    // First descendant (document order, self excluded), or an empty handle.
    [[nodiscard]] Element findFirst(const QName& name) const;

    // All descendants in document order, self excluded.
    [[nodiscard]] std::vector<Element> findAll(const QName& name) const;

private:
    pugi::xml_node node_;
};

// ─── Document: owns one parsed XML tree ───────────────────────────────────────
class Document {
public:
    // An empty, not-loaded document. root() throws NotLoadedError.
    Document() = default;

    // Parse a complete in-memory payload. Throws MalformedDocumentError.
    static Document parse(std::span<const uint8_t> bytes);
    static Document parse(std::string_view text);

    // Read a payload file and parse it. Throws LoadError or MalformedDocumentError.
    static Document loadFile(const std::filesystem::path& path);

    [[nodiscard]] bool loaded() const { return doc_ != nullptr; }

    // Document element. Throws NotLoadedError if nothing was parsed.
    [[nodiscard]] Element root() const;

private:
    static Document fromBuffer(const void* data, size_t size);

    std::shared_ptr<const pugi::xml_document> doc_;
};

// Read a whole file into memory. Throws LoadError.
std::vector<uint8_t> readFile(const std::filesystem::path& path);

} // namespace datex2
