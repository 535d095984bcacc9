// Document.cpp – Loads DATEX2 payloads and answers namespace-qualified queries.
// Uses pugixml for parsing; pugixml is not namespace-aware, so prefixes are
// resolved here against the xmlns declarations in scope.

#include "DATEX2Parser/Document.hpp"

#include <fstream>
#include <iterator>
#include <string>

namespace datex2 {

// ─── Subtree walk ─────────────────────────────────────────────────────────────

// Pre-order walk over the element descendants of `start` (start excluded),
// driven by an explicit stack. `visit` returns false to stop early.
template <typename Visit>
static void walkDescendants(pugi::xml_node start, Visit&& visit) {
    std::vector<pugi::xml_node> stack;
    auto pushChildren = [&stack](pugi::xml_node n) {
        // Reverse push so the first child is popped first (document order)
        for (pugi::xml_node c = n.last_child(); c; c = c.previous_sibling())
            if (c.type() == pugi::node_element)
                stack.push_back(c);
    };

    pushChildren(start);
    while (!stack.empty()) {
        pugi::xml_node n = stack.back();
        stack.pop_back();
        if (!visit(n))
            return;
        pushChildren(n);
    }
}

// ─── Element ──────────────────────────────────────────────────────────────────

std::string_view Element::localName() const {
    std::string_view name = node_.name();
    auto colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::string_view Element::namespaceUri() const {
    if (!node_)
        return {};

    std::string_view name = node_.name();
    auto colon = name.find(':');
    std::string decl = "xmlns";
    if (colon != std::string_view::npos) {
        decl += ':';
        decl.append(name.substr(0, colon));
    }

    for (pugi::xml_node n = node_; n && n.type() == pugi::node_element; n = n.parent()) {
        if (pugi::xml_attribute a = n.attribute(decl.c_str()))
            return a.value();
    }
    return {};
}

bool Element::is(const QName& name) const {
    return node_ && localName() == name.local && namespaceUri() == name.ns;
}

std::optional<std::string> Element::attribute(std::string_view name) const {
    pugi::xml_attribute a = node_.attribute(std::string(name).c_str());
    if (!a)
        return std::nullopt;
    return std::string(a.value());
}

std::optional<std::string> Element::text() const {
    pugi::xml_text t = node_.text();
    if (!t)
        return std::nullopt;
    return std::string(t.get());
}

Element Element::child(const QName& name) const {
    for (pugi::xml_node c : node_.children()) {
        if (c.type() != pugi::node_element)
            continue;
        Element e(c);
        if (e.is(name))
            return e;
    }
    return {};
}

Element Element::findFirst(const QName& name) const {
    Element found;
    if (!node_)
        return found;
    walkDescendants(node_, [&](pugi::xml_node n) {
        Element e(n);
        if (!e.is(name))
            return true;
        found = e;
        return false;
    });
    return found;
}

std::vector<Element> Element::findAll(const QName& name) const {
    std::vector<Element> out;
    if (!node_)
        return out;
    walkDescendants(node_, [&](pugi::xml_node n) {
        Element e(n);
        if (e.is(name))
            out.push_back(e);
        return true;
    });
    return out;
}

// ─── Document ─────────────────────────────────────────────────────────────────

// Well-formedness rules pugixml leaves unchecked: exactly one document
// element, no character data beside it, every prefix declared.
static void checkWellFormed(const pugi::xml_document& doc) {
    size_t roots = 0;
    for (pugi::xml_node n : doc.children()) {
        if (n.type() == pugi::node_element)
            ++roots;
        else if (n.type() == pugi::node_pcdata || n.type() == pugi::node_cdata)
            throw MalformedDocumentError("Malformed DATEX2 payload: text outside the document element");
    }
    if (roots > 1)
        throw MalformedDocumentError("Malformed DATEX2 payload: " + std::to_string(roots) +
                                     " document elements");

    auto declared = [](pugi::xml_node n, std::string_view prefix) {
        if (prefix == "xml" || prefix == "xmlns")
            return true;
        std::string decl = "xmlns:" + std::string(prefix);
        for (; n && n.type() == pugi::node_element; n = n.parent())
            if (n.attribute(decl.c_str()))
                return true;
        return false;
    };
    auto prefixOf = [](std::string_view name) {
        auto colon = name.find(':');
        return colon == std::string_view::npos ? std::string_view{} : name.substr(0, colon);
    };

    pugi::xml_node root = doc.document_element();
    std::vector<pugi::xml_node> stack{root};
    while (!stack.empty()) {
        pugi::xml_node n = stack.back();
        stack.pop_back();

        std::string_view prefix = prefixOf(n.name());
        if (!prefix.empty() && !declared(n, prefix))
            throw MalformedDocumentError("Malformed DATEX2 payload: namespace prefix '" +
                                         std::string(prefix) + "' on <" + n.name() +
                                         "> is not defined");
        for (pugi::xml_attribute a : n.attributes()) {
            std::string_view attr_prefix = prefixOf(a.name());
            if (!attr_prefix.empty() && !declared(n, attr_prefix))
                throw MalformedDocumentError("Malformed DATEX2 payload: namespace prefix '" +
                                             std::string(attr_prefix) + "' on attribute " +
                                             a.name() + " is not defined");
        }

        for (pugi::xml_node c = n.last_child(); c; c = c.previous_sibling())
            if (c.type() == pugi::node_element)
                stack.push_back(c);
    }
}

Document Document::fromBuffer(const void* data, size_t size) {
    if (size == 0)
        throw MalformedDocumentError("Empty DATEX2 payload");

    auto doc = std::make_shared<pugi::xml_document>();
    pugi::xml_parse_result result = doc->load_buffer(data, size);
    if (!result)
        throw MalformedDocumentError(std::string("Malformed DATEX2 payload: ") +
                                     result.description() + " at offset " +
                                     std::to_string(result.offset));
    checkWellFormed(*doc);

    Document out;
    out.doc_ = std::move(doc);
    return out;
}

Document Document::parse(std::span<const uint8_t> bytes) {
    return fromBuffer(bytes.data(), bytes.size());
}

Document Document::parse(std::string_view text) {
    return fromBuffer(text.data(), text.size());
}

Document Document::loadFile(const std::filesystem::path& path) {
    std::vector<uint8_t> bytes = readFile(path);
    return parse(bytes);
}

Element Document::root() const {
    if (!doc_)
        throw NotLoadedError("DATEX2 document not loaded; parse a payload first");
    return Element(doc_->document_element());
}

// ─── File input ───────────────────────────────────────────────────────────────

std::vector<uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw LoadError("Cannot open '" + path.string() + "'");

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad())
        throw LoadError("Error reading '" + path.string() + "'");
    return bytes;
}

} // namespace datex2
