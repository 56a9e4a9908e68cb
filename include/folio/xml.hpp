/**
 * Folio - XML documents
 *
 * Small read-only DOM built with expat. Element and attribute names are
 * rewritten through a namespace binding table at parse time: a name in a
 * bound namespace becomes "<prefix>:<local>", any other name keeps only its
 * local part. Queries then use the caller's prefixes whatever the document
 * declared, e.g. "opf:package" for both <package xmlns="...opf"> and
 * <opf:package xmlns:opf="...opf">.
 */

#pragma once

#include "result.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

/**
 * Namespace URI -> prefix used in queries.
 */
using NamespaceBindings = std::map<std::string, std::string>;

class XmlElement {
public:
    const std::string& name() const { return name_; }
    const std::string& local_name() const { return local_name_; }
    const std::string& namespace_uri() const { return namespace_uri_; }
    const XmlElement* parent() const { return parent_; }

    /**
     * Attribute value, empty when missing.
     */
    std::string attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;
    const std::vector<std::pair<std::string, std::string>>& attributes() const { return attributes_; }

    /**
     * First child element with the given name, nullptr when absent.
     */
    const XmlElement* child(std::string_view name) const;

    /**
     * Child elements with the given name; all child elements when name is empty.
     */
    std::vector<const XmlElement*> children(std::string_view name = {}) const;

    /**
     * First descendant (document order, self excluded) with the given name.
     */
    const XmlElement* find(std::string_view name) const;

    /**
     * All descendants with the given name, in document order.
     */
    std::vector<const XmlElement*> find_all(std::string_view name) const;

    /**
     * Concatenated character data of this element and its descendants.
     */
    std::string text() const;

private:
    friend class XmlDocument;
    friend struct XmlBuilder;

    struct Node {
        std::string text;
        std::unique_ptr<XmlElement> element;  // null for text nodes
    };

    void collect_text(std::string& out) const;
    void collect(std::string_view name, std::vector<const XmlElement*>& out) const;

    std::string name_;
    std::string local_name_;
    std::string namespace_uri_;
    std::vector<std::pair<std::string, std::string>> attributes_;
    std::vector<Node> nodes_;
    XmlElement* parent_ = nullptr;
};

class XmlDocument {
public:
    XmlDocument() = default;
    XmlDocument(XmlDocument&&) noexcept = default;
    XmlDocument& operator=(XmlDocument&&) noexcept = default;

    /**
     * Parse a complete document. Undeclared HTML entities (&nbsp; ...) are
     * tolerated and replaced when known.
     */
    static Result<XmlDocument> parse(const uint8_t* data, size_t size,
                                     const NamespaceBindings& bindings = {});
    static Result<XmlDocument> parse(const std::vector<uint8_t>& data,
                                     const NamespaceBindings& bindings = {});
    static Result<XmlDocument> parse(std::string_view text,
                                     const NamespaceBindings& bindings = {});

    /**
     * Document element; never null for a successfully parsed document.
     */
    const XmlElement* root() const { return root_.get(); }

    /**
     * Document element when named name, otherwise its first descendant named name.
     */
    const XmlElement* find(std::string_view name) const;

private:
    std::unique_ptr<XmlElement> root_;
};

/**
 * Collapse runs of whitespace to single spaces and trim.
 */
std::string normalize_whitespace(std::string_view text);

} // namespace folio
