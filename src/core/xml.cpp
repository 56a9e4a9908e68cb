/**
 * Folio - XML implementation (expat)
 */

#include "folio/xml.hpp"

#include <expat.h>

#include <cctype>
#include <cstring>
#include <unordered_map>

namespace folio {

namespace {

constexpr char kNamespaceSeparator = ' ';
constexpr const char* kXmlNamespace = "http://www.w3.org/XML/1998/namespace";

// Bounds the element tree; every walk over it recurses once per level.
constexpr size_t kMaxElementDepth = 1024;

// Entities found in real-world XHTML without a DTD; expat only knows the XML five.
const char* lookup_html_entity(std::string_view name) {
    static const std::unordered_map<std::string_view, const char*> entities = {
        {"nbsp", "\xC2\xA0"},
        {"shy", "\xC2\xAD"},
        {"copy", "\xC2\xA9"},
        {"reg", "\xC2\xAE"},
        {"laquo", "\xC2\xAB"},
        {"raquo", "\xC2\xBB"},
        {"ndash", "\xE2\x80\x93"},
        {"mdash", "\xE2\x80\x94"},
        {"lsquo", "\xE2\x80\x98"},
        {"rsquo", "\xE2\x80\x99"},
        {"ldquo", "\xE2\x80\x9C"},
        {"rdquo", "\xE2\x80\x9D"},
        {"hellip", "\xE2\x80\xA6"},
        {"thinsp", "\xE2\x80\x89"},
        {"zwnj", "\xE2\x80\x8C"},
        {"zwj", "\xE2\x80\x8D"},
    };
    auto it = entities.find(name);
    return it != entities.end() ? it->second : nullptr;
}

} // namespace

/**
 * expat callbacks building the element tree.
 */
struct XmlBuilder {
    const NamespaceBindings& bindings;
    std::unique_ptr<XmlElement> root;
    XmlElement* current = nullptr;
    XML_Parser parser = nullptr;
    size_t depth = 0;
    bool too_deep = false;

    XmlBuilder(const NamespaceBindings& b, XML_Parser p) : bindings(b), parser(p) {}

    // "uri local" -> (bound name, local name, uri)
    void split_name(const XML_Char* raw, std::string& name, std::string& local, std::string& uri) const {
        const char* sep = std::strchr(raw, kNamespaceSeparator);
        if (!sep) {
            name = raw;
            local = raw;
            uri.clear();
            return;
        }
        uri.assign(raw, sep);
        local = sep + 1;
        auto it = bindings.find(uri);
        if (it != bindings.end() && !it->second.empty()) {
            name = it->second + ":" + local;
        } else if (uri == kXmlNamespace) {
            name = "xml:" + local;
        } else {
            name = local;
        }
    }

    static void XMLCALL start_element(void* user_data, const XML_Char* raw_name, const XML_Char** atts) {
        auto* self = static_cast<XmlBuilder*>(user_data);
        if (self->depth >= kMaxElementDepth) {
            self->too_deep = true;
            XML_StopParser(self->parser, XML_FALSE);
            return;
        }
        ++self->depth;

        auto element = std::make_unique<XmlElement>();
        self->split_name(raw_name, element->name_, element->local_name_, element->namespace_uri_);
        for (int i = 0; atts[i] && atts[i + 1]; i += 2) {
            std::string name, local, uri;
            self->split_name(atts[i], name, local, uri);
            element->attributes_.emplace_back(std::move(name), atts[i + 1]);
        }

        XmlElement* raw = element.get();
        if (!self->current) {
            self->root = std::move(element);
        } else {
            raw->parent_ = self->current;
            XmlElement::Node node;
            node.element = std::move(element);
            self->current->nodes_.push_back(std::move(node));
        }
        self->current = raw;
    }

    static void XMLCALL end_element(void* user_data, const XML_Char* /*name*/) {
        auto* self = static_cast<XmlBuilder*>(user_data);
        if (self->current) {
            --self->depth;
            self->current = self->current->parent_;
        }
    }

    static void XMLCALL character_data(void* user_data, const XML_Char* s, int len) {
        auto* self = static_cast<XmlBuilder*>(user_data);
        if (!self->current || len <= 0) return;

        auto& nodes = self->current->nodes_;
        if (nodes.empty() || nodes.back().element) {
            nodes.push_back(XmlElement::Node{});
        }
        nodes.back().text.append(s, static_cast<size_t>(len));
    }

    // Receives undeclared entities once a foreign DTD is in use, along with
    // comments and declarations which are dropped.
    static void XMLCALL default_handler(void* user_data, const XML_Char* s, int len) {
        if (len >= 3 && s[0] == '&' && s[len - 1] == ';') {
            const char* utf8 = lookup_html_entity(std::string_view(s + 1, static_cast<size_t>(len - 2)));
            if (utf8) {
                character_data(user_data, utf8, static_cast<int>(std::strlen(utf8)));
            }
        }
    }
};

std::string XmlElement::attribute(std::string_view name) const {
    for (const auto& [key, value] : attributes_) {
        if (key == name) return value;
    }
    return {};
}

bool XmlElement::has_attribute(std::string_view name) const {
    for (const auto& attribute : attributes_) {
        if (attribute.first == name) return true;
    }
    return false;
}

const XmlElement* XmlElement::child(std::string_view name) const {
    for (const auto& node : nodes_) {
        if (node.element && node.element->name_ == name) return node.element.get();
    }
    return nullptr;
}

std::vector<const XmlElement*> XmlElement::children(std::string_view name) const {
    std::vector<const XmlElement*> result;
    for (const auto& node : nodes_) {
        if (node.element && (name.empty() || node.element->name_ == name)) {
            result.push_back(node.element.get());
        }
    }
    return result;
}

const XmlElement* XmlElement::find(std::string_view name) const {
    for (const auto& node : nodes_) {
        if (!node.element) continue;
        if (node.element->name_ == name) return node.element.get();
        if (const XmlElement* found = node.element->find(name)) return found;
    }
    return nullptr;
}

void XmlElement::collect(std::string_view name, std::vector<const XmlElement*>& out) const {
    for (const auto& node : nodes_) {
        if (!node.element) continue;
        if (node.element->name_ == name) out.push_back(node.element.get());
        node.element->collect(name, out);
    }
}

std::vector<const XmlElement*> XmlElement::find_all(std::string_view name) const {
    std::vector<const XmlElement*> result;
    collect(name, result);
    return result;
}

void XmlElement::collect_text(std::string& out) const {
    for (const auto& node : nodes_) {
        if (node.element) {
            node.element->collect_text(out);
        } else {
            out += node.text;
        }
    }
}

std::string XmlElement::text() const {
    std::string result;
    collect_text(result);
    return result;
}

Result<XmlDocument> XmlDocument::parse(const uint8_t* data, size_t size, const NamespaceBindings& bindings) {
    XML_Parser parser = XML_ParserCreateNS(nullptr, kNamespaceSeparator);
    if (!parser) {
        return Error(Error::Code::Unknown, "Couldn't allocate XML parser");
    }

    XmlBuilder builder(bindings, parser);

    // Undeclared entities become "skipped" instead of fatal errors and reach
    // the default handler.
    XML_UseForeignDTD(parser, XML_TRUE);
    XML_SetUserData(parser, &builder);
    XML_SetElementHandler(parser, XmlBuilder::start_element, XmlBuilder::end_element);
    XML_SetCharacterDataHandler(parser, XmlBuilder::character_data);
    XML_SetDefaultHandlerExpand(parser, XmlBuilder::default_handler);

    XML_Status status = XML_Parse(parser, reinterpret_cast<const char*>(data),
                                  static_cast<int>(size), XML_TRUE);
    if (builder.too_deep) {
        std::string where = "line " + std::to_string(XML_GetCurrentLineNumber(parser));
        XML_ParserFree(parser);
        return Error::parse_error("XML elements nested deeper than " +
                                  std::to_string(kMaxElementDepth) + " levels", where);
    }
    if (status != XML_STATUS_OK) {
        std::string message = XML_ErrorString(XML_GetErrorCode(parser));
        std::string where = "line " + std::to_string(XML_GetCurrentLineNumber(parser));
        XML_ParserFree(parser);
        return Error::parse_error("XML parse error: " + message, where);
    }
    XML_ParserFree(parser);

    if (!builder.root) {
        return Error::parse_error("XML document has no root element");
    }

    XmlDocument document;
    document.root_ = std::move(builder.root);
    return Result<XmlDocument>(std::move(document));
}

Result<XmlDocument> XmlDocument::parse(const std::vector<uint8_t>& data, const NamespaceBindings& bindings) {
    return parse(data.data(), data.size(), bindings);
}

Result<XmlDocument> XmlDocument::parse(std::string_view text, const NamespaceBindings& bindings) {
    return parse(reinterpret_cast<const uint8_t*>(text.data()), text.size(), bindings);
}

const XmlElement* XmlDocument::find(std::string_view name) const {
    if (!root_) return nullptr;
    if (root_->name() == name) return root_.get();
    return root_->find(name);
}

std::string normalize_whitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    return result;
}

} // namespace folio
