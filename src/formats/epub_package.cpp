/**
 * Folio - EPUB package document parser
 */

#include "folio/epub_package.hpp"
#include "folio/epub_constants.hpp"
#include "folio/logging.hpp"
#include "folio/path_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace folio::epub {

namespace {

constexpr double DEFAULT_EPUB_VERSION = 1.2;

double parse_version(const std::string& text) {
    if (text.empty()) return DEFAULT_EPUB_VERSION;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || value <= 0.0) {
        LOG_DEBUG("EpubPackage", "Unparsable package version: " << text);
        return DEFAULT_EPUB_VERSION;
    }
    return value;
}

void parse_metadata(const XmlElement& element, PackageMetadata& metadata) {
    for (const XmlElement* child : element.children()) {
        const std::string& name = child->name();
        if (name.rfind("dc:", 0) == 0) {
            MetadataItem item;
            item.property = child->local_name();
            item.value = normalize_whitespace(child->text());
            item.id = child->attribute("id");
            item.lang = child->attribute("xml:lang");
            item.role = child->attribute("opf:role");
            item.file_as = child->attribute("opf:file-as");
            if (!item.value.empty()) {
                metadata.dc.push_back(std::move(item));
            }
        } else if (name == "opf:meta") {
            MetadataItem item;
            if (child->has_attribute("property")) {
                item.property = child->attribute("property");
                item.value = normalize_whitespace(child->text());
            } else {
                item.property = child->attribute("name");
                item.value = normalize_whitespace(child->attribute("content"));
            }
            item.id = child->attribute("id");
            item.refines = child->attribute("refines");
            if (!item.refines.empty() && item.refines[0] == '#') {
                item.refines.erase(0, 1);
            }
            item.lang = child->attribute("xml:lang");
            if (!item.property.empty()) {
                metadata.meta.push_back(std::move(item));
            }
        } else if (name == "opf:dc-metadata" || name == "opf:x-metadata") {
            // OEB 1.x wraps the entries in an extra level
            parse_metadata(*child, metadata);
        }
    }
}

Item parse_item(const XmlElement& element, const std::string& package_path) {
    Item item;
    item.id = element.attribute("id");
    item.href = resolve_href(package_path, element.attribute("href"));
    item.media_type = element.attribute("media-type");
    item.properties = split_tokens(element.attribute("properties"));
    item.media_overlay = element.attribute("media-overlay");
    item.fallback = element.attribute("fallback");
    return item;
}

ItemRef parse_itemref(const XmlElement& element) {
    ItemRef itemref;
    itemref.idref = element.attribute("idref");
    itemref.linear = element.attribute("linear") != "no";
    itemref.properties = split_tokens(element.attribute("properties"));
    return itemref;
}

} // namespace

Result<std::string> get_root_file_path(Fetcher& fetcher) {
    auto resource = fetcher.get(PATH_CONTAINER);
    auto document = resource->read_as_xml(container_bindings());
    if (!document) {
        return Error(document.error().code, "Cannot read container: " + document.error().message,
                     PATH_CONTAINER);
    }

    const XmlElement* rootfile = document->find("cn:rootfile");
    if (!rootfile) {
        // Containers without the OCF namespace are common enough
        rootfile = document->find("rootfile");
    }
    std::string path = rootfile ? rootfile->attribute("full-path") : std::string();
    if (path.empty()) {
        return Error::invalid_format("Cannot successfully parse OPF path", PATH_CONTAINER);
    }
    return normalize_path(percent_decode(path));
}

std::vector<std::string> split_tokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<const MetadataItem*> PackageMetadata::dc_elements(const std::string& name) const {
    std::vector<const MetadataItem*> result;
    for (const auto& item : dc) {
        if (item.property == name) result.push_back(&item);
    }
    return result;
}

std::vector<const MetadataItem*> PackageMetadata::refinements(const std::string& id) const {
    std::vector<const MetadataItem*> result;
    if (id.empty()) return result;
    for (const auto& item : meta) {
        if (item.refines == id) result.push_back(&item);
    }
    return result;
}

std::string PackageMetadata::refinement(const std::string& id, const std::string& property) const {
    for (const MetadataItem* item : refinements(id)) {
        if (item->property == property) return item->value;
    }
    return {};
}

std::string PackageMetadata::meta_value(const std::string& property) const {
    for (const auto& item : meta) {
        if (item.refines.empty() && item.property == property) return item.value;
    }
    return {};
}

bool Item::has_property(const std::string& property) const {
    return std::find(properties.begin(), properties.end(), property) != properties.end();
}

bool ItemRef::has_property(const std::string& property) const {
    return std::find(properties.begin(), properties.end(), property) != properties.end();
}

const Item* PackageDocument::item_with_id(const std::string& id) const {
    if (id.empty()) return nullptr;
    for (const auto& item : manifest) {
        if (item.id == id) return &item;
    }
    return nullptr;
}

Result<PackageDocument> parse_package_document(const XmlDocument& document, const std::string& path) {
    const XmlElement* package = document.root();
    if (!package || package->name() != "opf:package") {
        return Error::invalid_format("Missing package element", path);
    }

    PackageDocument result;
    result.path = path;
    result.version = parse_version(package->attribute("version"));
    result.unique_identifier_id = package->attribute("unique-identifier");

    const XmlElement* metadata = package->child("opf:metadata");
    if (!metadata) {
        return Error::invalid_format("Missing metadata element", path);
    }
    parse_metadata(*metadata, result.metadata);

    const XmlElement* manifest = package->child("opf:manifest");
    if (!manifest) {
        return Error::invalid_format("Missing manifest element", path);
    }
    for (const XmlElement* element : manifest->children("opf:item")) {
        if (element->attribute("href").empty()) continue;
        result.manifest.push_back(parse_item(*element, path));
    }

    const XmlElement* spine = package->child("opf:spine");
    if (!spine) {
        return Error::invalid_format("Missing spine element", path);
    }
    result.spine.toc = spine->attribute("toc");
    result.spine.page_progression_direction = spine->attribute("page-progression-direction");
    for (const XmlElement* element : spine->children("opf:itemref")) {
        result.spine.itemrefs.push_back(parse_itemref(*element));
    }

    LOG_DEBUG("EpubPackage", path << ": version " << result.version << ", "
              << result.manifest.size() << " items, " << result.spine.itemrefs.size() << " itemrefs");
    return result;
}

} // namespace folio::epub
