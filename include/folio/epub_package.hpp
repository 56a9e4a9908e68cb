/**
 * Folio - EPUB package document
 *
 * Container root file discovery and the OPF package document model: raw
 * metadata entries, manifest items and spine. The publication factory turns
 * these into a Manifest.
 */

#pragma once

#include "fetcher.hpp"
#include "result.hpp"
#include "xml.hpp"

#include <string>
#include <vector>

namespace folio::epub {

/**
 * Package document path from META-INF/container.xml (first rootfile).
 */
Result<std::string> get_root_file_path(Fetcher& fetcher);

/**
 * A Dublin Core element or a <meta> entry of the package metadata.
 */
struct MetadataItem {
    std::string property;   // "title", "identifier", ... for DC; property or name for <meta>
    std::string value;
    std::string id;
    std::string refines;    // Refined id, without '#'
    std::string lang;
    std::string role;       // EPUB 2 opf:role
    std::string file_as;    // EPUB 2 opf:file-as
};

struct PackageMetadata {
    std::vector<MetadataItem> dc;    // Dublin Core elements, document order
    std::vector<MetadataItem> meta;  // <meta> entries, document order

    /**
     * Dublin Core elements with the given local name.
     */
    std::vector<const MetadataItem*> dc_elements(const std::string& name) const;

    /**
     * <meta> entries refining the element with the given id.
     */
    std::vector<const MetadataItem*> refinements(const std::string& id) const;

    /**
     * First refinement of id with the given property, empty when absent.
     */
    std::string refinement(const std::string& id, const std::string& property) const;

    /**
     * Value of the first global <meta> with the given property (EPUB 3) or
     * name (EPUB 2). Empty when absent.
     */
    std::string meta_value(const std::string& property) const;
};

struct Item {
    std::string id;
    std::string href;                     // Resolved against the package path
    std::string media_type;
    std::vector<std::string> properties;
    std::string media_overlay;            // Id of the SMIL item
    std::string fallback;

    bool has_property(const std::string& property) const;
};

struct ItemRef {
    std::string idref;
    bool linear = true;
    std::vector<std::string> properties;

    bool has_property(const std::string& property) const;
};

struct Spine {
    std::string toc;                          // Id of the NCX item
    std::string page_progression_direction;   // "ltr", "rtl" or empty
    std::vector<ItemRef> itemrefs;
};

struct PackageDocument {
    std::string path;
    double version = 1.2;
    std::string unique_identifier_id;
    PackageMetadata metadata;
    std::vector<Item> manifest;
    Spine spine;

    const Item* item_with_id(const std::string& id) const;
};

/**
 * Parse a package document read with package_bindings(). path is the
 * package location inside the container, used to resolve item hrefs.
 */
Result<PackageDocument> parse_package_document(const XmlDocument& document, const std::string& path);

/**
 * Whitespace-separated tokens.
 */
std::vector<std::string> split_tokens(const std::string& text);

} // namespace folio::epub
