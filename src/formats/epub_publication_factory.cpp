/**
 * Folio - EPUB publication factory implementation
 */

#include "folio/epub_publication_factory.hpp"
#include "folio/logging.hpp"

#include <set>

namespace folio::epub {

namespace {

// Item property -> "contains" marker
const std::pair<const char*, const char*> CONTAINS_PROPERTIES[] = {
    {"scripted", "js"},
    {"mathml", "mathml"},
    {"svg", "svg"},
    {"remote-resources", "remote-resources"},
};

std::string strip_rendition_prefix(const std::string& property) {
    const std::string prefix = "rendition:";
    if (property.compare(0, prefix.size(), prefix) == 0) {
        return property.substr(prefix.size());
    }
    return property;
}

// Creator role: EPUB 3 refinement first, EPUB 2 opf:role attribute second.
std::string creator_role(const PackageMetadata& metadata, const MetadataItem& item) {
    std::string role = metadata.refinement(item.id, "role");
    return role.empty() ? item.role : role;
}

Contributor make_contributor(const PackageMetadata& metadata, const MetadataItem& item) {
    Contributor contributor;
    contributor.name.set(item.lang, item.value);
    for (const MetadataItem* refinement : metadata.refinements(item.id)) {
        if (refinement->property == "alternate-script" && !refinement->lang.empty()) {
            contributor.name.set(refinement->lang, refinement->value);
        }
    }
    std::string file_as = metadata.refinement(item.id, "file-as");
    contributor.sort_as = file_as.empty() ? item.file_as : file_as;
    return contributor;
}

} // namespace

EpubPublicationFactory::EpubPublicationFactory(const PackageDocument& package, std::string fallback_title)
    : package_(package), fallback_title_(std::move(fallback_title)) {}

EpubPublicationFactory& EpubPublicationFactory::navigation(NavigationMap navigation) {
    navigation_ = std::move(navigation);
    return *this;
}

EpubPublicationFactory& EpubPublicationFactory::encryption(EncryptionMap encryption) {
    encryption_ = std::move(encryption);
    return *this;
}

EpubPublicationFactory& EpubPublicationFactory::display_options(DisplayOptions options) {
    display_options_ = std::move(options);
    return *this;
}

Metadata EpubPublicationFactory::create_metadata() const {
    const PackageMetadata& raw = package_.metadata;
    Metadata metadata;
    metadata.conforms_to.push_back(kProfileEpub);

    // Identifier
    auto identifiers = raw.dc_elements("identifier");
    for (const MetadataItem* identifier : identifiers) {
        if (!package_.unique_identifier_id.empty() && identifier->id == package_.unique_identifier_id) {
            metadata.identifier = identifier->value;
            break;
        }
    }
    if (metadata.identifier.empty() && !identifiers.empty()) {
        metadata.identifier = identifiers.front()->value;
    }

    // Title and subtitle
    auto titles = raw.dc_elements("title");
    const MetadataItem* main_title = nullptr;
    const MetadataItem* subtitle = nullptr;
    for (const MetadataItem* title : titles) {
        std::string type = raw.refinement(title->id, "title-type");
        if (type == "main" && !main_title) main_title = title;
        if (type == "subtitle" && !subtitle) subtitle = title;
    }
    if (!main_title && !titles.empty()) main_title = titles.front();

    if (main_title) {
        metadata.title.set(main_title->lang, main_title->value);
        for (const MetadataItem* refinement : raw.refinements(main_title->id)) {
            if (refinement->property == "alternate-script" && !refinement->lang.empty()) {
                metadata.title.set(refinement->lang, refinement->value);
            }
        }
    }
    if (metadata.title.empty()) {
        metadata.title = LocalizedString(fallback_title_);
    }
    if (subtitle) {
        metadata.subtitle.set(subtitle->lang, subtitle->value);
    }

    // Contributors
    for (const MetadataItem* creator : raw.dc_elements("creator")) {
        Contributor contributor = make_contributor(raw, *creator);
        std::string role = creator_role(raw, *creator);
        if (role.empty() || role == "aut") {
            metadata.authors.push_back(std::move(contributor));
        } else {
            contributor.roles.push_back(role);
            metadata.contributors.push_back(std::move(contributor));
        }
    }
    for (const MetadataItem* item : raw.dc_elements("contributor")) {
        Contributor contributor = make_contributor(raw, *item);
        std::string role = creator_role(raw, *item);
        if (!role.empty()) contributor.roles.push_back(role);
        metadata.contributors.push_back(std::move(contributor));
    }
    for (const MetadataItem* item : raw.dc_elements("publisher")) {
        metadata.publishers.push_back(make_contributor(raw, *item));
    }

    for (const MetadataItem* item : raw.dc_elements("language")) {
        metadata.languages.push_back(item->value);
    }
    for (const MetadataItem* item : raw.dc_elements("subject")) {
        metadata.subjects.push_back(item->value);
    }
    if (auto descriptions = raw.dc_elements("description"); !descriptions.empty()) {
        metadata.description = descriptions.front()->value;
    }
    if (auto dates = raw.dc_elements("date"); !dates.empty()) {
        metadata.published = dates.front()->value;
    }
    metadata.modified = raw.meta_value("dcterms:modified");

    // Reading progression
    const std::string& direction = package_.spine.page_progression_direction;
    metadata.reading_progression = (direction == "ltr" || direction == "rtl") ? direction : "auto";

    // Presentation
    auto fixed_option = display_options_.find("fixed-layout");
    bool fixed = raw.meta_value("rendition:layout") == "pre-paginated" ||
                 (fixed_option != display_options_.end() && fixed_option->second == "true");
    metadata.presentation.layout = fixed ? "fixed" : "reflowable";
    metadata.presentation.orientation = raw.meta_value("rendition:orientation");
    metadata.presentation.spread = raw.meta_value("rendition:spread");

    return metadata;
}

Link EpubPublicationFactory::create_link(const Item& item) const {
    Link link;
    link.href = item.href;
    link.type = MediaType::parse(item.media_type);

    if (item.has_property("cover-image")) {
        link.add_rel("cover");
    }
    if (item.has_property("nav")) {
        link.add_rel("contents");
    }

    auto encryption = encryption_.find(item.href);
    if (encryption != encryption_.end()) {
        link.properties.encryption = encryption->second;
    }
    for (const auto& [property, marker] : CONTAINS_PROPERTIES) {
        if (item.has_property(property)) {
            link.properties.contains.push_back(marker);
        }
    }
    if (const Item* overlay = package_.item_with_id(item.media_overlay)) {
        link.properties.media_overlay = overlay->href;
    }
    return link;
}

void EpubPublicationFactory::apply_itemref(const ItemRef& itemref, Link& link) const {
    for (const auto& token : itemref.properties) {
        std::string property = strip_rendition_prefix(token);
        if (property == "page-spread-left") {
            link.properties.page = "left";
        } else if (property == "page-spread-right") {
            link.properties.page = "right";
        } else if (property == "page-spread-center" || property == "spread-center") {
            link.properties.page = "center";
        } else if (property == "layout-pre-paginated") {
            link.properties.layout = "fixed";
        } else if (property == "layout-reflowable") {
            link.properties.layout = "reflowable";
        }
    }
}

Manifest EpubPublicationFactory::create() const {
    Manifest manifest;
    manifest.context.push_back(kWebpubManifestContext);
    manifest.metadata = create_metadata();

    // EPUB 2 cover: <meta name="cover" content="item-id"/>
    const Item* legacy_cover = package_.item_with_id(package_.metadata.meta_value("cover"));

    std::set<std::string> in_reading_order;
    for (const auto& itemref : package_.spine.itemrefs) {
        if (!itemref.linear) continue;
        const Item* item = package_.item_with_id(itemref.idref);
        if (!item) {
            LOG_DEBUG("EpubPublicationFactory", "Spine item without manifest entry: " << itemref.idref);
            continue;
        }
        Link link = create_link(*item);
        if (item == legacy_cover) link.add_rel("cover");
        apply_itemref(itemref, link);
        manifest.reading_order.push_back(std::move(link));
        in_reading_order.insert(item->id);
    }

    for (const auto& item : package_.manifest) {
        if (in_reading_order.count(item.id) > 0) continue;
        Link link = create_link(item);
        if (&item == legacy_cover) link.add_rel("cover");
        manifest.resources.push_back(std::move(link));
    }

    manifest.navigation = navigation_;
    return manifest;
}

} // namespace folio::epub
