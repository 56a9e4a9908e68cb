/**
 * Folio - Link implementation
 */

#include "folio/link.hpp"
#include "folio/path_utils.hpp"

#include <algorithm>

namespace folio {

nlohmann::json Encryption::to_json() const {
    nlohmann::json j;
    j["algorithm"] = algorithm;
    if (!compression.empty()) j["compression"] = compression;
    if (original_length) j["originalLength"] = *original_length;
    if (!profile.empty()) j["profile"] = profile;
    if (!scheme.empty()) j["scheme"] = scheme;
    return j;
}

nlohmann::json Properties::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (encryption) j["encrypted"] = encryption->to_json();
    if (!contains.empty()) j["contains"] = contains;
    if (!page.empty()) j["page"] = page;
    if (!layout.empty()) j["layout"] = layout;
    if (!media_overlay.empty()) j["mediaOverlay"] = media_overlay;
    if (archive) {
        j["archive"] = {
            {"entryLength", archive->entry_length},
            {"isEntryCompressed", archive->is_entry_compressed}
        };
    }
    return j;
}

bool Link::has_rel(const std::string& rel) const {
    return std::find(rels.begin(), rels.end(), rel) != rels.end();
}

void Link::add_rel(const std::string& rel) {
    if (!has_rel(rel)) rels.push_back(rel);
}

const MediaType& Link::media_type() const {
    return type ? *type : MediaTypes::BINARY();
}

nlohmann::json Link::to_json() const {
    nlohmann::json j;
    j["href"] = href;
    if (type) j["type"] = type->string();
    if (!title.empty()) j["title"] = title;
    if (!rels.empty()) j["rel"] = rels;
    if (!properties.empty()) j["properties"] = properties.to_json();
    if (!children.empty()) j["children"] = folio::to_json(children);
    return j;
}

const Link* find_link(const LinkList& links, const std::string& href) {
    std::string target = strip_fragment(href);
    for (const auto& link : links) {
        if (strip_fragment(link.href) == target) return &link;
        if (const Link* child = find_link(link.children, href)) return child;
    }
    return nullptr;
}

const Link* find_link_with_rel(const LinkList& links, const std::string& rel) {
    for (const auto& link : links) {
        if (link.has_rel(rel)) return &link;
    }
    return nullptr;
}

nlohmann::json to_json(const LinkList& links) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& link : links) {
        j.push_back(link.to_json());
    }
    return j;
}

} // namespace folio
