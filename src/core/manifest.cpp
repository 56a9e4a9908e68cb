/**
 * Folio - Manifest implementation
 *
 * JSON output follows the Readium Web Publication Manifest: navigation roles
 * map to top-level collections ("toc", "pageList", "landmarks", ...).
 */

#include "folio/manifest.hpp"

namespace folio {

namespace {

// Navigation role -> manifest collection name
const char* collection_name(const std::string& role) {
    if (role == nav_role::kPageList) return "pageList";
    return role.c_str();
}

nlohmann::json contributors_to_json(const std::vector<Contributor>& contributors) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& contributor : contributors) {
        j.push_back(contributor.to_json());
    }
    return j;
}

} // namespace

void LocalizedString::set(const std::string& language, const std::string& value) {
    if (language.empty()) {
        default_ = value;
        return;
    }
    translations_[language] = value;
    if (default_.empty()) default_ = value;
}

nlohmann::json LocalizedString::to_json() const {
    if (translations_.empty()) {
        return default_;
    }
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [language, value] : translations_) {
        j[language] = value;
    }
    bool default_translated = false;
    for (const auto& [language, value] : translations_) {
        if (value == default_) default_translated = true;
    }
    if (!default_translated) j["und"] = default_;
    return j;
}

nlohmann::json Contributor::to_json() const {
    if (sort_as.empty() && roles.empty()) {
        return name.to_json();
    }
    nlohmann::json j;
    j["name"] = name.to_json();
    if (!sort_as.empty()) j["sortAs"] = sort_as;
    if (!roles.empty()) j["role"] = roles;
    return j;
}

nlohmann::json Metadata::to_json() const {
    nlohmann::json j;
    if (!identifier.empty()) j["identifier"] = identifier;
    if (!conforms_to.empty()) j["conformsTo"] = conforms_to;
    j["title"] = title.to_json();
    if (!subtitle.empty()) j["subtitle"] = subtitle.to_json();
    if (!languages.empty()) j["language"] = languages;
    if (!authors.empty()) j["author"] = contributors_to_json(authors);
    if (!contributors.empty()) j["contributor"] = contributors_to_json(contributors);
    if (!publishers.empty()) j["publisher"] = contributors_to_json(publishers);
    if (!subjects.empty()) j["subject"] = subjects;
    if (!description.empty()) j["description"] = description;
    if (!published.empty()) j["published"] = published;
    if (!modified.empty()) j["modified"] = modified;
    if (!reading_progression.empty()) j["readingProgression"] = reading_progression;
    if (!presentation.empty()) {
        nlohmann::json p = nlohmann::json::object();
        if (!presentation.layout.empty()) p["layout"] = presentation.layout;
        if (!presentation.orientation.empty()) p["orientation"] = presentation.orientation;
        if (!presentation.spread.empty()) p["spread"] = presentation.spread;
        j["presentation"] = p;
    }
    return j;
}

const LinkList& Manifest::toc() const {
    static const LinkList empty;
    auto it = navigation.find(nav_role::kToc);
    return it != navigation.end() ? it->second : empty;
}

const Link* Manifest::link_with_href(const std::string& href) const {
    for (const LinkList* list : {&reading_order, &resources, &links}) {
        if (const Link* link = find_link(*list, href)) return link;
    }
    for (const auto& [role, list] : navigation) {
        if (const Link* link = find_link(list, href)) return link;
    }
    return nullptr;
}

nlohmann::json Manifest::to_json() const {
    nlohmann::json j;
    if (!context.empty()) j["@context"] = context;
    j["metadata"] = metadata.to_json();
    j["links"] = folio::to_json(links);
    j["readingOrder"] = folio::to_json(reading_order);
    if (!resources.empty()) j["resources"] = folio::to_json(resources);
    for (const auto& [role, list] : navigation) {
        if (list.empty()) continue;
        j[collection_name(role)] = folio::to_json(list);
    }
    return j;
}

} // namespace folio
