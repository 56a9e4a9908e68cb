/**
 * Folio - Publication manifest
 *
 * Canonical, format-agnostic description of a publication, serialized as a
 * Readium Web Publication Manifest.
 */

#pragma once

#include "link.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace folio {

constexpr const char* kWebpubManifestContext = "https://readium.org/webpub-manifest/context.jsonld";
constexpr const char* kProfileEpub = "https://readium.org/webpub-manifest/profiles/epub";
constexpr const char* kProfileDivina = "https://readium.org/webpub-manifest/profiles/divina";

/**
 * Navigation roles (keys of Manifest::navigation).
 */
namespace nav_role {
constexpr const char* kToc = "toc";
constexpr const char* kPageList = "page-list";
constexpr const char* kLandmarks = "landmarks";
constexpr const char* kListOfTables = "lot";
constexpr const char* kListOfAudio = "loa";
constexpr const char* kListOfIllustrations = "loi";
constexpr const char* kListOfVideos = "lov";
} // namespace nav_role

using NavigationMap = std::map<std::string, LinkList>;

/**
 * A string with optional translations keyed by BCP 47 language tag.
 */
class LocalizedString {
public:
    LocalizedString() = default;
    explicit LocalizedString(std::string value) : default_(std::move(value)) {}

    void set(const std::string& language, const std::string& value);

    /**
     * Default (untagged or first) translation.
     */
    const std::string& string() const { return default_; }
    const std::map<std::string, std::string>& translations() const { return translations_; }
    bool empty() const { return default_.empty() && translations_.empty(); }

    nlohmann::json to_json() const;

private:
    std::string default_;
    std::map<std::string, std::string> translations_;
};

struct Contributor {
    LocalizedString name;
    std::string sort_as;
    std::vector<std::string> roles;

    nlohmann::json to_json() const;
};

struct Presentation {
    std::string layout;          // "fixed" or "reflowable"
    std::string orientation;     // "auto", "landscape", "portrait"
    std::string spread;          // "auto", "both", "none", "landscape"

    bool empty() const { return layout.empty() && orientation.empty() && spread.empty(); }
};

struct Metadata {
    std::string identifier;
    LocalizedString title;
    LocalizedString subtitle;
    std::vector<std::string> conforms_to;
    std::vector<std::string> languages;
    std::vector<Contributor> authors;
    std::vector<Contributor> contributors;
    std::vector<Contributor> publishers;
    std::vector<std::string> subjects;
    std::string description;
    std::string published;
    std::string modified;
    std::string reading_progression = "auto";  // "ltr", "rtl", "auto"
    Presentation presentation;

    nlohmann::json to_json() const;
};

struct Manifest {
    std::vector<std::string> context;
    Metadata metadata;
    LinkList links;
    LinkList reading_order;
    LinkList resources;
    NavigationMap navigation;

    /**
     * Table of contents, empty when the publication has none.
     */
    const LinkList& toc() const;

    /**
     * Link with the given href in the reading order, resources, links or
     * navigation collections. nullptr when absent.
     */
    const Link* link_with_href(const std::string& href) const;

    nlohmann::json to_json() const;
};

} // namespace folio
