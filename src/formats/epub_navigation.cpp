/**
 * Folio - EPUB navigation implementation
 */

#include "folio/epub_navigation.hpp"
#include "folio/epub_constants.hpp"
#include "folio/logging.hpp"
#include "folio/path_utils.hpp"

#include <optional>

namespace folio::epub {

namespace {

constexpr const char* NAV_DOCUMENT_ROLES[] = {
    nav_role::kToc,
    nav_role::kPageList,
    nav_role::kLandmarks,
    nav_role::kListOfTables,
    nav_role::kListOfAudio,
    nav_role::kListOfIllustrations,
    nav_role::kListOfVideos,
};

// ============================================================================
// NCX
// ============================================================================

std::string ncx_label(const XmlElement& element) {
    const XmlElement* label = element.child("ncx:navLabel");
    const XmlElement* text = label ? label->child("ncx:text") : nullptr;
    return text ? normalize_whitespace(text->text()) : std::string();
}

std::string ncx_src(const XmlElement& element, const std::string& ncx_path) {
    const XmlElement* content = element.child("ncx:content");
    std::string src = content ? content->attribute("src") : std::string();
    return src.empty() ? std::string() : resolve_href(ncx_path, src);
}

std::optional<Link> parse_nav_point(const XmlElement& element, const std::string& ncx_path) {
    Link link;
    link.title = ncx_label(element);
    link.href = ncx_src(element, ncx_path);

    for (const XmlElement* child : element.children("ncx:navPoint")) {
        if (auto child_link = parse_nav_point(*child, ncx_path)) {
            link.children.push_back(std::move(*child_link));
        }
    }

    if (link.href.empty()) {
        if (link.children.empty()) return std::nullopt;
        link.href = "#";
    }
    return link;
}

LinkList parse_nav_map(const XmlElement& nav_map, const std::string& ncx_path) {
    LinkList links;
    for (const XmlElement* point : nav_map.children("ncx:navPoint")) {
        if (auto link = parse_nav_point(*point, ncx_path)) {
            links.push_back(std::move(*link));
        }
    }
    return links;
}

LinkList parse_page_list(const XmlElement& page_list, const std::string& ncx_path) {
    LinkList links;
    for (const XmlElement* target : page_list.children("ncx:pageTarget")) {
        Link link;
        link.href = ncx_src(*target, ncx_path);
        if (link.href.empty()) continue;
        link.title = ncx_label(*target);
        links.push_back(std::move(link));
    }
    return links;
}

// ============================================================================
// Navigation document
// ============================================================================

LinkList parse_ordered_list(const XmlElement& list, const std::string& nav_path);

std::optional<Link> parse_list_item(const XmlElement& item, const std::string& nav_path) {
    Link link;
    bool has_anchor = false;

    for (const XmlElement* child : item.children()) {
        if (child->name() == "html:a" && !has_anchor) {
            has_anchor = true;
            link.title = normalize_whitespace(child->text());
            std::string href = child->attribute("href");
            link.href = href.empty() ? "#" : resolve_href(nav_path, href);
        } else if (child->name() == "html:span" && !has_anchor) {
            has_anchor = true;
            link.title = normalize_whitespace(child->text());
            link.href = "#";
        } else if (child->name() == "html:ol") {
            link.children = parse_ordered_list(*child, nav_path);
        }
    }

    if (link.title.empty() && link.children.empty()) return std::nullopt;
    if (link.href.empty()) link.href = "#";
    return link;
}

LinkList parse_ordered_list(const XmlElement& list, const std::string& nav_path) {
    LinkList links;
    for (const XmlElement* item : list.children("html:li")) {
        if (auto link = parse_list_item(*item, nav_path)) {
            links.push_back(std::move(*link));
        }
    }
    return links;
}

// First epub:type token naming a known role, empty otherwise.
std::string nav_role_of(const XmlElement& nav) {
    for (const auto& token : split_tokens(nav.attribute("epub:type"))) {
        for (const char* role : NAV_DOCUMENT_ROLES) {
            if (token == role) return token;
        }
    }
    return {};
}

} // namespace

NavigationStrategy navigation_strategy_for(double version) {
    return version < 3.0 ? NavigationStrategy::Ncx : NavigationStrategy::NavigationDocument;
}

NavigationMap parse_ncx(const XmlDocument& document, const std::string& ncx_path) {
    NavigationMap navigation;

    if (const XmlElement* nav_map = document.find("ncx:navMap")) {
        LinkList toc = parse_nav_map(*nav_map, ncx_path);
        if (!toc.empty()) navigation[nav_role::kToc] = std::move(toc);
    }
    if (const XmlElement* page_list = document.find("ncx:pageList")) {
        LinkList pages = parse_page_list(*page_list, ncx_path);
        if (!pages.empty()) navigation[nav_role::kPageList] = std::move(pages);
    }
    return navigation;
}

NavigationMap parse_nav_document(const XmlDocument& document, const std::string& nav_path) {
    NavigationMap navigation;
    const XmlElement* root = document.root();
    if (!root) return navigation;

    for (const XmlElement* nav : root->find_all("html:nav")) {
        std::string role = nav_role_of(*nav);
        if (role.empty() || navigation.count(role) > 0) continue;

        const XmlElement* list = nav->child("html:ol");
        if (!list) continue;
        LinkList links = parse_ordered_list(*list, nav_path);
        if (!links.empty()) navigation[role] = std::move(links);
    }
    return navigation;
}

Result<NavigationMap> read_navigation(const PackageDocument& package, Fetcher& fetcher) {
    switch (navigation_strategy_for(package.version)) {
        case NavigationStrategy::Ncx: {
            const Item* ncx_item = nullptr;
            if (!package.spine.toc.empty()) {
                ncx_item = package.item_with_id(package.spine.toc);
            } else {
                for (const auto& item : package.manifest) {
                    auto type = MediaType::parse(item.media_type);
                    if (type && MediaTypes::NCX().contains(*type)) {
                        ncx_item = &item;
                        break;
                    }
                }
            }
            if (!ncx_item) return NavigationMap{};

            TRY_ASSIGN(document, fetcher.get(ncx_item->href)->read_as_xml(ncx_bindings()));
            return parse_ncx(document, ncx_item->href);
        }

        case NavigationStrategy::NavigationDocument: {
            const Item* nav_item = nullptr;
            for (const auto& item : package.manifest) {
                if (item.has_property("nav")) {
                    nav_item = &item;
                    break;
                }
            }
            if (!nav_item) return NavigationMap{};

            TRY_ASSIGN(document, fetcher.get(nav_item->href)->read_as_xml(nav_bindings()));
            return parse_nav_document(document, nav_item->href);
        }
    }
    return NavigationMap{};
}

NavigationMap resolve_navigation(const PackageDocument& package, Fetcher& fetcher) {
    auto navigation = read_navigation(package, fetcher);
    if (!navigation) {
        LOG_DEBUG("EpubNavigation", "Ignoring navigation: " << navigation.error().full_message());
        return {};
    }
    return std::move(navigation.value());
}

} // namespace folio::epub
