/**
 * Folio - EPUB navigation
 *
 * Builds the navigation map (toc, page-list, landmarks, ...) from either the
 * EPUB 2 NCX document or the EPUB 3 navigation document. Exactly one of the
 * two is consulted, chosen by the package version.
 */

#pragma once

#include "epub_package.hpp"
#include "fetcher.hpp"
#include "manifest.hpp"
#include "xml.hpp"

#include <string>

namespace folio::epub {

enum class NavigationStrategy {
    Ncx,                  // version < 3.0
    NavigationDocument    // version >= 3.0
};

NavigationStrategy navigation_strategy_for(double version);

/**
 * NCX document read with ncx_bindings(). navMap becomes "toc", pageList
 * becomes "page-list"; navList elements are ignored.
 */
NavigationMap parse_ncx(const XmlDocument& document, const std::string& ncx_path);

/**
 * Navigation document read with nav_bindings(). Every <nav> whose epub:type
 * is a known role becomes that role.
 */
NavigationMap parse_nav_document(const XmlDocument& document, const std::string& nav_path);

/**
 * Navigation map of the package, or the error that prevented reading it.
 * An empty map means the package declares no navigation resource.
 */
Result<NavigationMap> read_navigation(const PackageDocument& package, Fetcher& fetcher);

/**
 * Same as read_navigation(), with failures degraded to an empty map.
 */
NavigationMap resolve_navigation(const PackageDocument& package, Fetcher& fetcher);

} // namespace folio::epub
