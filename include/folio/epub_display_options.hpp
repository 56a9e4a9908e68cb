/**
 * Folio - Vendor display options
 *
 * iBooks and Kobo both ship a small XML document with rendering hints:
 *
 *   <display_options>
 *     <platform name="*">
 *       <option name="fixed-layout">true</option>
 *     </platform>
 *   </display_options>
 */

#pragma once

#include "fetcher.hpp"
#include "xml.hpp"

#include <map>
#include <string>

namespace folio::epub {

using DisplayOptions = std::map<std::string, std::string>;

/**
 * Options of the first <platform> element. Options with an empty name or
 * value are skipped.
 */
DisplayOptions parse_display_options_document(const XmlDocument& document);

/**
 * Options of the first vendor document that can be read, Apple first, then
 * Kobo. Empty when neither is present.
 */
DisplayOptions parse_display_options(Fetcher& fetcher);

} // namespace folio::epub
