/**
 * Folio - Vendor display options implementation
 */

#include "folio/epub_display_options.hpp"
#include "folio/epub_constants.hpp"
#include "folio/logging.hpp"

namespace folio::epub {

DisplayOptions parse_display_options_document(const XmlDocument& document) {
    DisplayOptions options;
    const XmlElement* platform = document.find("platform");
    if (!platform) return options;

    for (const XmlElement* option : platform->children("option")) {
        std::string name = option->attribute("name");
        std::string value = option->text();
        if (!name.empty() && !value.empty()) {
            options[name] = value;
        }
    }
    return options;
}

DisplayOptions parse_display_options(Fetcher& fetcher) {
    for (const char* path : DISPLAY_OPTIONS_PATHS) {
        auto document = fetcher.get(path)->read_as_xml();
        if (!document) {
            LOG_DEBUG("EpubDisplayOptions", "Skipping " << path << ": " << document.error().message);
            continue;
        }
        return parse_display_options_document(*document);
    }
    return {};
}

} // namespace folio::epub
