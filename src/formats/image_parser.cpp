/**
 * Folio - Image parser implementation
 */

#include "folio/image_parser.hpp"
#include "folio/logging.hpp"
#include "folio/path_utils.hpp"
#include "folio/services.hpp"

#include <algorithm>

namespace folio {

namespace {

// Companion files allowed next to the bitmaps of an image archive
constexpr const char* ALLOWED_EXTENSIONS[] = {".acbf", ".xml", ".txt", ".json"};

bool is_allowed_companion(const std::string& href) {
    std::string extension = get_extension_lower(href);
    for (const char* allowed : ALLOWED_EXTENSIONS) {
        if (extension == allowed) return true;
    }
    return false;
}

} // namespace

Result<bool> ImageParser::accepts(const PublicationAsset& asset, Fetcher& fetcher) const {
    if (asset.media_type() == MediaTypes::CBZ() || asset.media_type() == MediaTypes::CBR()) {
        return true;
    }

    TRY_ASSIGN(links, fetcher.links());
    for (const auto& link : links) {
        if (is_hidden_or_thumbs(link.href)) continue;
        if (link.media_type().is_bitmap()) continue;
        if (!is_allowed_companion(link.href)) {
            LOG_DEBUG("ImageParser", "Not an image publication, found: " << link.href);
            return false;
        }
    }
    return true;
}

std::string ImageParser::guess_title_from_file_structure(const LinkList& links) {
    std::string directory;
    for (const auto& link : links) {
        std::string href = normalize_path(link.href);
        size_t slash = href.find('/');
        if (slash == std::string::npos) return {};
        std::string first = href.substr(0, slash);
        if (directory.empty()) {
            directory = first;
        } else if (directory != first) {
            return {};
        }
    }
    return directory;
}

Result<std::unique_ptr<PublicationBuilder>> ImageParser::parse(const PublicationAsset& asset,
                                                               const FetcherPtr& fetcher) {
    TRY_ASSIGN(accepted, accepts(asset, *fetcher));
    if (!accepted) {
        return std::unique_ptr<PublicationBuilder>();
    }

    TRY_ASSIGN(links, fetcher->links());

    LinkList reading_order;
    for (const auto& link : links) {
        if (is_hidden_or_thumbs(link.href) || !link.media_type().is_bitmap()) continue;
        reading_order.push_back(link);
    }

    if (reading_order.empty()) {
        return Error::no_content("no bitmap found in the publication", asset.name());
    }

    // Byte-wise order, "10.png" sorts before "2.png"
    std::sort(reading_order.begin(), reading_order.end(),
              [](const Link& a, const Link& b) { return a.href < b.href; });

    std::string title = guess_title_from_file_structure(links);
    if (title.empty()) {
        title = asset.name();
    }

    // First bitmap is the cover
    reading_order.front().rels = {"cover"};

    auto builder = std::make_unique<PublicationBuilder>();
    builder->manifest.context.push_back(kWebpubManifestContext);
    builder->manifest.metadata.title = LocalizedString(title);
    builder->manifest.metadata.conforms_to.push_back(kProfileDivina);
    builder->manifest.reading_order = std::move(reading_order);
    builder->fetcher = fetcher;
    builder->services.set(kPositionsServiceName, PerResourcePositionsService::factory(MediaTypes::IMAGE_ANY()));

    LOG_INFO("ImageParser", "Parsed " << asset.name() << " (" << builder->manifest.reading_order.size()
             << " images)");
    return builder;
}

} // namespace folio
