/**
 * Folio - EPUB positions implementation
 */

#include "folio/epub_positions.hpp"
#include "folio/logging.hpp"

#include <algorithm>

namespace folio::epub {

std::optional<ReflowableStrategy> parse_reflowable_strategy(std::string_view name) {
    if (name == "archive-entry-length") return ReflowableStrategy::ArchiveEntryLength;
    if (name == "original-length") return ReflowableStrategy::OriginalLength;
    return std::nullopt;
}

const char* to_string(ReflowableStrategy strategy) {
    switch (strategy) {
        case ReflowableStrategy::ArchiveEntryLength: return "archive-entry-length";
        case ReflowableStrategy::OriginalLength: return "original-length";
    }
    return "unknown";
}

EpubPositionsService::EpubPositionsService(LinkList reading_order, std::string layout, FetcherPtr fetcher,
                                           ReflowablePositions options)
    : reading_order_(std::move(reading_order)),
      layout_(std::move(layout)),
      fetcher_(std::move(fetcher)),
      options_(options) {
    if (options_.page_length == 0) {
        options_.page_length = DEFAULT_POSITION_PAGE_LENGTH;
    }
}

uint64_t EpubPositionsService::position_count(const Link& link) const {
    const std::string& layout = link.properties.layout.empty() ? layout_ : link.properties.layout;
    if (layout == "fixed") {
        return 1;
    }

    auto resource = fetcher_->get(link);
    const Link& resolved = resource->link();

    std::optional<uint64_t> length;
    if (options_.strategy == ReflowableStrategy::OriginalLength) {
        const auto& encryption = resolved.properties.encryption;
        if (encryption && encryption->original_length) {
            length = static_cast<uint64_t>(*encryption->original_length);
        }
    } else if (resolved.properties.archive) {
        length = resolved.properties.archive->entry_length;
    }

    if (!length) {
        auto measured = resource->length();
        if (!measured) {
            LOG_DEBUG("EpubPositions", "Cannot measure " << link.href << ": " << measured.error().message);
            return 1;
        }
        length = *measured;
    }

    uint64_t pages = (*length + options_.page_length - 1) / options_.page_length;
    return std::max<uint64_t>(1, pages);
}

Result<std::vector<std::vector<Locator>>> EpubPositionsService::positions_by_reading_order() const {
    std::vector<std::vector<Locator>> result;
    int position = 1;

    for (const auto& link : reading_order_) {
        uint64_t count = position_count(link);
        std::vector<Locator> locators;
        locators.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            Locator locator;
            locator.href = link.href;
            locator.type = link.media_type().string();
            locator.title = link.title;
            locator.locations.progression = static_cast<double>(i) / static_cast<double>(count);
            locator.locations.position = position++;
            locators.push_back(std::move(locator));
        }
        result.push_back(std::move(locators));
    }

    // Total progression needs the publication-wide count
    const double total = static_cast<double>(position - 1);
    for (auto& locators : result) {
        for (auto& locator : locators) {
            locator.locations.total_progression = (*locator.locations.position - 1) / total;
        }
    }
    return result;
}

ServiceFactory EpubPositionsService::factory(ReflowablePositions options) {
    return [options](const ServiceContext& context) -> std::unique_ptr<PublicationService> {
        return std::make_unique<EpubPositionsService>(context.manifest.reading_order,
                                                      context.manifest.metadata.presentation.layout,
                                                      context.fetcher, options);
    };
}

} // namespace folio::epub
