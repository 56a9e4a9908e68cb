/**
 * Folio - Publication services implementation
 */

#include "folio/services.hpp"

namespace folio {

nlohmann::json Locator::to_json() const {
    nlohmann::json j;
    j["href"] = href;
    j["type"] = type;
    if (!title.empty()) j["title"] = title;

    nlohmann::json loc = nlohmann::json::object();
    if (locations.progression) loc["progression"] = *locations.progression;
    if (locations.position) loc["position"] = *locations.position;
    if (locations.total_progression) loc["totalProgression"] = *locations.total_progression;
    j["locations"] = loc;
    return j;
}

// ============================================================================
// PositionsService
// ============================================================================

Result<std::vector<Locator>> PositionsService::positions() const {
    TRY_ASSIGN(grouped, positions_by_reading_order());
    std::vector<Locator> result;
    for (auto& group : grouped) {
        for (auto& locator : group) {
            result.push_back(std::move(locator));
        }
    }
    return result;
}

PerResourcePositionsService::PerResourcePositionsService(LinkList reading_order, MediaType media_type)
    : reading_order_(std::move(reading_order)), media_type_(std::move(media_type)) {}

Result<std::vector<std::vector<Locator>>> PerResourcePositionsService::positions_by_reading_order() const {
    std::vector<std::vector<Locator>> result;
    std::vector<const Link*> positioned;
    for (const auto& link : reading_order_) {
        if (media_type_.contains(link.media_type())) {
            positioned.push_back(&link);
        }
    }

    const double count = static_cast<double>(positioned.size());
    for (size_t i = 0; i < positioned.size(); ++i) {
        Locator locator;
        locator.href = positioned[i]->href;
        locator.type = positioned[i]->media_type().string();
        locator.title = positioned[i]->title;
        locator.locations.progression = 0.0;
        locator.locations.position = static_cast<int>(i + 1);
        locator.locations.total_progression = static_cast<double>(i) / count;
        result.push_back({std::move(locator)});
    }
    return result;
}

ServiceFactory PerResourcePositionsService::factory(MediaType media_type) {
    return [media_type](const ServiceContext& context) -> std::unique_ptr<PublicationService> {
        return std::make_unique<PerResourcePositionsService>(context.manifest.reading_order, media_type);
    };
}

// ============================================================================
// ContentService
// ============================================================================

ContentService::ContentService(LinkList reading_order, std::vector<std::string> iterator_kinds)
    : reading_order_(std::move(reading_order)), iterator_kinds_(std::move(iterator_kinds)) {}

LinkList ContentService::iterable_links() const {
    LinkList result;
    for (const auto& link : reading_order_) {
        for (const auto& kind : iterator_kinds_) {
            if (kind == "html" && link.media_type().is_html()) {
                result.push_back(link);
                break;
            }
        }
    }
    return result;
}

ServiceFactory ContentService::factory(std::vector<std::string> iterator_kinds) {
    return [iterator_kinds](const ServiceContext& context) -> std::unique_ptr<PublicationService> {
        return std::make_unique<ContentService>(context.manifest.reading_order, iterator_kinds);
    };
}

// ============================================================================
// GuidedNavigationService
// ============================================================================

GuidedNavigationService::GuidedNavigationService(LinkList reading_order)
    : reading_order_(std::move(reading_order)) {}

bool GuidedNavigationService::has_guided_navigation() const {
    for (const auto& link : reading_order_) {
        if (!link.properties.media_overlay.empty()) return true;
    }
    return false;
}

LinkList GuidedNavigationService::links_with_media_overlay() const {
    LinkList result;
    for (const auto& link : reading_order_) {
        if (!link.properties.media_overlay.empty()) result.push_back(link);
    }
    return result;
}

ServiceFactory GuidedNavigationService::factory() {
    return [](const ServiceContext& context) -> std::unique_ptr<PublicationService> {
        return std::make_unique<GuidedNavigationService>(context.manifest.reading_order);
    };
}

} // namespace folio
