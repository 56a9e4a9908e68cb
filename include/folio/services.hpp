/**
 * Folio - Publication services
 */

#pragma once

#include "publication.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace folio {

constexpr const char* kPositionsServiceName = "positions";
constexpr const char* kContentServiceName = "content";
constexpr const char* kGuidedNavigationServiceName = "guided-navigation";

/**
 * A location in a publication.
 */
struct Locator {
    std::string href;
    std::string type;
    std::string title;

    struct Locations {
        std::optional<double> progression;         // Within the resource, [0, 1)
        std::optional<int> position;               // 1-based, publication-wide
        std::optional<double> total_progression;   // Within the publication, [0, 1)
    } locations;

    nlohmann::json to_json() const;
};

class PositionsService : public PublicationService {
public:
    std::string name() const override { return kPositionsServiceName; }

    /**
     * Positions grouped by reading order item.
     */
    virtual Result<std::vector<std::vector<Locator>>> positions_by_reading_order() const = 0;

    /**
     * Flat list of every position.
     */
    Result<std::vector<Locator>> positions() const;
};

/**
 * One position per reading order item whose media type is contained in the
 * configured one (e.g. image/*). Used by bitmap publications.
 */
class PerResourcePositionsService : public PositionsService {
public:
    PerResourcePositionsService(LinkList reading_order, MediaType media_type);

    Result<std::vector<std::vector<Locator>>> positions_by_reading_order() const override;

    static ServiceFactory factory(MediaType media_type);

private:
    LinkList reading_order_;
    MediaType media_type_;
};

/**
 * Registers which content iterators a publication supports. Text extraction
 * itself is not provided.
 */
class ContentService : public PublicationService {
public:
    ContentService(LinkList reading_order, std::vector<std::string> iterator_kinds);

    std::string name() const override { return kContentServiceName; }

    const std::vector<std::string>& iterator_kinds() const { return iterator_kinds_; }

    /**
     * Reading order items one of the enabled iterators can handle.
     */
    LinkList iterable_links() const;

    static ServiceFactory factory(std::vector<std::string> iterator_kinds);

private:
    LinkList reading_order_;
    std::vector<std::string> iterator_kinds_;
};

/**
 * Exposes the reading order items that have a media overlay.
 */
class GuidedNavigationService : public PublicationService {
public:
    explicit GuidedNavigationService(LinkList reading_order);

    std::string name() const override { return kGuidedNavigationServiceName; }

    bool has_guided_navigation() const;
    LinkList links_with_media_overlay() const;

    static ServiceFactory factory();

private:
    LinkList reading_order_;
};

} // namespace folio
