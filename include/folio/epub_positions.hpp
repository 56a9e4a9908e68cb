/**
 * Folio - EPUB positions
 *
 * Positions split the reading order into fixed-size pages so that locations
 * stay stable across devices. Fixed-layout resources count as one position;
 * reflowable resources as ceil(length / page_length).
 */

#pragma once

#include "fetcher.hpp"
#include "services.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace folio::epub {

constexpr uint64_t DEFAULT_POSITION_PAGE_LENGTH = 1024;

/**
 * Which length a reflowable resource is measured with.
 */
enum class ReflowableStrategy {
    ArchiveEntryLength,   // Stored (possibly compressed) archive entry length
    OriginalLength        // Decrypted length from encryption.xml
};

struct ReflowablePositions {
    ReflowableStrategy strategy = ReflowableStrategy::ArchiveEntryLength;
    uint64_t page_length = DEFAULT_POSITION_PAGE_LENGTH;
};

/**
 * "archive-entry-length" or "original-length".
 */
std::optional<ReflowableStrategy> parse_reflowable_strategy(std::string_view name);
const char* to_string(ReflowableStrategy strategy);

class EpubPositionsService : public PositionsService {
public:
    EpubPositionsService(LinkList reading_order, std::string layout, FetcherPtr fetcher,
                         ReflowablePositions options);

    Result<std::vector<std::vector<Locator>>> positions_by_reading_order() const override;

    const ReflowablePositions& options() const { return options_; }

    static ServiceFactory factory(ReflowablePositions options);

private:
    uint64_t position_count(const Link& link) const;

    LinkList reading_order_;
    std::string layout_;
    FetcherPtr fetcher_;
    ReflowablePositions options_;
};

} // namespace folio::epub
