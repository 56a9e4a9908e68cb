/**
 * Folio - EPUB parser
 */

#pragma once

#include "epub_positions.hpp"
#include "parser.hpp"

namespace folio {

class EpubParser : public PublicationParser {
public:
    explicit EpubParser(epub::ReflowablePositions positions = {});

    /**
     * Null builder for assets that are not EPUB; the fetcher is not touched
     * in that case.
     */
    Result<std::unique_ptr<PublicationBuilder>> parse(const PublicationAsset& asset,
                                                     const FetcherPtr& fetcher) override;

private:
    epub::ReflowablePositions positions_;
};

} // namespace folio
