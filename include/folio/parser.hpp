/**
 * Folio - Publication parser interface
 */

#pragma once

#include "asset.hpp"
#include "fetcher.hpp"
#include "publication.hpp"
#include "result.hpp"

#include <memory>

namespace folio {

class PublicationParser {
public:
    virtual ~PublicationParser() = default;

    /**
     * Builder for the publication in asset, read through fetcher.
     *
     * A null builder means the parser does not handle this asset; an error
     * means it does but the asset is broken.
     */
    virtual Result<std::unique_ptr<PublicationBuilder>> parse(const PublicationAsset& asset,
                                                             const FetcherPtr& fetcher) = 0;
};

using PublicationParserPtr = std::unique_ptr<PublicationParser>;

} // namespace folio
