/**
 * Folio - Streamer
 *
 * Opens an asset with the first parser that accepts it.
 */

#pragma once

#include "parser.hpp"

#include <memory>
#include <vector>

namespace folio {

class Streamer {
public:
    /**
     * EPUB parser then image parser, with default options.
     */
    Streamer();

    explicit Streamer(std::vector<PublicationParserPtr> parsers);

    /**
     * Fails with NotSupported when no parser accepts the asset.
     */
    Result<std::unique_ptr<Publication>> open(const PublicationAsset& asset);

    /**
     * Same, with a fetcher provided by the caller.
     */
    Result<std::unique_ptr<Publication>> open(const PublicationAsset& asset, const FetcherPtr& fetcher);

private:
    std::vector<PublicationParserPtr> parsers_;
};

} // namespace folio
