/**
 * Folio - Streamer implementation
 */

#include "folio/streamer.hpp"
#include "folio/epub_parser.hpp"
#include "folio/image_parser.hpp"
#include "folio/logging.hpp"

namespace folio {

namespace {

std::vector<PublicationParserPtr> default_parsers() {
    std::vector<PublicationParserPtr> parsers;
    parsers.push_back(std::make_unique<EpubParser>());
    parsers.push_back(std::make_unique<ImageParser>());
    return parsers;
}

} // namespace

Streamer::Streamer() : parsers_(default_parsers()) {}

Streamer::Streamer(std::vector<PublicationParserPtr> parsers) : parsers_(std::move(parsers)) {}

Result<std::unique_ptr<Publication>> Streamer::open(const PublicationAsset& asset) {
    TRY_ASSIGN(fetcher, asset.create_fetcher());
    return open(asset, fetcher);
}

Result<std::unique_ptr<Publication>> Streamer::open(const PublicationAsset& asset, const FetcherPtr& fetcher) {
    LOG_DEBUG("Streamer", "Opening " << asset.name() << " (" << asset.media_type().string() << ")");

    for (const auto& parser : parsers_) {
        TRY_ASSIGN(builder, parser->parse(asset, fetcher));
        if (builder) {
            return builder->build();
        }
    }

    LOG_DEBUG("Streamer", "No parser accepted " << asset.name());
    return Error::not_supported("Unsupported publication format", asset.name());
}

} // namespace folio
