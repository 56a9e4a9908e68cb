/**
 * Folio - EPUB parser implementation
 *
 * 1. META-INF/container.xml gives the package document path
 * 2. The package document gives metadata, manifest and spine
 * 3. Navigation, encryption and display options are read independently;
 *    none of them can fail the parse
 * 4. The fetcher is wrapped to deobfuscate fonts
 */

#include "folio/epub_parser.hpp"
#include "folio/epub_constants.hpp"
#include "folio/epub_deobfuscator.hpp"
#include "folio/epub_display_options.hpp"
#include "folio/epub_encryption.hpp"
#include "folio/epub_navigation.hpp"
#include "folio/epub_package.hpp"
#include "folio/epub_publication_factory.hpp"
#include "folio/logging.hpp"
#include "folio/services.hpp"

namespace folio {

EpubParser::EpubParser(epub::ReflowablePositions positions) : positions_(positions) {}

Result<std::unique_ptr<PublicationBuilder>> EpubParser::parse(const PublicationAsset& asset,
                                                              const FetcherPtr& fetcher) {
    if (asset.media_type() != MediaTypes::EPUB()) {
        return std::unique_ptr<PublicationBuilder>();
    }

    TRY_ASSIGN(opf_path, epub::get_root_file_path(*fetcher));
    LOG_DEBUG("EpubParser", "Package document: " << opf_path);

    auto opf_document = fetcher->get(opf_path)->read_as_xml(epub::package_bindings());
    if (!opf_document) {
        return opf_document.error().wrapped("invalid package descriptor");
    }

    auto package = epub::parse_package_document(*opf_document, opf_path);
    if (!package) {
        return package.error().wrapped("invalid package descriptor");
    }

    Manifest manifest = epub::EpubPublicationFactory(*package, asset.name())
                            .navigation(epub::resolve_navigation(*package, *fetcher))
                            .encryption(epub::parse_encryption_data(*fetcher))
                            .display_options(epub::parse_display_options(*fetcher))
                            .create();

    LOG_INFO("EpubParser", "Parsed " << asset.name() << " (EPUB " << package->version << ", "
             << manifest.reading_order.size() << " reading order items)");

    auto builder = std::make_unique<PublicationBuilder>();
    builder->fetcher = epub::wrap_with_deobfuscation(fetcher, manifest.metadata.identifier);
    builder->manifest = std::move(manifest);
    builder->services.set(kPositionsServiceName, epub::EpubPositionsService::factory(positions_));
    builder->services.set(kContentServiceName, ContentService::factory({"html"}));
    builder->services.set(kGuidedNavigationServiceName, GuidedNavigationService::factory());
    return builder;
}

} // namespace folio
