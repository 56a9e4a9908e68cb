/**
 * Folio - Image parser
 *
 * Bitmap-based publications: CBZ, plain ZIP archives of images, exploded
 * directories of images and standalone bitmap files.
 */

#pragma once

#include "parser.hpp"

#include <string>

namespace folio {

class ImageParser : public PublicationParser {
public:
    /**
     * Null builder when the asset holds anything besides bitmaps and
     * companion metadata files (acbf, xml, txt, json). Fails with NoContent
     * when no bitmap is left after filtering.
     */
    Result<std::unique_ptr<PublicationBuilder>> parse(const PublicationAsset& asset,
                                                     const FetcherPtr& fetcher) override;

    /**
     * Name of the directory every entry lives in, empty when entries are
     * spread over several directories or sit at the root.
     */
    static std::string guess_title_from_file_structure(const LinkList& links);

private:
    Result<bool> accepts(const PublicationAsset& asset, Fetcher& fetcher) const;
};

} // namespace folio
