/**
 * Folio - Publication assets
 *
 * An asset is the thing a publication is opened from: a name, a media type
 * and a way to access its resources.
 */

#pragma once

#include "fetcher.hpp"
#include "mediatype.hpp"
#include "result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace folio {

class PublicationAsset {
public:
    virtual ~PublicationAsset() = default;

    /**
     * Name used as a fallback title (file name with extension).
     */
    virtual std::string name() const = 0;

    virtual const MediaType& media_type() const = 0;

    /**
     * Fetcher giving access to the asset's resources.
     */
    virtual Result<FetcherPtr> create_fetcher() const = 0;
};

/**
 * Asset backed by a file or an exploded directory on the local file system.
 */
class FileAsset : public PublicationAsset {
public:
    /**
     * When media_type is not given it is sniffed from the file: known
     * extensions first, then the "mimetype" entry of ZIP archives and of
     * exploded directories.
     */
    explicit FileAsset(std::filesystem::path path, std::optional<MediaType> media_type = std::nullopt);

    std::string name() const override;
    const MediaType& media_type() const override { return media_type_; }
    Result<FetcherPtr> create_fetcher() const override;

    const std::filesystem::path& path() const { return path_; }

private:
    static MediaType sniff(const std::filesystem::path& path);

    std::filesystem::path path_;
    MediaType media_type_;
};

} // namespace folio
