/**
 * Folio - Media types
 *
 * Parsed "type/subtype; key=value" media types with the constants the
 * parsers need, plus extension-based sniffing for archive entries.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace folio {

class MediaType {
public:
    MediaType() = default;

    /**
     * Parse a media type string. Returns nullopt for strings without a
     * "type/subtype" pair.
     */
    static std::optional<MediaType> parse(std::string_view value);

    /**
     * Media type for a file extension (with or without the dot), nullopt
     * when unknown.
     */
    static std::optional<MediaType> of_extension(std::string_view extension);

    const std::string& type() const { return type_; }
    const std::string& subtype() const { return subtype_; }
    const std::map<std::string, std::string>& parameters() const { return parameters_; }

    bool empty() const { return type_.empty(); }

    /**
     * "type/subtype" followed by the sorted parameters.
     */
    std::string string() const;

    /**
     * Type, subtype and parameters all match.
     */
    bool operator==(const MediaType& other) const;
    bool operator!=(const MediaType& other) const { return !(*this == other); }

    /**
     * True when other is included in this media type: wildcards match any
     * type or subtype and every parameter of this one must appear in other.
     */
    bool contains(const MediaType& other) const;
    bool contains(std::string_view other) const;

    bool is_bitmap() const;
    bool is_html() const;

private:
    std::string type_;
    std::string subtype_;
    std::map<std::string, std::string> parameters_;
};

/**
 * Media type constants.
 */
struct MediaTypes {
    static const MediaType& EPUB();
    static const MediaType& CBZ();
    static const MediaType& CBR();
    static const MediaType& ZIP();
    static const MediaType& NCX();
    static const MediaType& XHTML();
    static const MediaType& HTML();
    static const MediaType& OPF();
    static const MediaType& SMIL();
    static const MediaType& XML();
    static const MediaType& JSON();
    static const MediaType& TEXT();
    static const MediaType& CSS();
    static const MediaType& JAVASCRIPT();
    static const MediaType& PNG();
    static const MediaType& JPEG();
    static const MediaType& GIF();
    static const MediaType& WEBP();
    static const MediaType& BMP();
    static const MediaType& TIFF();
    static const MediaType& AVIF();
    static const MediaType& JXL();
    static const MediaType& SVG();
    static const MediaType& IMAGE_ANY();
    static const MediaType& OTF();
    static const MediaType& TTF();
    static const MediaType& WOFF();
    static const MediaType& WOFF2();
    static const MediaType& BINARY();
};

} // namespace folio
