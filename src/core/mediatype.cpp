/**
 * Folio - Media type implementation
 */

#include "folio/mediatype.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_map>

namespace folio {

namespace {

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Constants are only created from the literals below, which always parse.
MediaType constant(const char* value) {
    return MediaType::parse(value).value_or(MediaType());
}

} // namespace

std::optional<MediaType> MediaType::parse(std::string_view value) {
    std::string_view remaining = trim(value);
    size_t semicolon = remaining.find(';');
    std::string_view essence = trim(remaining.substr(0, semicolon));

    size_t slash = essence.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 >= essence.size()) {
        return std::nullopt;
    }

    MediaType result;
    result.type_ = to_lower(trim(essence.substr(0, slash)));
    result.subtype_ = to_lower(trim(essence.substr(slash + 1)));

    while (semicolon != std::string_view::npos) {
        remaining = remaining.substr(semicolon + 1);
        semicolon = remaining.find(';');
        std::string_view param = trim(remaining.substr(0, semicolon));
        size_t equals = param.find('=');
        if (equals == std::string_view::npos) continue;

        std::string key = to_lower(trim(param.substr(0, equals)));
        std::string_view raw = trim(param.substr(equals + 1));
        if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
            raw = raw.substr(1, raw.size() - 2);
        }
        std::string param_value(raw);
        // charset values are case-insensitive
        if (key == "charset") param_value = to_lower(param_value);
        if (!key.empty()) result.parameters_[key] = param_value;
    }
    return result;
}

std::optional<MediaType> MediaType::of_extension(std::string_view extension) {
    static const std::unordered_map<std::string, const char*> by_extension = {
        {"epub", "application/epub+zip"},
        {"cbz", "application/vnd.comicbook+zip"},
        {"cbr", "application/vnd.comicbook-rar"},
        {"zip", "application/zip"},
        {"ncx", "application/x-dtbncx+xml"},
        {"opf", "application/oebps-package+xml"},
        {"xhtml", "application/xhtml+xml"},
        {"xht", "application/xhtml+xml"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"smil", "application/smil+xml"},
        {"xml", "application/xml"},
        {"acbf", "application/xml"},
        {"json", "application/json"},
        {"txt", "text/plain"},
        {"css", "text/css"},
        {"js", "text/javascript"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"jpe", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"bmp", "image/bmp"},
        {"dib", "image/bmp"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"avif", "image/avif"},
        {"jxl", "image/jxl"},
        {"svg", "image/svg+xml"},
        {"otf", "font/otf"},
        {"ttf", "font/ttf"},
        {"woff", "font/woff"},
        {"woff2", "font/woff2"},
        {"mp3", "audio/mpeg"},
        {"mp4", "video/mp4"},
    };

    std::string key = to_lower(extension);
    if (!key.empty() && key[0] == '.') key.erase(0, 1);
    auto it = by_extension.find(key);
    if (it == by_extension.end()) return std::nullopt;
    return parse(it->second);
}

std::string MediaType::string() const {
    std::string result = type_ + "/" + subtype_;
    for (const auto& [key, value] : parameters_) {
        result += ";" + key + "=" + value;
    }
    return result;
}

bool MediaType::operator==(const MediaType& other) const {
    return type_ == other.type_ && subtype_ == other.subtype_ && parameters_ == other.parameters_;
}

bool MediaType::contains(const MediaType& other) const {
    if (type_ != "*" && type_ != other.type_) return false;
    if (subtype_ != "*" && subtype_ != other.subtype_) return false;
    for (const auto& [key, value] : parameters_) {
        auto it = other.parameters_.find(key);
        if (it == other.parameters_.end() || it->second != value) return false;
    }
    return true;
}

bool MediaType::contains(std::string_view other) const {
    auto parsed = parse(other);
    return parsed && contains(*parsed);
}

bool MediaType::is_bitmap() const {
    static const std::set<std::string> bitmap_subtypes = {
        "bmp", "gif", "jpeg", "png", "tiff", "webp", "avif", "jxl"
    };
    return type_ == "image" && bitmap_subtypes.count(subtype_) > 0;
}

bool MediaType::is_html() const {
    return (type_ == "text" && subtype_ == "html") ||
           (type_ == "application" && subtype_ == "xhtml+xml");
}

const MediaType& MediaTypes::EPUB() {
    static const MediaType value = constant("application/epub+zip");
    return value;
}

const MediaType& MediaTypes::CBZ() {
    static const MediaType value = constant("application/vnd.comicbook+zip");
    return value;
}

const MediaType& MediaTypes::CBR() {
    static const MediaType value = constant("application/vnd.comicbook-rar");
    return value;
}

const MediaType& MediaTypes::ZIP() {
    static const MediaType value = constant("application/zip");
    return value;
}

const MediaType& MediaTypes::NCX() {
    static const MediaType value = constant("application/x-dtbncx+xml");
    return value;
}

const MediaType& MediaTypes::XHTML() {
    static const MediaType value = constant("application/xhtml+xml");
    return value;
}

const MediaType& MediaTypes::HTML() {
    static const MediaType value = constant("text/html");
    return value;
}

const MediaType& MediaTypes::OPF() {
    static const MediaType value = constant("application/oebps-package+xml");
    return value;
}

const MediaType& MediaTypes::SMIL() {
    static const MediaType value = constant("application/smil+xml");
    return value;
}

const MediaType& MediaTypes::XML() {
    static const MediaType value = constant("application/xml");
    return value;
}

const MediaType& MediaTypes::JSON() {
    static const MediaType value = constant("application/json");
    return value;
}

const MediaType& MediaTypes::TEXT() {
    static const MediaType value = constant("text/plain");
    return value;
}

const MediaType& MediaTypes::CSS() {
    static const MediaType value = constant("text/css");
    return value;
}

const MediaType& MediaTypes::JAVASCRIPT() {
    static const MediaType value = constant("text/javascript");
    return value;
}

const MediaType& MediaTypes::PNG() {
    static const MediaType value = constant("image/png");
    return value;
}

const MediaType& MediaTypes::JPEG() {
    static const MediaType value = constant("image/jpeg");
    return value;
}

const MediaType& MediaTypes::GIF() {
    static const MediaType value = constant("image/gif");
    return value;
}

const MediaType& MediaTypes::WEBP() {
    static const MediaType value = constant("image/webp");
    return value;
}

const MediaType& MediaTypes::BMP() {
    static const MediaType value = constant("image/bmp");
    return value;
}

const MediaType& MediaTypes::TIFF() {
    static const MediaType value = constant("image/tiff");
    return value;
}

const MediaType& MediaTypes::AVIF() {
    static const MediaType value = constant("image/avif");
    return value;
}

const MediaType& MediaTypes::JXL() {
    static const MediaType value = constant("image/jxl");
    return value;
}

const MediaType& MediaTypes::SVG() {
    static const MediaType value = constant("image/svg+xml");
    return value;
}

const MediaType& MediaTypes::IMAGE_ANY() {
    static const MediaType value = constant("image/*");
    return value;
}

const MediaType& MediaTypes::OTF() {
    static const MediaType value = constant("font/otf");
    return value;
}

const MediaType& MediaTypes::TTF() {
    static const MediaType value = constant("font/ttf");
    return value;
}

const MediaType& MediaTypes::WOFF() {
    static const MediaType value = constant("font/woff");
    return value;
}

const MediaType& MediaTypes::WOFF2() {
    static const MediaType value = constant("font/woff2");
    return value;
}

const MediaType& MediaTypes::BINARY() {
    static const MediaType value = constant("application/octet-stream");
    return value;
}


} // namespace folio
