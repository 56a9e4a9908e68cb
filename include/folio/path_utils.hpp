/**
 * Folio - Path Utilities
 *
 * Manipulation of the relative, slash-separated hrefs used inside
 * publications. Hrefs never start with '/' once normalized.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace folio {

/**
 * Convert backslashes to forward slashes and drop any leading slash.
 */
inline std::string normalize_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    size_t start = result.find_first_not_of('/');
    if (start == std::string::npos) return "";
    return result.substr(start);
}

/**
 * Get lowercase file extension including the dot.
 */
inline std::string get_extension_lower(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

/**
 * Extract parent directory from a path string.
 */
inline std::string get_parent_path(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    size_t pos = normalized.rfind('/');
    if (pos == std::string::npos) return "";
    return normalized.substr(0, pos);
}

/**
 * Last path component ("OEBPS/Images/cover.jpg" -> "cover.jpg").
 */
inline std::string get_file_name(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

/**
 * Dot-files and Windows thumbnail caches are never publication content.
 */
inline bool is_hidden_or_thumbs(const std::string& path) {
    std::string name = get_file_name(path);
    return (!name.empty() && name[0] == '.') || name == "Thumbs.db";
}

/**
 * Split off "#fragment" (and "?query") from an href.
 */
inline std::string strip_fragment(const std::string& href) {
    size_t pos = href.find_first_of("#?");
    if (pos == std::string::npos) return href;
    return href.substr(0, pos);
}

/**
 * Decode %XX escapes. Malformed escapes are kept verbatim.
 */
inline std::string percent_decode(std::string_view text) {
    auto hex_value = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        result.push_back(text[i]);
    }
    return result;
}

/**
 * True for "http:", "mailto:" and other hrefs carrying a scheme.
 */
inline bool has_scheme(const std::string& href) {
    size_t colon = href.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    size_t slash = href.find_first_of("/?#");
    if (slash != std::string::npos && slash < colon) return false;
    return std::all_of(href.begin(), href.begin() + static_cast<std::ptrdiff_t>(colon),
                       [](char c) {
                           return std::isalnum(static_cast<unsigned char>(c)) ||
                                  c == '+' || c == '-' || c == '.';
                       });
}

/**
 * Resolve href relative to the document located at base_file.
 *
 * The path part is percent-decoded and "." / ".." segments are collapsed;
 * a fragment is kept as-is. Absolute URLs are returned unchanged and
 * "/"-rooted hrefs are resolved against the publication root.
 */
inline std::string resolve_href(const std::string& base_file, const std::string& href) {
    if (href.empty()) return normalize_path(base_file);
    if (has_scheme(href)) return href;

    std::string fragment;
    std::string path_part = href;
    size_t hash = href.find('#');
    if (hash != std::string::npos) {
        fragment = href.substr(hash);
        path_part = href.substr(0, hash);
    }

    std::string joined;
    if (path_part.empty()) {
        joined = base_file;
    } else if (path_part[0] == '/') {
        joined = path_part;
    } else {
        std::string base_dir = get_parent_path(base_file);
        joined = base_dir.empty() ? path_part : base_dir + "/" + path_part;
    }
    joined = percent_decode(joined);
    std::replace(joined.begin(), joined.end(), '\\', '/');

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= joined.size()) {
        size_t end = joined.find('/', start);
        if (end == std::string::npos) end = joined.size();
        std::string segment = joined.substr(start, end - start);
        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        start = end + 1;
    }

    std::string result;
    for (const auto& segment : segments) {
        if (!result.empty()) result += '/';
        result += segment;
    }
    return result + fragment;
}

} // namespace folio
