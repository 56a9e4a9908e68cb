/**
 * Folio - Links
 *
 * A Link points to one resource of a publication. Links are plain values;
 * the reading order, resources and navigation collections are LinkLists.
 */

#pragma once

#include "mediatype.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace folio {

/**
 * How a resource is encrypted or obfuscated, from META-INF/encryption.xml.
 */
struct Encryption {
    std::string algorithm;
    std::string compression;              // "deflate", "none" or empty
    std::optional<int64_t> original_length;
    std::string profile;
    std::string scheme;                   // DRM scheme URI, empty for plain obfuscation

    bool operator==(const Encryption& other) const {
        return algorithm == other.algorithm && compression == other.compression &&
               original_length == other.original_length && profile == other.profile &&
               scheme == other.scheme;
    }

    nlohmann::json to_json() const;
};

/**
 * Where a resource lives inside its archive.
 */
struct ArchiveInfo {
    uint64_t entry_length = 0;
    bool is_entry_compressed = false;
};

/**
 * Format-specific markers attached to a link.
 */
struct Properties {
    std::optional<Encryption> encryption;
    std::vector<std::string> contains;    // "js", "mathml", "svg", "remote-resources"
    std::string page;                     // "left", "right", "center"
    std::string layout;                   // "fixed", "reflowable"
    std::string media_overlay;            // href of the SMIL document
    std::optional<ArchiveInfo> archive;

    bool empty() const {
        return !encryption && contains.empty() && page.empty() && layout.empty() &&
               media_overlay.empty() && !archive;
    }

    nlohmann::json to_json() const;
};

struct Link;
using LinkList = std::vector<Link>;

struct Link {
    std::string href;
    std::optional<MediaType> type;
    std::string title;
    std::vector<std::string> rels;
    Properties properties;
    LinkList children;

    bool has_rel(const std::string& rel) const;
    void add_rel(const std::string& rel);

    /**
     * Media type, or application/octet-stream when unknown.
     */
    const MediaType& media_type() const;

    nlohmann::json to_json() const;
};

/**
 * First link with the given href (fragment ignored), searched depth-first
 * through children. nullptr when absent.
 */
const Link* find_link(const LinkList& links, const std::string& href);

/**
 * First link carrying the given rel, top level only.
 */
const Link* find_link_with_rel(const LinkList& links, const std::string& rel);

nlohmann::json to_json(const LinkList& links);

} // namespace folio
