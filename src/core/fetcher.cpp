/**
 * Folio - Fetcher implementation
 *
 * Resource helpers, file system fetcher and transforming fetcher.
 */

#include "folio/fetcher.hpp"
#include "folio/logging.hpp"
#include "folio/path_utils.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace folio {

namespace {

// Fill in the media type from the extension when the caller gave none.
Link with_type(Link link, const std::string& path) {
    if (!link.type) {
        link.type = MediaType::of_extension(std::filesystem::path(path).extension().string());
    }
    return link;
}

bool escapes_root(const std::string& relative) {
    size_t start = 0;
    while (start <= relative.size()) {
        size_t end = relative.find('/', start);
        if (end == std::string::npos) end = relative.size();
        if (relative.compare(start, end - start, "..") == 0) return true;
        start = end + 1;
    }
    return false;
}

class FileResource : public Resource {
public:
    FileResource(Link link, std::filesystem::path path) : link_(std::move(link)), path_(std::move(path)) {}

    const Link& link() const override { return link_; }

    Result<std::vector<uint8_t>> read() override {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            return Error::io_error("Failed to open file", path_.string());
        }
        std::error_code ec;
        auto size = std::filesystem::file_size(path_, ec);
        if (ec) {
            return Error::io_error("Failed to get file size: " + ec.message(), path_.string());
        }
        std::vector<uint8_t> data(static_cast<size_t>(size));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
        if (static_cast<uint64_t>(file.gcount()) != size) {
            return Error::io_error("Short read", path_.string());
        }
        return data;
    }

    Result<uint64_t> length() override {
        std::error_code ec;
        auto size = std::filesystem::file_size(path_, ec);
        if (ec) {
            return Error::io_error("Failed to get file size: " + ec.message(), path_.string());
        }
        return static_cast<uint64_t>(size);
    }

private:
    Link link_;
    std::filesystem::path path_;
};

} // namespace

// ============================================================================
// Resource
// ============================================================================

Result<uint64_t> Resource::length() {
    auto data = read();
    if (!data) return data.error();
    return static_cast<uint64_t>(data->size());
}

Result<std::string> Resource::read_as_string() {
    auto data = read();
    if (!data) return data.error();
    std::string text(data->begin(), data->end());
    // Drop a UTF-8 BOM
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }
    return text;
}

Result<XmlDocument> Resource::read_as_xml(const NamespaceBindings& bindings) {
    auto data = read();
    if (!data) return data.error();
    auto document = XmlDocument::parse(*data, bindings);
    if (!document) {
        Error error = document.error();
        error.context = link().href + (error.context.empty() ? "" : ", " + error.context);
        return error;
    }
    return document;
}

ResourcePtr Fetcher::get(const std::string& href) {
    Link link;
    link.href = href;
    return get(link);
}

// ============================================================================
// FileFetcher
// ============================================================================

FileFetcher::FileFetcher(std::map<std::string, std::filesystem::path> paths)
    : paths_(std::move(paths)) {}

FileFetcher::FileFetcher(const std::string& href, const std::filesystem::path& path)
    : paths_{{normalize_path(href), path}} {}

Result<LinkList> FileFetcher::links() {
    LinkList result;
    try {
        for (const auto& [href, path] : paths_) {
            if (std::filesystem::is_regular_file(path)) {
                Link link;
                link.href = href;
                result.push_back(with_type(std::move(link), href));
                continue;
            }
            if (!std::filesystem::is_directory(path)) {
                LOG_WARNING("FileFetcher", "Skipping missing path: " << path.string());
                continue;
            }

            std::vector<std::string> hrefs;
            for (const auto& entry : std::filesystem::recursive_directory_iterator(path)) {
                if (!entry.is_regular_file()) continue;
                std::string relative = entry.path().lexically_relative(path).generic_string();
                hrefs.push_back(href.empty() ? relative : href + "/" + relative);
            }
            std::sort(hrefs.begin(), hrefs.end());
            for (const auto& entry_href : hrefs) {
                Link link;
                link.href = entry_href;
                result.push_back(with_type(std::move(link), entry_href));
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        return Error::io_error(std::string("Failed to list files: ") + e.what());
    }
    return result;
}

ResourcePtr FileFetcher::get(const Link& link) {
    std::string href = normalize_path(strip_fragment(link.href));

    for (const auto& [prefix, path] : paths_) {
        std::error_code ec;
        if (href == prefix && std::filesystem::is_regular_file(path, ec)) {
            return std::make_unique<FileResource>(with_type(link, href), path);
        }

        std::string relative;
        if (prefix.empty()) {
            relative = href;
        } else if (href.size() > prefix.size() && href.compare(0, prefix.size(), prefix) == 0 &&
                   href[prefix.size()] == '/') {
            relative = href.substr(prefix.size() + 1);
        } else {
            continue;
        }

        if (relative.empty() || escapes_root(relative) || !std::filesystem::is_directory(path, ec)) {
            continue;
        }
        std::filesystem::path candidate = path / std::filesystem::path(relative);
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return std::make_unique<FileResource>(with_type(link, href), candidate);
        }
    }

    LOG_DEBUG("FileFetcher", "Resource not found: " << link.href);
    return std::make_unique<FailureResource>(link, Error::not_found(link.href));
}

// ============================================================================
// TransformingFetcher
// ============================================================================

TransformingFetcher::TransformingFetcher(FetcherPtr fetcher, ResourceTransformer transformer)
    : fetcher_(std::move(fetcher)), transformer_(std::move(transformer)) {}

ResourcePtr TransformingFetcher::get(const Link& link) {
    return transformer_(fetcher_->get(link));
}

} // namespace folio
