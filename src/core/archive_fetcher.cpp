/**
 * Folio - Archive fetcher implementation
 */

#include "folio/archive_fetcher.hpp"
#include "folio/logging.hpp"
#include "folio/path_utils.hpp"

namespace folio {

namespace {

ArchiveInfo archive_info_of(const ZipEntry& entry) {
    ArchiveInfo info;
    info.entry_length = entry.size;
    info.is_entry_compressed = entry.is_compressed();
    return info;
}

class ArchiveResource : public Resource {
public:
    ArchiveResource(std::shared_ptr<ArchiveFetcher> archive, Link link, ZipEntry entry)
        : archive_(std::move(archive)), link_(std::move(link)), entry_(std::move(entry)) {}

    const Link& link() const override { return link_; }

    Result<std::vector<uint8_t>> read() override {
        return archive_->read_entry(entry_);
    }

    Result<uint64_t> length() override {
        return static_cast<uint64_t>(entry_.original_size);
    }

private:
    std::shared_ptr<ArchiveFetcher> archive_;
    Link link_;
    ZipEntry entry_;
};

} // namespace

ArchiveFetcher::ArchiveFetcher(Token, std::unique_ptr<ZipReader> reader) : reader_(std::move(reader)) {}

Result<std::shared_ptr<ArchiveFetcher>> ArchiveFetcher::open(const std::filesystem::path& path) {
    auto reader = std::make_unique<ZipReader>();
    TRY(reader->open(path));
    return std::make_shared<ArchiveFetcher>(Token{}, std::move(reader));
}

Result<LinkList> ArchiveFetcher::links() {
    LinkList result;
    result.reserve(reader_->file_count());
    for (const auto& entry : reader_->entries()) {
        Link link;
        link.href = entry.path;
        link.type = MediaType::of_extension(get_extension_lower(entry.path));
        link.properties.archive = archive_info_of(entry);
        result.push_back(std::move(link));
    }
    return result;
}

ResourcePtr ArchiveFetcher::get(const Link& link) {
    std::string path = normalize_path(strip_fragment(link.href));
    const ZipEntry* entry = reader_->find_entry(path);
    if (!entry) {
        LOG_DEBUG("ArchiveFetcher", "Entry not found: " << link.href);
        return std::make_unique<FailureResource>(link, Error::not_found(link.href));
    }

    Link resolved = link;
    if (!resolved.type) {
        resolved.type = MediaType::of_extension(get_extension_lower(path));
    }
    resolved.properties.archive = archive_info_of(*entry);

    // Resources keep the archive open after the fetcher is released.
    return std::make_unique<ArchiveResource>(shared_from_this(), std::move(resolved), *entry);
}

Result<std::vector<uint8_t>> ArchiveFetcher::read_entry(const ZipEntry& entry) {
    return reader_->read_file(entry);
}

} // namespace folio
