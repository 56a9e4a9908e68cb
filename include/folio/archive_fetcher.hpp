/**
 * Folio - Archive fetcher
 *
 * Serves the entries of a ZIP archive (EPUB, CBZ, plain ZIP).
 */

#pragma once

#include "fetcher.hpp"
#include "zip_reader.hpp"

#include <filesystem>
#include <memory>

namespace folio {

class ArchiveFetcher : public Fetcher, public std::enable_shared_from_this<ArchiveFetcher> {
    // Only open() can name this; construction goes through std::make_shared.
    struct Token {
        explicit Token() = default;
    };

public:
    /**
     * Open the archive at path. Fails with FileNotFound, InvalidFormat or
     * NotSupported when the file is not a readable ZIP archive.
     */
    static Result<std::shared_ptr<ArchiveFetcher>> open(const std::filesystem::path& path);

    using Fetcher::get;

    /**
     * One link per file entry, in central directory order. Each link carries
     * an ArchiveInfo property with the stored entry length.
     */
    Result<LinkList> links() override;
    ResourcePtr get(const Link& link) override;

    /**
     * Reads the entry. The archive shares one file stream and is not
     * thread-safe.
     */
    Result<std::vector<uint8_t>> read_entry(const ZipEntry& entry);

    const ZipReader& reader() const { return *reader_; }

    ArchiveFetcher(Token, std::unique_ptr<ZipReader> reader);

private:

    std::unique_ptr<ZipReader> reader_;
};

} // namespace folio
