/**
 * Folio - Publication assets implementation
 */

#include "folio/asset.hpp"
#include "folio/archive_fetcher.hpp"
#include "folio/files.hpp"
#include "folio/logging.hpp"
#include "folio/path_utils.hpp"
#include "folio/zip_reader.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace folio {

namespace {

constexpr const char* MIMETYPE_ENTRY = "mimetype";

std::string trim(std::string text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) return {};
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

// Declared media type of an OCF container, empty when there is none.
std::string zip_mimetype(const std::filesystem::path& path) {
    ZipReader reader;
    if (!reader.open(path)) return {};
    auto data = reader.read_file(MIMETYPE_ENTRY);
    if (!data) return {};
    return trim(std::string(data->begin(), data->end()));
}

std::string directory_mimetype(const std::filesystem::path& path) {
    std::ifstream file(path / MIMETYPE_ENTRY, std::ios::binary);
    if (!file) return {};
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return trim(std::move(content));
}

bool is_zip_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    uint8_t header[4] = {0, 0, 0, 0};
    file.read(reinterpret_cast<char*>(header), 4);
    return file.gcount() == 4 && is_zip_signature(header, 4);
}

} // namespace

FileAsset::FileAsset(std::filesystem::path path, std::optional<MediaType> media_type)
    : path_(std::move(path)) {
    media_type_ = media_type ? *media_type : sniff(path_);
    LOG_DEBUG("FileAsset", path_.filename().string() << " -> " << media_type_.string());
}

MediaType FileAsset::sniff(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        std::string declared = directory_mimetype(path);
        if (declared == MediaTypes::EPUB().string() ||
            std::filesystem::is_regular_file(path / "META-INF" / "container.xml", ec)) {
            return MediaTypes::EPUB();
        }
        return MediaTypes::ZIP();
    }

    std::string extension = get_extension_lower(path);
    if (extension == ".epub") return MediaTypes::EPUB();
    if (extension == ".cbz") return MediaTypes::CBZ();
    if (extension == ".cbr") return MediaTypes::CBR();

    if (is_zip_file(path)) {
        auto declared = MediaType::parse(zip_mimetype(path));
        if (declared && *declared == MediaTypes::EPUB()) return MediaTypes::EPUB();
        return MediaTypes::ZIP();
    }

    if (auto by_extension = MediaType::of_extension(extension)) {
        return *by_extension;
    }
    return MediaTypes::BINARY();
}

std::string FileAsset::name() const {
    return path_.filename().string();
}

Result<FetcherPtr> FileAsset::create_fetcher() const {
    std::error_code ec;
    if (std::filesystem::is_directory(path_, ec)) {
        return FetcherPtr(std::make_shared<FileFetcher>("", path_));
    }
    if (!std::filesystem::exists(path_, ec)) {
        return Error::file_not_found(path_.string());
    }

    if (media_type_ == MediaTypes::CBR()) {
        return Error::not_supported("RAR archives are not supported", path_.string());
    }
    if (is_zip_file(path_)) {
        TRY_ASSIGN(archive, ArchiveFetcher::open(path_));
        return FetcherPtr(std::move(archive));
    }

    // A standalone file is served under its own name.
    return FetcherPtr(std::make_shared<FileFetcher>(name(), path_));
}

} // namespace folio
