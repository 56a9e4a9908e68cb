/**
 * Folio - ZIP Reader Implementation
 *
 * Reads the central directory of a ZIP archive:
 * - End of central directory record (EOCD) at the end of the file
 * - Central directory file headers (names, sizes, offsets)
 * - Local file headers, only to find where entry data starts
 *
 * ZIP64 archives and encrypted entries are rejected.
 */

#include "folio/zip_reader.hpp"
#include "folio/compression.hpp"
#include "folio/logging.hpp"

#include <algorithm>

namespace folio {

// ZIP record signatures (little-endian on disk)
constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t EOCD_SIGNATURE = 0x06054b50;

constexpr size_t EOCD_MIN_SIZE = 22;
constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t MAX_COMMENT_SIZE = 0xFFFF;
// Largest expansion a deflate stream can produce (zlib technical details)
constexpr uint64_t MAX_DEFLATE_RATIO = 1032;

ZipReader::ZipReader() = default;
ZipReader::~ZipReader() = default;

uint16_t ZipReader::read_uint16_le(std::istream& stream) {
    uint8_t bytes[2] = {0, 0};
    stream.read(reinterpret_cast<char*>(bytes), 2);
    return static_cast<uint16_t>(bytes[0] | (bytes[1] << 8));
}

uint32_t ZipReader::read_uint32_le(std::istream& stream) {
    uint8_t bytes[4] = {0, 0, 0, 0};
    stream.read(reinterpret_cast<char*>(bytes), 4);
    return static_cast<uint32_t>(bytes[0]) |
           (static_cast<uint32_t>(bytes[1]) << 8) |
           (static_cast<uint32_t>(bytes[2]) << 16) |
           (static_cast<uint32_t>(bytes[3]) << 24);
}

Result<void> ZipReader::open(const std::filesystem::path& path) {
    LOG_DEBUG("ZipReader", "Opening: " << path.string());

    // Close any previously open file
    close();

    file_.open(path, std::ios::binary);
    if (!file_) {
        LOG_ERROR("ZipReader", "Failed to open file: " << path.string());
        return Error::file_not_found(path.string());
    }

    zip_path_ = path;

    auto parsed = parse_central_directory();
    if (!parsed) {
        LOG_ERROR("ZipReader", "Failed to read central directory of " << path.filename().string()
                  << ": " << parsed.error().message);
        close();
        return Error(parsed.error().code, parsed.error().message, path.string());
    }

    LOG_INFO("ZipReader", "Opened: " << path.filename().string() << " (" << file_count() << " files)");
    return {};
}

Result<uint64_t> ZipReader::find_end_of_central_directory(uint64_t file_size) {
    if (file_size < EOCD_MIN_SIZE) {
        return Error::invalid_format("File too small to be a ZIP archive");
    }

    // The EOCD is followed by a comment of up to 64 KiB; scan backwards for it.
    uint64_t tail_size = std::min<uint64_t>(file_size, EOCD_MIN_SIZE + MAX_COMMENT_SIZE);
    std::vector<uint8_t> tail(static_cast<size_t>(tail_size));
    file_.seekg(static_cast<std::streamoff>(file_size - tail_size));
    file_.read(reinterpret_cast<char*>(tail.data()), static_cast<std::streamsize>(tail_size));
    if (static_cast<uint64_t>(file_.gcount()) != tail_size) {
        return Error::io_error("Failed to read archive tail");
    }

    for (size_t i = tail.size() - EOCD_MIN_SIZE + 1; i-- > 0;) {
        uint32_t signature = static_cast<uint32_t>(tail[i]) |
                             (static_cast<uint32_t>(tail[i + 1]) << 8) |
                             (static_cast<uint32_t>(tail[i + 2]) << 16) |
                             (static_cast<uint32_t>(tail[i + 3]) << 24);
        if (signature == EOCD_SIGNATURE) {
            return file_size - tail_size + i;
        }
    }
    return Error::invalid_format("End of central directory not found");
}

Result<void> ZipReader::parse_central_directory() {
    file_.seekg(0, std::ios::end);
    auto file_size = static_cast<uint64_t>(file_.tellg());

    TRY_ASSIGN(eocd_offset, find_end_of_central_directory(file_size));

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(eocd_offset + 4));
    uint16_t disk_number = read_uint16_le(file_);
    uint16_t cd_disk = read_uint16_le(file_);
    read_uint16_le(file_); // entries on this disk
    uint16_t total_entries = read_uint16_le(file_);
    uint32_t cd_size = read_uint32_le(file_);
    uint32_t cd_offset = read_uint32_le(file_);

    if (disk_number != 0 || cd_disk != 0) {
        return Error::not_supported("Multi-disk ZIP archives are not supported");
    }
    if (total_entries == 0xFFFF || cd_offset == 0xFFFFFFFF || cd_size == 0xFFFFFFFF) {
        return Error::not_supported("ZIP64 archives are not supported");
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > eocd_offset) {
        return Error::invalid_format("Central directory out of bounds");
    }

    file_.seekg(cd_offset);
    data_end_ = cd_offset;
    entries_.reserve(total_entries);

    for (uint16_t i = 0; i < total_entries; ++i) {
        uint32_t signature = read_uint32_le(file_);
        if (!file_ || signature != CENTRAL_HEADER_SIGNATURE) {
            return Error::invalid_format("Bad central directory header #" + std::to_string(i));
        }

        file_.seekg(4, std::ios::cur); // version made by, version needed
        ZipEntry entry;
        entry.flags = read_uint16_le(file_);
        entry.method = read_uint16_le(file_);
        file_.seekg(4, std::ios::cur); // mod time, mod date
        entry.crc32 = read_uint32_le(file_);
        entry.size = read_uint32_le(file_);
        entry.original_size = read_uint32_le(file_);
        uint16_t name_len = read_uint16_le(file_);
        uint16_t extra_len = read_uint16_le(file_);
        uint16_t comment_len = read_uint16_le(file_);
        file_.seekg(8, std::ios::cur); // disk start, internal attrs, external attrs
        entry.local_header_offset = read_uint32_le(file_);

        std::string name(name_len, '\0');
        file_.read(name.data(), name_len);
        if (file_.gcount() != name_len) {
            return Error::invalid_format("Truncated central directory");
        }
        file_.seekg(extra_len + comment_len, std::ios::cur);

        // Directory entries carry no data
        if (name.empty() || name.back() == '/') continue;

        if (static_cast<uint64_t>(entry.local_header_offset) + LOCAL_HEADER_SIZE + entry.size > data_end_) {
            return Error::invalid_format("Entry data out of bounds", name);
        }

        std::replace(name.begin(), name.end(), '\\', '/');
        entry.path = std::move(name);
        entries_.push_back(std::move(entry));
    }

    return {};
}

void ZipReader::close() {
    file_.close();
    file_.clear();
    entries_.clear();
    zip_path_.clear();
    data_end_ = 0;
}

const ZipEntry* ZipReader::find_entry(const std::string& path) const {
    for (const auto& entry : entries_) {
        if (entry.path == path) {
            return &entry;
        }
    }
    return nullptr;
}

Result<std::vector<uint8_t>> ZipReader::read_file(const std::string& path) {
    const ZipEntry* entry = find_entry(path);
    if (!entry) {
        LOG_DEBUG("ZipReader", "File not found in ZIP: " << path);
        return Error::not_found(path);
    }
    return read_file(*entry);
}

Result<std::vector<uint8_t>> ZipReader::read_file(const ZipEntry& entry) {
    if (!file_.is_open()) {
        LOG_ERROR("ZipReader", "Cannot read file - ZIP not open");
        return Error::io_error("Archive is not open", entry.path);
    }
    if (entry.is_encrypted()) {
        return Error::not_supported("Encrypted ZIP entries are not supported", entry.path);
    }

    // The local header repeats name and extra field with possibly different lengths.
    file_.clear();
    file_.seekg(entry.local_header_offset);
    uint32_t signature = read_uint32_le(file_);
    if (!file_ || signature != LOCAL_HEADER_SIGNATURE) {
        LOG_ERROR("ZipReader", "Bad local header at offset " << entry.local_header_offset
                  << " for file: " << entry.path);
        return Error::invalid_format("Bad local file header", entry.path);
    }
    file_.seekg(entry.local_header_offset + LOCAL_HEADER_SIZE - 4, std::ios::beg);
    uint16_t name_len = read_uint16_le(file_);
    uint16_t extra_len = read_uint16_le(file_);
    uint64_t data_offset = static_cast<uint64_t>(entry.local_header_offset) + LOCAL_HEADER_SIZE +
                           name_len + extra_len;
    if (data_offset + entry.size > data_end_) {
        return Error::invalid_format("Entry data out of bounds", entry.path);
    }
    if (entry.method == static_cast<uint16_t>(ZipCompression::Deflate) &&
        entry.original_size > static_cast<uint64_t>(entry.size) * MAX_DEFLATE_RATIO) {
        LOG_WARNING("ZipReader", "Declared size " << entry.original_size << " cannot come from "
                    << entry.size << " deflated bytes: " << entry.path);
        return Error::invalid_format("Declared uncompressed size exceeds deflate limits", entry.path);
    }
    file_.seekg(static_cast<std::streamoff>(data_offset), std::ios::beg);

    // Read data
    std::vector<uint8_t> data(entry.size);
    file_.read(reinterpret_cast<char*>(data.data()), entry.size);
    if (file_.gcount() != static_cast<std::streamsize>(entry.size)) {
        LOG_ERROR("ZipReader", "Failed to read " << entry.size << " bytes for: "
                  << entry.path << " (got " << file_.gcount() << ")");
        return Error::io_error("Short read", entry.path);
    }

    switch (static_cast<ZipCompression>(entry.method)) {
        case ZipCompression::Stored:
            return data;
        case ZipCompression::Deflate:
            try {
                LOG_DEBUG("ZipReader", "Inflating: " << entry.path
                          << " (" << entry.size << " -> " << entry.original_size << ")");
                return inflate_raw(data, entry.original_size);
            } catch (const std::exception& e) {
                LOG_ERROR("ZipReader", "Decompression failed for: " << entry.path << " - " << e.what());
                return Error::compression_error(e.what(), entry.path);
            }
    }

    LOG_WARNING("ZipReader", "Unknown compression method " << entry.method << " for: " << entry.path);
    return Error::not_supported("Unsupported compression method " + std::to_string(entry.method),
                                entry.path);
}

} // namespace folio
