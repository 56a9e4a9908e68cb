/**
 * Folio - ZIP Reader
 */

#pragma once

#include "result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace folio {

/**
 * Compression method of a ZIP entry.
 */
enum class ZipCompression : uint16_t {
    Stored = 0,
    Deflate = 8
};

/**
 * Entry from the ZIP central directory.
 */
struct ZipEntry {
    std::string path;
    uint32_t local_header_offset = 0;  // Absolute offset of the local file header
    uint32_t size = 0;                 // Compressed size
    uint32_t original_size = 0;        // Uncompressed size
    uint32_t crc32 = 0;
    uint16_t flags = 0;
    uint16_t method = 0;

    bool is_compressed() const { return method != static_cast<uint16_t>(ZipCompression::Stored); }
    bool is_encrypted() const { return (flags & 0x0001) != 0; }
};

/**
 * ZIP archive reader (central directory, stored and deflated entries).
 */
class ZipReader {
public:
    ZipReader();
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    Result<void> open(const std::filesystem::path& path);
    void close();

    const std::vector<ZipEntry>& entries() const { return entries_; }
    const ZipEntry* find_entry(const std::string& path) const;

    Result<std::vector<uint8_t>> read_file(const std::string& path);
    Result<std::vector<uint8_t>> read_file(const ZipEntry& entry);

    bool is_open() const { return file_.is_open(); }
    size_t file_count() const { return entries_.size(); }
    const std::filesystem::path& path() const { return zip_path_; }

private:
    Result<void> parse_central_directory();
    Result<uint64_t> find_end_of_central_directory(uint64_t file_size);

    // Little-endian readers
    static uint16_t read_uint16_le(std::istream& stream);
    static uint32_t read_uint32_le(std::istream& stream);

    std::filesystem::path zip_path_;
    std::ifstream file_;
    std::vector<ZipEntry> entries_;
    uint64_t data_end_ = 0;  // Entry data lies before the central directory
};

} // namespace folio
