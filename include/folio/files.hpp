/**
 * Folio - File utilities
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace folio {

/**
 * Write data to file, creating parent directories.
 */
bool write_file(const std::filesystem::path& path, const uint8_t* data, size_t size);
bool write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data);

/**
 * Check whether data starts with a ZIP local file header.
 */
bool is_zip_signature(const uint8_t* data, size_t size);

/**
 * Format file size for display.
 */
std::string format_file_size(size_t bytes);

} // namespace folio
