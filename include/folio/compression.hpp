/**
 * Folio - Compression utilities
 *
 * zlib wrappers for the raw deflate streams stored in ZIP entries (method 8).
 * Failures throw std::runtime_error; callers convert them to folio::Error.
 */

#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace folio {

/**
 * Decompress a raw deflate stream (no zlib header), as stored in ZIP entries.
 */
std::vector<uint8_t> inflate_raw(const uint8_t* data, size_t size, size_t expected_size);
std::vector<uint8_t> inflate_raw(const std::vector<uint8_t>& data, size_t expected_size);

/**
 * Compress to a raw deflate stream.
 */
std::vector<uint8_t> deflate_raw(const uint8_t* data, size_t size, int level = 6);
std::vector<uint8_t> deflate_raw(const std::vector<uint8_t>& data, int level = 6);

/**
 * CRC-32 as used by ZIP headers.
 */
uint32_t crc32_of(const uint8_t* data, size_t size);

} // namespace folio
