/**
 * Folio - Compression Implementation
 */

#include "folio/compression.hpp"
#include <zlib.h>
#include <stdexcept>
#include <string>

namespace folio {

// Helper to convert zlib error code to string
static const char* zlib_error_string(int err) {
    switch (err) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
        default:              return "UNKNOWN_ERROR";
    }
}

std::vector<uint8_t> inflate_raw(const uint8_t* data, size_t size, size_t expected_size) {
    std::vector<uint8_t> result(expected_size);

    z_stream strm = {};
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(expected_size);

    int ret = inflateInit2(&strm, -MAX_WBITS);
    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Failed to initialize zlib decompression: ") + zlib_error_string(ret));
    }

    ret = inflate(&strm, Z_FINISH);
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error(std::string("Inflate failed: ") + zlib_error_string(ret) +
                                 " (input=" + std::to_string(size) + ", expected=" + std::to_string(expected_size) + ")");
    }

    result.resize(strm.total_out);
    return result;
}

std::vector<uint8_t> inflate_raw(const std::vector<uint8_t>& data, size_t expected_size) {
    return inflate_raw(data.data(), data.size(), expected_size);
}

std::vector<uint8_t> deflate_raw(const uint8_t* data, size_t size, int level) {
    z_stream strm = {};
    int ret = deflateInit2(&strm, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Failed to initialize zlib compression: ") + zlib_error_string(ret));
    }

    std::vector<uint8_t> result(deflateBound(&strm, static_cast<uLong>(size)));
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(result.size());

    ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error(std::string("Deflate failed: ") + zlib_error_string(ret));
    }

    result.resize(strm.total_out);
    return result;
}

std::vector<uint8_t> deflate_raw(const std::vector<uint8_t>& data, int level) {
    return deflate_raw(data.data(), data.size(), level);
}

uint32_t crc32_of(const uint8_t* data, size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    return static_cast<uint32_t>(crc32(crc, data, static_cast<uInt>(size)));
}

} // namespace folio
