/**
 * Folio - EPUB encryption descriptor
 */

#pragma once

#include "fetcher.hpp"
#include "link.hpp"
#include "xml.hpp"

#include <map>
#include <string>

namespace folio::epub {

/**
 * Resource href -> how it is encrypted.
 */
using EncryptionMap = std::map<std::string, Encryption>;

/**
 * Records of META-INF/encryption.xml read with encryption_bindings().
 * EncryptedData entries without a cipher reference or an algorithm are
 * skipped.
 */
EncryptionMap parse_encryption(const XmlDocument& document);

/**
 * Records of the container's META-INF/encryption.xml, or an empty map when
 * the document is missing or unreadable.
 */
EncryptionMap parse_encryption_data(Fetcher& fetcher);

} // namespace folio::epub
