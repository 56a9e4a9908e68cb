/**
 * Folio - EPUB encryption descriptor parser
 */

#include "folio/epub_encryption.hpp"
#include "folio/epub_constants.hpp"
#include "folio/logging.hpp"
#include "folio/path_utils.hpp"

#include <cstdlib>

namespace folio::epub {

namespace {

std::optional<int64_t> parse_length(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || value < 0) return std::nullopt;
    return static_cast<int64_t>(value);
}

} // namespace

EncryptionMap parse_encryption(const XmlDocument& document) {
    EncryptionMap result;
    const XmlElement* root = document.root();
    if (!root) return result;

    std::vector<const XmlElement*> records = root->find_all("enc:EncryptedData");
    if (root->name() == "enc:EncryptedData") records.insert(records.begin(), root);

    for (const XmlElement* data : records) {
        const XmlElement* cipher_data = data->child("enc:CipherData");
        const XmlElement* reference = cipher_data ? cipher_data->child("enc:CipherReference") : nullptr;
        std::string uri = reference ? reference->attribute("URI") : std::string();
        if (uri.empty()) continue;

        const XmlElement* method = data->child("enc:EncryptionMethod");
        Encryption encryption;
        encryption.algorithm = method ? method->attribute("Algorithm") : std::string();
        if (encryption.algorithm.empty()) continue;

        if (const XmlElement* key_info = data->child("ds:KeyInfo")) {
            const XmlElement* retrieval = key_info->child("ds:RetrievalMethod");
            if (retrieval && retrieval->attribute("URI") == LCP_CONTENT_KEY_URI) {
                encryption.scheme = SCHEME_LCP;
            }
        }

        if (const XmlElement* properties = data->child("enc:EncryptionProperties")) {
            for (const XmlElement* property : properties->children("enc:EncryptionProperty")) {
                const XmlElement* compression = property->child("comp:Compression");
                if (!compression) continue;
                std::string method_code = compression->attribute("Method");
                if (method_code == "8") {
                    encryption.compression = "deflate";
                } else if (method_code == "0") {
                    encryption.compression = "none";
                }
                encryption.original_length = parse_length(compression->attribute("OriginalLength"));
            }
        }

        std::string href = normalize_path(percent_decode(uri));
        result[href] = std::move(encryption);
    }
    return result;
}

EncryptionMap parse_encryption_data(Fetcher& fetcher) {
    auto document = fetcher.get(PATH_ENCRYPTION)->read_as_xml(encryption_bindings());
    if (!document) {
        LOG_DEBUG("EpubEncryption", "No encryption data: " << document.error().full_message());
        return {};
    }
    EncryptionMap result = parse_encryption(*document);
    LOG_DEBUG("EpubEncryption", result.size() << " encrypted resources");
    return result;
}

} // namespace folio::epub
