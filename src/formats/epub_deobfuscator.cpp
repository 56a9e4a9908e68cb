/**
 * Folio - EPUB font deobfuscation implementation (OpenSSL SHA-1)
 */

#include "folio/epub_deobfuscator.hpp"
#include "folio/epub_constants.hpp"
#include "folio/logging.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace folio::epub {

namespace {

constexpr size_t IDPF_OBFUSCATED_LENGTH = 1040;
constexpr size_t ADOBE_OBFUSCATED_LENGTH = 1024;
constexpr size_t ADOBE_KEY_LENGTH = 16;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void xor_prefix(std::vector<uint8_t>& data, const std::vector<uint8_t>& key, size_t length) {
    size_t count = std::min(length, data.size());
    for (size_t i = 0; i < count; ++i) {
        data[i] ^= key[i % key.size()];
    }
}

class DeobfuscatingResource : public Resource {
public:
    DeobfuscatingResource(ResourcePtr resource, const Deobfuscator& deobfuscator, std::string algorithm)
        : resource_(std::move(resource)), deobfuscator_(deobfuscator), algorithm_(std::move(algorithm)) {}

    const Link& link() const override { return resource_->link(); }

    Result<std::vector<uint8_t>> read() override {
        TRY_ASSIGN(data, resource_->read());
        TRY(deobfuscator_.deobfuscate(data, algorithm_));
        return data;
    }

    Result<uint64_t> length() override { return resource_->length(); }

private:
    ResourcePtr resource_;
    Deobfuscator deobfuscator_;
    std::string algorithm_;
};

} // namespace

Deobfuscator::Deobfuscator(std::string identifier) : identifier_(std::move(identifier)) {}

bool Deobfuscator::is_supported(const std::string& algorithm) {
    return algorithm == ALGORITHM_IDPF_OBFUSCATION || algorithm == ALGORITHM_ADOBE_OBFUSCATION;
}

ResourcePtr Deobfuscator::transform(ResourcePtr resource) const {
    const auto& encryption = resource->link().properties.encryption;
    if (!encryption || !is_supported(encryption->algorithm)) {
        return resource;
    }
    std::string algorithm = encryption->algorithm;
    return std::make_unique<DeobfuscatingResource>(std::move(resource), *this, std::move(algorithm));
}

Result<std::vector<uint8_t>> Deobfuscator::idpf_key() const {
    std::string compact;
    for (char c : identifier_) {
        if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
    }

    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    if (EVP_Digest(compact.data(), compact.size(), digest.data(), &digest_len, EVP_sha1(), nullptr) != 1) {
        return Error(Error::Code::Unknown, "SHA-1 digest failed");
    }
    digest.resize(digest_len);
    return digest;
}

Result<std::vector<uint8_t>> Deobfuscator::adobe_key() const {
    std::string hex = identifier_;
    const std::string prefix = "urn:uuid:";
    if (hex.compare(0, prefix.size(), prefix) == 0) {
        hex.erase(0, prefix.size());
    }
    hex.erase(std::remove(hex.begin(), hex.end(), '-'), hex.end());

    if (hex.size() < ADOBE_KEY_LENGTH * 2) {
        return Error::invalid_format("Identifier is not a UUID", identifier_);
    }
    std::vector<uint8_t> key(ADOBE_KEY_LENGTH);
    for (size_t i = 0; i < ADOBE_KEY_LENGTH; ++i) {
        int high = hex_value(hex[2 * i]);
        int low = hex_value(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            return Error::invalid_format("Identifier is not a UUID", identifier_);
        }
        key[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return key;
}

Result<void> Deobfuscator::deobfuscate(std::vector<uint8_t>& data, const std::string& algorithm) const {
    if (algorithm == ALGORITHM_IDPF_OBFUSCATION) {
        TRY_ASSIGN(key, idpf_key());
        xor_prefix(data, key, IDPF_OBFUSCATED_LENGTH);
    } else if (algorithm == ALGORITHM_ADOBE_OBFUSCATION) {
        TRY_ASSIGN(key, adobe_key());
        xor_prefix(data, key, ADOBE_OBFUSCATED_LENGTH);
    }
    return {};
}

FetcherPtr wrap_with_deobfuscation(FetcherPtr fetcher, const std::string& identifier) {
    if (identifier.empty()) {
        return fetcher;
    }
    LOG_DEBUG("Deobfuscator", "Installing deobfuscation for " << identifier);
    Deobfuscator deobfuscator(identifier);
    return std::make_shared<TransformingFetcher>(
        std::move(fetcher),
        [deobfuscator](ResourcePtr resource) { return deobfuscator.transform(std::move(resource)); });
}

} // namespace folio::epub
