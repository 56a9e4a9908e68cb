/**
 * Folio - EPUB font deobfuscation
 *
 * Fonts embedded in EPUBs are often obfuscated by XOR-ing their first bytes
 * with a key derived from the publication identifier. Two schemes exist:
 *
 *   IDPF  (http://www.idpf.org/2008/embedding)
 *         key = SHA-1(identifier without whitespace), first 1040 bytes
 *   Adobe (http://ns.adobe.com/pdf/enc#RC)
 *         key = hex(identifier without "urn:uuid:" and '-'), first 1024 bytes
 *
 * The transform is its own inverse.
 */

#pragma once

#include "fetcher.hpp"
#include "result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace folio::epub {

class Deobfuscator {
public:
    explicit Deobfuscator(std::string identifier);

    /**
     * Wraps resources whose link declares a known obfuscation algorithm;
     * returns any other resource unchanged.
     */
    ResourcePtr transform(ResourcePtr resource) const;

    /**
     * XOR the obfuscated prefix of data in place. Unknown algorithms leave
     * data untouched.
     */
    Result<void> deobfuscate(std::vector<uint8_t>& data, const std::string& algorithm) const;

    static bool is_supported(const std::string& algorithm);

    const std::string& identifier() const { return identifier_; }

private:
    Result<std::vector<uint8_t>> idpf_key() const;
    Result<std::vector<uint8_t>> adobe_key() const;

    std::string identifier_;
};

/**
 * Fetcher deobfuscating every resource read through it. An empty identifier
 * gives back the same fetcher object.
 */
FetcherPtr wrap_with_deobfuscation(FetcherPtr fetcher, const std::string& identifier);

} // namespace folio::epub
