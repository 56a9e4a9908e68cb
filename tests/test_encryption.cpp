#include "folio/epub_constants.hpp"
#include "folio/epub_encryption.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace folio::epub {
namespace {

constexpr const char* ENCRYPTION_XML = R"(<?xml version="1.0" encoding="UTF-8"?>
<encryption xmlns="urn:oasis:names:tc:opendocument:xmlns:container"
            xmlns:enc="http://www.w3.org/2001/04/xmlenc#"
            xmlns:ds="http://www.w3.org/2000/09/xmldsig#">
  <enc:EncryptedData>
    <enc:EncryptionMethod Algorithm="http://www.idpf.org/2008/embedding"/>
    <enc:CipherData><enc:CipherReference URI="OEBPS/fonts/serif.otf"/></enc:CipherData>
  </enc:EncryptedData>
  <enc:EncryptedData>
    <enc:EncryptionMethod Algorithm="http://www.w3.org/2001/04/xmlenc#aes256-cbc"/>
    <ds:KeyInfo>
      <ds:RetrievalMethod URI="license.lcpl#/encryption/content_key"
                          Type="http://readium.org/2014/01/lcp#EncryptedContentKey"/>
    </ds:KeyInfo>
    <enc:CipherData><enc:CipherReference URI="/OEBPS/chapter%201.xhtml"/></enc:CipherData>
    <enc:EncryptionProperties>
      <enc:EncryptionProperty xmlns:ns="http://www.idpf.org/2016/encryption#compression">
        <ns:Compression Method="8" OriginalLength="13291"/>
      </enc:EncryptionProperty>
    </enc:EncryptionProperties>
  </enc:EncryptedData>
  <enc:EncryptedData>
    <enc:EncryptionMethod Algorithm="http://www.idpf.org/2008/embedding"/>
  </enc:EncryptedData>
  <enc:EncryptedData>
    <enc:CipherData><enc:CipherReference URI="OEBPS/no-algorithm.otf"/></enc:CipherData>
  </enc:EncryptedData>
</encryption>)";

TEST(EncryptionTest, ParsesObfuscatedFont) {
    auto document = XmlDocument::parse(ENCRYPTION_XML, encryption_bindings());
    ASSERT_TRUE(document.ok()) << document.error().full_message();

    EncryptionMap map = parse_encryption(*document);
    ASSERT_EQ(map.size(), 2u);

    const Encryption& font = map.at("OEBPS/fonts/serif.otf");
    EXPECT_EQ(font.algorithm, ALGORITHM_IDPF_OBFUSCATION);
    EXPECT_TRUE(font.scheme.empty());
    EXPECT_TRUE(font.compression.empty());
    EXPECT_FALSE(font.original_length.has_value());
}

TEST(EncryptionTest, ParsesLcpResourceWithCompression) {
    auto document = XmlDocument::parse(ENCRYPTION_XML, encryption_bindings());
    ASSERT_TRUE(document.ok());

    EncryptionMap map = parse_encryption(*document);
    ASSERT_EQ(map.count("OEBPS/chapter 1.xhtml"), 1u);

    const Encryption& chapter = map.at("OEBPS/chapter 1.xhtml");
    EXPECT_EQ(chapter.algorithm, "http://www.w3.org/2001/04/xmlenc#aes256-cbc");
    EXPECT_EQ(chapter.scheme, SCHEME_LCP);
    EXPECT_EQ(chapter.compression, "deflate");
    ASSERT_TRUE(chapter.original_length.has_value());
    EXPECT_EQ(*chapter.original_length, 13291);
}

TEST(EncryptionTest, StoredCompressionMethod) {
    auto document = XmlDocument::parse(R"(<encryption xmlns:enc="http://www.w3.org/2001/04/xmlenc#">
  <enc:EncryptedData>
    <enc:EncryptionMethod Algorithm="http://www.w3.org/2001/04/xmlenc#aes256-cbc"/>
    <enc:CipherData><enc:CipherReference URI="image.jpg"/></enc:CipherData>
    <enc:EncryptionProperties><enc:EncryptionProperty>
      <Compression xmlns="http://www.idpf.org/2016/encryption#compression" Method="0" OriginalLength="abc"/>
    </enc:EncryptionProperty></enc:EncryptionProperties>
  </enc:EncryptedData>
</encryption>)", encryption_bindings());
    ASSERT_TRUE(document.ok());

    EncryptionMap map = parse_encryption(*document);
    const Encryption& image = map.at("image.jpg");
    EXPECT_EQ(image.compression, "none");
    EXPECT_FALSE(image.original_length.has_value());
}

TEST(EncryptionTest, MissingDocumentGivesEmptyMap) {
    test::InMemoryFetcher fetcher;
    EXPECT_TRUE(parse_encryption_data(fetcher).empty());

    fetcher.add(PATH_ENCRYPTION, "<encryption><broken></encryption>");
    EXPECT_TRUE(parse_encryption_data(fetcher).empty());
}

TEST(EncryptionTest, ReadsFromContainer) {
    test::InMemoryFetcher fetcher;
    fetcher.add(PATH_ENCRYPTION, ENCRYPTION_XML);
    EXPECT_EQ(parse_encryption_data(fetcher).size(), 2u);
}

} // namespace
} // namespace folio::epub
