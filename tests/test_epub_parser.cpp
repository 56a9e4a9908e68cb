#include "folio/epub_constants.hpp"
#include "folio/epub_parser.hpp"
#include "folio/epub_positions.hpp"
#include "folio/services.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace folio {
namespace {

using test::InMemoryFetcher;
using test::TestAsset;

std::shared_ptr<InMemoryFetcher> epub3_fetcher() {
    auto fetcher = std::make_shared<InMemoryFetcher>();
    fetcher->add("mimetype", "application/epub+zip")
        .add(epub::PATH_CONTAINER, test::container_xml("OEBPS/content.opf"))
        .add("OEBPS/content.opf", test::epub3_package())
        .add("OEBPS/nav.xhtml", test::epub3_nav())
        .add("OEBPS/toc.ncx", test::epub2_ncx())
        .add("OEBPS/chapter1.xhtml", "<html/>")
        .add("OEBPS/chapter 2.xhtml", "<html/>");
    return fetcher;
}

std::shared_ptr<InMemoryFetcher> epub2_fetcher() {
    auto fetcher = std::make_shared<InMemoryFetcher>();
    fetcher->add(epub::PATH_CONTAINER, test::container_xml("OEBPS/content.opf"))
        .add("OEBPS/content.opf", test::epub2_package())
        .add("OEBPS/toc.ncx", test::epub2_ncx());
    return fetcher;
}

std::unique_ptr<PublicationBuilder> parse(const FetcherPtr& fetcher, const std::string& name = "book.epub") {
    TestAsset asset(name, MediaTypes::EPUB(), fetcher);
    EpubParser parser;
    auto builder = parser.parse(asset, fetcher);
    EXPECT_TRUE(builder.ok()) << builder.error().full_message();
    return builder.ok() ? std::move(builder.value()) : nullptr;
}

TEST(EpubParserTest, IgnoresOtherMediaTypesWithoutReading) {
    auto fetcher = epub3_fetcher();
    TestAsset asset("comic.cbz", MediaTypes::CBZ(), fetcher);

    EpubParser parser;
    auto builder = parser.parse(asset, fetcher);
    ASSERT_TRUE(builder.ok());
    EXPECT_EQ(builder->get(), nullptr);
    EXPECT_EQ(fetcher->get_calls, 0);
    EXPECT_EQ(fetcher->links_calls, 0);
}

TEST(EpubParserTest, Epub3Metadata) {
    auto builder = parse(epub3_fetcher());
    ASSERT_NE(builder, nullptr);
    const Metadata& metadata = builder->manifest.metadata;

    EXPECT_EQ(metadata.identifier, "urn:uuid:0f8fad5b-d9cb-469f-a165-70867728950e");
    EXPECT_EQ(metadata.title.string(), "Collected Stories");
    EXPECT_EQ(metadata.subtitle.string(), "Volume One");
    ASSERT_EQ(metadata.authors.size(), 1u);
    EXPECT_EQ(metadata.authors[0].name.string(), "Jane Doe");
    EXPECT_EQ(metadata.authors[0].sort_as, "Doe, Jane");
    ASSERT_EQ(metadata.contributors.size(), 1u);
    EXPECT_EQ(metadata.contributors[0].name.string(), "John Roe");
    ASSERT_EQ(metadata.contributors[0].roles.size(), 1u);
    EXPECT_EQ(metadata.contributors[0].roles[0], "ill");
    ASSERT_EQ(metadata.publishers.size(), 1u);
    EXPECT_EQ(metadata.publishers[0].name.string(), "Folio Press");
    EXPECT_EQ(metadata.languages, std::vector<std::string>{"en"});
    EXPECT_EQ(metadata.modified, "2024-01-01T00:00:00Z");
    EXPECT_EQ(metadata.reading_progression, "rtl");
    EXPECT_EQ(metadata.presentation.layout, "reflowable");
    ASSERT_EQ(metadata.conforms_to.size(), 1u);
    EXPECT_EQ(metadata.conforms_to[0], kProfileEpub);
}

TEST(EpubParserTest, Epub3ReadingOrderAndResources) {
    auto builder = parse(epub3_fetcher());
    ASSERT_NE(builder, nullptr);
    const Manifest& manifest = builder->manifest;

    ASSERT_EQ(manifest.reading_order.size(), 2u);
    const Link& first = manifest.reading_order[0];
    EXPECT_EQ(first.href, "OEBPS/chapter1.xhtml");
    EXPECT_EQ(first.properties.page, "right");
    EXPECT_EQ(first.properties.media_overlay, "OEBPS/smil/chapter1.smil");
    EXPECT_EQ(first.properties.contains, (std::vector<std::string>{"js", "mathml"}));

    const Link& second = manifest.reading_order[1];
    EXPECT_EQ(second.href, "OEBPS/chapter 2.xhtml");
    EXPECT_EQ(second.properties.page, "left");
    EXPECT_EQ(second.properties.layout, "fixed");

    ASSERT_EQ(manifest.resources.size(), 4u);
    const Link* cover = find_link_with_rel(manifest.resources, "cover");
    ASSERT_NE(cover, nullptr);
    EXPECT_EQ(cover->href, "OEBPS/images/cover.png");
    const Link* nav = find_link_with_rel(manifest.resources, "contents");
    ASSERT_NE(nav, nullptr);
    EXPECT_EQ(nav->href, "OEBPS/nav.xhtml");

    ASSERT_EQ(manifest.toc().size(), 2u);
    EXPECT_EQ(manifest.toc()[0].title, "Chapter One");
}

TEST(EpubParserTest, Epub2CoverAndNonLinearItems) {
    auto builder = parse(epub2_fetcher());
    ASSERT_NE(builder, nullptr);
    const Manifest& manifest = builder->manifest;

    EXPECT_EQ(manifest.metadata.identifier, "urn:uuid:12345678-1234-1234-1234-123456789abc");
    EXPECT_EQ(manifest.metadata.title.string(), "Moby Dick");
    ASSERT_EQ(manifest.metadata.authors.size(), 1u);
    EXPECT_EQ(manifest.metadata.authors[0].sort_as, "Melville, Herman");
    EXPECT_EQ(manifest.metadata.reading_progression, "auto");

    ASSERT_EQ(manifest.reading_order.size(), 2u);
    EXPECT_NE(manifest.link_with_href("OEBPS/text/notes.xhtml"), nullptr);
    EXPECT_NE(find_link(manifest.resources, "OEBPS/text/notes.xhtml"), nullptr);

    const Link* cover = find_link_with_rel(manifest.resources, "cover");
    ASSERT_NE(cover, nullptr);
    EXPECT_EQ(cover->href, "OEBPS/images/cover.jpg");

    ASSERT_EQ(manifest.toc().size(), 2u);
    EXPECT_EQ(manifest.navigation.at(nav_role::kPageList).size(), 1u);
}

TEST(EpubParserTest, TitleFallsBackToAssetName) {
    auto fetcher = std::make_shared<InMemoryFetcher>();
    fetcher->add(epub::PATH_CONTAINER, test::container_xml("content.opf"))
        .add("content.opf", R"(<package xmlns="http://www.idpf.org/2007/opf" version="3.0">
  <metadata/><manifest><item id="a" href="a.xhtml" media-type="application/xhtml+xml"/></manifest>
  <spine><itemref idref="a"/></spine>
</package>)");

    auto builder = parse(fetcher, "untitled.epub");
    ASSERT_NE(builder, nullptr);
    EXPECT_EQ(builder->manifest.metadata.title.string(), "untitled.epub");
    EXPECT_TRUE(builder->manifest.metadata.identifier.empty());
    // No identifier, no deobfuscation layer
    EXPECT_EQ(builder->fetcher, fetcher);
}

TEST(EpubParserTest, EncryptedResourcesCarryEncryption) {
    auto fetcher = epub3_fetcher();
    fetcher->add(epub::PATH_ENCRYPTION, R"(<encryption xmlns:enc="http://www.w3.org/2001/04/xmlenc#">
  <enc:EncryptedData>
    <enc:EncryptionMethod Algorithm="http://www.idpf.org/2008/embedding"/>
    <enc:CipherData><enc:CipherReference URI="OEBPS/images/cover.png"/></enc:CipherData>
  </enc:EncryptedData>
</encryption>)");

    auto builder = parse(fetcher);
    ASSERT_NE(builder, nullptr);
    const Link* cover = builder->manifest.link_with_href("OEBPS/images/cover.png");
    ASSERT_NE(cover, nullptr);
    ASSERT_TRUE(cover->properties.encryption.has_value());
    EXPECT_EQ(cover->properties.encryption->algorithm, epub::ALGORITHM_IDPF_OBFUSCATION);
    EXPECT_NE(builder->fetcher, fetcher);
}

TEST(EpubParserTest, FixedLayoutFromDisplayOptions) {
    auto fetcher = epub3_fetcher();
    fetcher->add(epub::PATH_DISPLAY_OPTIONS_APPLE,
                 "<display_options><platform name=\"*\"><option name=\"fixed-layout\">true</option>"
                 "</platform></display_options>");

    auto builder = parse(fetcher);
    ASSERT_NE(builder, nullptr);
    EXPECT_EQ(builder->manifest.metadata.presentation.layout, "fixed");
}

TEST(EpubParserTest, MissingContainerFails) {
    auto fetcher = std::make_shared<InMemoryFetcher>();
    TestAsset asset("book.epub", MediaTypes::EPUB(), fetcher);

    EpubParser parser;
    auto builder = parser.parse(asset, fetcher);
    ASSERT_FALSE(builder.ok());
    EXPECT_EQ(builder.error().code, Error::Code::NotFound);
}

TEST(EpubParserTest, MalformedPackageIsInvalidDescriptor) {
    auto fetcher = std::make_shared<InMemoryFetcher>();
    fetcher->add(epub::PATH_CONTAINER, test::container_xml("content.opf"))
        .add("content.opf", "<package><metadata></package>");
    TestAsset asset("book.epub", MediaTypes::EPUB(), fetcher);

    EpubParser parser;
    auto builder = parser.parse(asset, fetcher);
    ASSERT_FALSE(builder.ok());
    EXPECT_EQ(builder.error().code, Error::Code::ParseError);
    EXPECT_EQ(builder.error().message.rfind("invalid package descriptor", 0), 0u);
}

TEST(EpubParserTest, MissingPackageIsInvalidDescriptor) {
    auto fetcher = std::make_shared<InMemoryFetcher>();
    fetcher->add(epub::PATH_CONTAINER, test::container_xml("OEBPS/content.opf"));
    TestAsset asset("book.epub", MediaTypes::EPUB(), fetcher);

    EpubParser parser;
    auto builder = parser.parse(asset, fetcher);
    ASSERT_FALSE(builder.ok());
    EXPECT_EQ(builder.error().code, Error::Code::NotFound);
    EXPECT_EQ(builder.error().message.rfind("invalid package descriptor", 0), 0u);
}

TEST(EpubParserTest, PackageWithoutSpineIsInvalidDescriptor) {
    auto fetcher = std::make_shared<InMemoryFetcher>();
    fetcher->add(epub::PATH_CONTAINER, test::container_xml("content.opf"))
        .add("content.opf", R"(<package xmlns="http://www.idpf.org/2007/opf"><metadata/><manifest/></package>)");
    TestAsset asset("book.epub", MediaTypes::EPUB(), fetcher);

    EpubParser parser;
    auto builder = parser.parse(asset, fetcher);
    ASSERT_FALSE(builder.ok());
    EXPECT_EQ(builder.error().code, Error::Code::InvalidFormat);
    EXPECT_NE(builder.error().message.find("invalid package descriptor"), std::string::npos);
}

TEST(EpubParserTest, RegistersServices) {
    auto builder = parse(epub3_fetcher());
    ASSERT_NE(builder, nullptr);
    EXPECT_TRUE(builder->services.has(kPositionsServiceName));
    EXPECT_TRUE(builder->services.has(kContentServiceName));
    EXPECT_TRUE(builder->services.has(kGuidedNavigationServiceName));

    auto publication = builder->build();
    ASSERT_NE(publication, nullptr);

    auto* content = publication->find_service<ContentService>();
    ASSERT_NE(content, nullptr);
    EXPECT_EQ(content->iterable_links().size(), 2u);

    auto* guided = publication->find_service<GuidedNavigationService>();
    ASSERT_NE(guided, nullptr);
    EXPECT_TRUE(guided->has_guided_navigation());
    ASSERT_EQ(guided->links_with_media_overlay().size(), 1u);
    EXPECT_EQ(guided->links_with_media_overlay()[0].href, "OEBPS/chapter1.xhtml");

    EXPECT_NE(publication->find_service<epub::EpubPositionsService>(), nullptr);
}

TEST(EpubParserTest, PublicationServesDeobfuscatedFonts) {
    auto fetcher = epub2_fetcher();
    std::vector<uint8_t> font(64, 0);
    fetcher->add("OEBPS/fonts/serif.otf", font);
    fetcher->add(epub::PATH_ENCRYPTION, R"(<encryption xmlns:enc="http://www.w3.org/2001/04/xmlenc#">
  <enc:EncryptedData>
    <enc:EncryptionMethod Algorithm="http://ns.adobe.com/pdf/enc#RC"/>
    <enc:CipherData><enc:CipherReference URI="OEBPS/fonts/serif.otf"/></enc:CipherData>
  </enc:EncryptedData>
</encryption>)");

    auto builder = parse(fetcher);
    ASSERT_NE(builder, nullptr);
    auto publication = builder->build();

    auto data = publication->get("OEBPS/fonts/serif.otf")->read();
    ASSERT_TRUE(data.ok()) << data.error().full_message();
    ASSERT_EQ(data->size(), 64u);
    EXPECT_EQ((*data)[0], 0x12);
    EXPECT_EQ((*data)[1], 0x34);
}

} // namespace
} // namespace folio
