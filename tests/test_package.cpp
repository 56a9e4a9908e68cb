#include "folio/epub_constants.hpp"
#include "folio/epub_package.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace folio::epub {
namespace {

using test::InMemoryFetcher;

PackageDocument parse_package(const std::string& xml, const std::string& path) {
    auto document = XmlDocument::parse(xml, package_bindings());
    EXPECT_TRUE(document.ok()) << document.error().full_message();
    auto package = parse_package_document(*document, path);
    EXPECT_TRUE(package.ok()) << package.error().full_message();
    return package.value();
}

TEST(ContainerTest, RootFilePath) {
    InMemoryFetcher fetcher;
    fetcher.add(PATH_CONTAINER, test::container_xml("OEBPS/content.opf"));
    auto path = get_root_file_path(fetcher);
    ASSERT_TRUE(path.ok()) << path.error().full_message();
    EXPECT_EQ(*path, "OEBPS/content.opf");
}

TEST(ContainerTest, RootFileWithoutNamespace) {
    InMemoryFetcher fetcher;
    fetcher.add(PATH_CONTAINER,
                "<container><rootfiles><rootfile full-path=\"/book%20one.opf\"/></rootfiles></container>");
    auto path = get_root_file_path(fetcher);
    ASSERT_TRUE(path.ok()) << path.error().full_message();
    EXPECT_EQ(*path, "book one.opf");
}

TEST(ContainerTest, MissingContainerKeepsErrorCode) {
    InMemoryFetcher fetcher;
    auto path = get_root_file_path(fetcher);
    ASSERT_FALSE(path.ok());
    EXPECT_EQ(path.error().code, Error::Code::NotFound);
    EXPECT_EQ(path.error().context, PATH_CONTAINER);
}

TEST(ContainerTest, MissingRootFileIsInvalid) {
    InMemoryFetcher fetcher;
    fetcher.add(PATH_CONTAINER, test::container_xml(""));
    auto path = get_root_file_path(fetcher);
    ASSERT_FALSE(path.ok());
    EXPECT_EQ(path.error().code, Error::Code::InvalidFormat);
}

TEST(PackageDocumentTest, Epub2Package) {
    PackageDocument package = parse_package(test::epub2_package(), "OEBPS/content.opf");

    EXPECT_DOUBLE_EQ(package.version, 2.0);
    EXPECT_EQ(package.unique_identifier_id, "bookid");
    EXPECT_EQ(package.spine.toc, "ncx");
    ASSERT_EQ(package.manifest.size(), 6u);
    EXPECT_EQ(package.manifest[1].href, "OEBPS/text/chapter1.xhtml");

    ASSERT_EQ(package.spine.itemrefs.size(), 3u);
    EXPECT_TRUE(package.spine.itemrefs[0].linear);
    EXPECT_FALSE(package.spine.itemrefs[2].linear);

    auto creators = package.metadata.dc_elements("creator");
    ASSERT_EQ(creators.size(), 1u);
    EXPECT_EQ(creators[0]->role, "aut");
    EXPECT_EQ(creators[0]->file_as, "Melville, Herman");
    EXPECT_EQ(package.metadata.meta_value("cover"), "cover-img");
    EXPECT_EQ(package.metadata.dc_elements("identifier").size(), 2u);
}

TEST(PackageDocumentTest, Epub3Package) {
    PackageDocument package = parse_package(test::epub3_package(), "OEBPS/content.opf");

    EXPECT_DOUBLE_EQ(package.version, 3.0);
    EXPECT_EQ(package.spine.page_progression_direction, "rtl");

    const Item* chapter = package.item_with_id("c1");
    ASSERT_NE(chapter, nullptr);
    EXPECT_TRUE(chapter->has_property("scripted"));
    EXPECT_TRUE(chapter->has_property("mathml"));
    EXPECT_EQ(chapter->media_overlay, "c1-smil");

    const Item* second = package.item_with_id("c2");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->href, "OEBPS/chapter 2.xhtml");

    EXPECT_TRUE(package.spine.itemrefs[1].has_property("rendition:layout-pre-paginated"));

    EXPECT_EQ(package.metadata.refinement("t1", "title-type"), "main");
    EXPECT_EQ(package.metadata.refinement("c1", "file-as"), "Doe, Jane");
    EXPECT_EQ(package.metadata.refinements("c2").size(), 1u);
    EXPECT_EQ(package.metadata.meta_value("dcterms:modified"), "2024-01-01T00:00:00Z");
    EXPECT_EQ(package.item_with_id("missing"), nullptr);
}

TEST(PackageDocumentTest, VersionDefaultsToOneTwo) {
    PackageDocument package = parse_package(R"(<package xmlns="http://www.idpf.org/2007/opf">
  <metadata/><manifest/><spine/>
</package>)", "content.opf");
    EXPECT_DOUBLE_EQ(package.version, 1.2);
    EXPECT_TRUE(package.manifest.empty());
}

TEST(PackageDocumentTest, MissingSectionsAreInvalid) {
    auto document = XmlDocument::parse(R"(<package xmlns="http://www.idpf.org/2007/opf" version="3.0">
  <metadata/><spine/>
</package>)", package_bindings());
    ASSERT_TRUE(document.ok());
    auto package = parse_package_document(*document, "content.opf");
    ASSERT_FALSE(package.ok());
    EXPECT_EQ(package.error().code, Error::Code::InvalidFormat);

    auto wrong_root = XmlDocument::parse("<html/>", package_bindings());
    ASSERT_TRUE(wrong_root.ok());
    EXPECT_FALSE(parse_package_document(*wrong_root, "content.opf").ok());
}

TEST(PackageDocumentTest, SplitTokens) {
    auto tokens = split_tokens("  nav \t scripted\nsvg ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "nav");
    EXPECT_EQ(tokens[2], "svg");
    EXPECT_TRUE(split_tokens("").empty());
}

} // namespace
} // namespace folio::epub
