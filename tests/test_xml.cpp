#include "folio/xml.hpp"

#include <gtest/gtest.h>

namespace folio {
namespace {

const NamespaceBindings kOpfBindings = {
    {"http://www.idpf.org/2007/opf", "opf"},
    {"http://purl.org/dc/elements/1.1/", "dc"},
};

TEST(XmlDocumentTest, DefaultNamespaceIsRenamedToBoundPrefix) {
    auto doc = XmlDocument::parse(std::string_view(
        R"(<package xmlns="http://www.idpf.org/2007/opf" version="3.0"><metadata/></package>)"),
        kOpfBindings);
    ASSERT_TRUE(doc.ok()) << doc.error().full_message();
    EXPECT_EQ(doc->root()->name(), "opf:package");
    EXPECT_EQ(doc->root()->local_name(), "package");
    EXPECT_EQ(doc->root()->namespace_uri(), "http://www.idpf.org/2007/opf");
    EXPECT_NE(doc->root()->child("opf:metadata"), nullptr);
    EXPECT_EQ(doc->root()->attribute("version"), "3.0");
}

TEST(XmlDocumentTest, DocumentPrefixDoesNotMatter) {
    auto doc = XmlDocument::parse(std::string_view(
        R"(<x:package xmlns:x="http://www.idpf.org/2007/opf"><x:metadata xmlns:d="http://purl.org/dc/elements/1.1/"><d:title>T</d:title></x:metadata></x:package>)"),
        kOpfBindings);
    ASSERT_TRUE(doc.ok());
    const XmlElement* title = doc->find("dc:title");
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->text(), "T");
}

TEST(XmlDocumentTest, UnboundNamespacesFallBackToLocalNames) {
    auto doc = XmlDocument::parse(std::string_view(
        R"(<root xmlns="urn:other" xmlns:a="urn:attrs"><item a:kind="k" plain="p"/></root>)"));
    ASSERT_TRUE(doc.ok());
    EXPECT_EQ(doc->root()->name(), "root");
    const XmlElement* item = doc->root()->child("item");
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->attribute("kind"), "k");
    EXPECT_EQ(item->attribute("plain"), "p");
}

TEST(XmlDocumentTest, BoundAttributesUsePrefix) {
    NamespaceBindings bindings = {{"http://www.idpf.org/2007/ops", "epub"}};
    auto doc = XmlDocument::parse(std::string_view(
        R"(<nav xmlns:e="http://www.idpf.org/2007/ops" e:type="toc" xml:lang="fr"/>)"), bindings);
    ASSERT_TRUE(doc.ok());
    EXPECT_EQ(doc->root()->attribute("epub:type"), "toc");
    EXPECT_TRUE(doc->root()->has_attribute("xml:lang"));
    EXPECT_FALSE(doc->root()->has_attribute("type"));
}

TEST(XmlDocumentTest, TextConcatenatesMixedContent) {
    auto doc = XmlDocument::parse(std::string_view("<a>one <b>two</b> three</a>"));
    ASSERT_TRUE(doc.ok());
    EXPECT_EQ(doc->root()->text(), "one two three");
}

TEST(XmlDocumentTest, HtmlEntitiesAreTolerated) {
    auto doc = XmlDocument::parse(std::string_view("<p>a&nbsp;b&mdash;c&amp;d</p>"));
    ASSERT_TRUE(doc.ok()) << doc.error().full_message();
    EXPECT_EQ(doc->root()->text(), "a\xC2\xA0" "b\xE2\x80\x94" "c&d");
}

TEST(XmlDocumentTest, FindAllReturnsDescendantsInDocumentOrder) {
    auto doc = XmlDocument::parse(std::string_view("<r><i n='1'><i n='2'/></i><i n='3'/></r>"));
    ASSERT_TRUE(doc.ok());
    auto items = doc->root()->find_all("i");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0]->attribute("n"), "1");
    EXPECT_EQ(items[1]->attribute("n"), "2");
    EXPECT_EQ(items[2]->attribute("n"), "3");
    EXPECT_EQ(doc->root()->children("i").size(), 2u);
    EXPECT_EQ(items[1]->parent(), items[0]);
}

TEST(XmlDocumentTest, MalformedDocumentIsParseError) {
    auto doc = XmlDocument::parse(std::string_view("<a><b></a>"));
    ASSERT_FALSE(doc.ok());
    EXPECT_EQ(doc.error().code, Error::Code::ParseError);
    EXPECT_FALSE(doc.error().context.empty());
}

TEST(XmlDocumentTest, EmptyInputIsParseError) {
    auto doc = XmlDocument::parse(std::string_view(""));
    EXPECT_FALSE(doc.ok());
}

TEST(XmlDocumentTest, ExcessiveNestingIsParseError) {
    std::string text;
    for (int i = 0; i < 200000; ++i) text += "<a>";
    for (int i = 0; i < 200000; ++i) text += "</a>";

    auto doc = XmlDocument::parse(text);
    ASSERT_FALSE(doc.ok());
    EXPECT_EQ(doc.error().code, Error::Code::ParseError);
}

TEST(XmlDocumentTest, NestingUpToTheLimitIsAccepted) {
    std::string text;
    for (int i = 0; i < 1024; ++i) text += "<a>";
    text += "x";
    for (int i = 0; i < 1024; ++i) text += "</a>";

    auto doc = XmlDocument::parse(text);
    ASSERT_TRUE(doc.ok()) << doc.error().full_message();
    EXPECT_EQ(doc->find("b"), nullptr);
    EXPECT_EQ(doc->root()->find_all("a").size(), 1023u);
    EXPECT_EQ(doc->root()->text(), "x");
}

TEST(NormalizeWhitespaceTest, CollapsesAndTrims) {
    EXPECT_EQ(normalize_whitespace("  Chapter\n\t  One  "), "Chapter One");
    EXPECT_EQ(normalize_whitespace(""), "");
    EXPECT_EQ(normalize_whitespace("   "), "");
}

} // namespace
} // namespace folio
