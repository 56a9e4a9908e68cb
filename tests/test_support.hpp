/**
 * Folio - Test helpers
 *
 * In-memory fetcher and asset, a minimal ZIP writer and a temporary
 * directory guard.
 */

#pragma once

#include "folio/asset.hpp"
#include "folio/compression.hpp"
#include "folio/fetcher.hpp"
#include "folio/path_utils.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace folio::test {

inline std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

/**
 * Fetcher over a list of (href, bytes) kept in insertion order. Counts calls
 * so tests can check that nothing was read.
 */
class InMemoryFetcher : public Fetcher {
public:
    InMemoryFetcher& add(const std::string& href, const std::string& content) {
        entries_.emplace_back(href, bytes(content));
        return *this;
    }

    InMemoryFetcher& add(const std::string& href, std::vector<uint8_t> content) {
        entries_.emplace_back(href, std::move(content));
        return *this;
    }

    using Fetcher::get;

    Result<LinkList> links() override {
        ++links_calls;
        LinkList result;
        for (const auto& entry : entries_) {
            Link link;
            link.href = entry.first;
            link.type = MediaType::of_extension(get_extension_lower(entry.first));
            result.push_back(std::move(link));
        }
        return result;
    }

    ResourcePtr get(const Link& link) override {
        ++get_calls;
        requested.push_back(link);
        std::string href = normalize_path(strip_fragment(link.href));
        for (const auto& entry : entries_) {
            if (entry.first == href) {
                return std::make_unique<BytesResource>(link, entry.second);
            }
        }
        return std::make_unique<FailureResource>(link, Error::not_found(link.href));
    }

    int get_calls = 0;
    int links_calls = 0;
    std::vector<Link> requested;

private:
    std::vector<std::pair<std::string, std::vector<uint8_t>>> entries_;
};

/**
 * Asset with a fixed name and media type, served by a given fetcher.
 */
class TestAsset : public PublicationAsset {
public:
    TestAsset(std::string name, MediaType media_type, FetcherPtr fetcher = nullptr)
        : name_(std::move(name)), media_type_(std::move(media_type)), fetcher_(std::move(fetcher)) {}

    std::string name() const override { return name_; }
    const MediaType& media_type() const override { return media_type_; }
    Result<FetcherPtr> create_fetcher() const override {
        if (!fetcher_) return Error::io_error("No fetcher", name_);
        return fetcher_;
    }

private:
    std::string name_;
    MediaType media_type_;
    FetcherPtr fetcher_;
};

/**
 * Writes ZIP archives with stored or deflated entries.
 */
class ZipWriter {
public:
    ZipWriter& add(const std::string& name, const std::string& content, bool deflate = true) {
        entries_.push_back({name, bytes(content), deflate});
        return *this;
    }

    ZipWriter& add(const std::string& name, std::vector<uint8_t> content, bool deflate = true) {
        entries_.push_back({name, std::move(content), deflate});
        return *this;
    }

    ZipWriter& add_directory(const std::string& name) {
        entries_.push_back({name, {}, false});
        return *this;
    }

    std::vector<uint8_t> build() const {
        std::vector<uint8_t> out;
        std::vector<uint8_t> central;

        for (const auto& entry : entries_) {
            std::vector<uint8_t> stored = entry.deflate ? deflate_raw(entry.data) : entry.data;
            uint16_t method = entry.deflate ? 8 : 0;
            uint32_t crc = crc32_of(entry.data.data(), entry.data.size());
            auto offset = static_cast<uint32_t>(out.size());

            put32(out, 0x04034b50);
            put16(out, 20);
            put16(out, 0);
            put16(out, method);
            put16(out, 0);
            put16(out, 0x21);
            put32(out, crc);
            put32(out, static_cast<uint32_t>(stored.size()));
            put32(out, static_cast<uint32_t>(entry.data.size()));
            put16(out, static_cast<uint16_t>(entry.name.size()));
            put16(out, 0);
            out.insert(out.end(), entry.name.begin(), entry.name.end());
            out.insert(out.end(), stored.begin(), stored.end());

            put32(central, 0x02014b50);
            put16(central, 20);
            put16(central, 20);
            put16(central, 0);
            put16(central, method);
            put16(central, 0);
            put16(central, 0x21);
            put32(central, crc);
            put32(central, static_cast<uint32_t>(stored.size()));
            put32(central, static_cast<uint32_t>(entry.data.size()));
            put16(central, static_cast<uint16_t>(entry.name.size()));
            put16(central, 0);
            put16(central, 0);
            put16(central, 0);
            put16(central, 0);
            put32(central, 0);
            put32(central, offset);
            central.insert(central.end(), entry.name.begin(), entry.name.end());
        }

        auto cd_offset = static_cast<uint32_t>(out.size());
        out.insert(out.end(), central.begin(), central.end());

        put32(out, 0x06054b50);
        put16(out, 0);
        put16(out, 0);
        put16(out, static_cast<uint16_t>(entries_.size()));
        put16(out, static_cast<uint16_t>(entries_.size()));
        put32(out, static_cast<uint32_t>(central.size()));
        put32(out, cd_offset);
        put16(out, 0);
        return out;
    }

    void write(const std::filesystem::path& path) const {
        auto data = build();
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

private:
    struct Entry {
        std::string name;
        std::vector<uint8_t> data;
        bool deflate;
    };

    static void put16(std::vector<uint8_t>& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value & 0xFF));
        out.push_back(static_cast<uint8_t>(value >> 8));
    }

    static void put32(std::vector<uint8_t>& out, uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }
    }

    std::vector<Entry> entries_;
};

/**
 * Unique directory under the system temp directory, removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("folio_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        auto file_path = path_ / relative;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream file(file_path, std::ios::binary);
        file << content;
        return file_path;
    }

private:
    std::filesystem::path path_;
};

// ============================================================================
// EPUB fixtures
// ============================================================================

inline std::string container_xml(const std::string& opf_path) {
    return R"(<?xml version="1.0"?>
<container version="1.0" xmlns="urn:oasis:names:tc:opendocument:xmlns:container">
  <rootfiles>
    <rootfile full-path=")" + opf_path + R"(" media-type="application/oebps-package+xml"/>
  </rootfiles>
</container>)";
}

/**
 * EPUB 2 package with an NCX declared through spine@toc.
 */
inline std::string epub2_package() {
    return R"(<?xml version="1.0" encoding="UTF-8"?>
<package xmlns="http://www.idpf.org/2007/opf" version="2.0" unique-identifier="bookid">
  <metadata xmlns:dc="http://purl.org/dc/elements/1.1/" xmlns:opf="http://www.idpf.org/2007/opf">
    <dc:title>Moby Dick</dc:title>
    <dc:creator opf:role="aut" opf:file-as="Melville, Herman">Herman Melville</dc:creator>
    <dc:language>en</dc:language>
    <dc:identifier id="isbn">978-0000000000</dc:identifier>
    <dc:identifier id="bookid">urn:uuid:12345678-1234-1234-1234-123456789abc</dc:identifier>
    <meta name="cover" content="cover-img"/>
  </metadata>
  <manifest>
    <item id="ncx" href="toc.ncx" media-type="application/x-dtbncx+xml"/>
    <item id="ch1" href="text/chapter1.xhtml" media-type="application/xhtml+xml"/>
    <item id="ch2" href="text/chapter2.xhtml" media-type="application/xhtml+xml"/>
    <item id="notes" href="text/notes.xhtml" media-type="application/xhtml+xml"/>
    <item id="cover-img" href="images/cover.jpg" media-type="image/jpeg"/>
    <item id="font" href="fonts/serif.otf" media-type="application/vnd.ms-opentype"/>
  </manifest>
  <spine toc="ncx">
    <itemref idref="ch1"/>
    <itemref idref="ch2"/>
    <itemref idref="notes" linear="no"/>
  </spine>
</package>)";
}

inline std::string epub2_ncx() {
    return R"(<?xml version="1.0" encoding="UTF-8"?>
<ncx xmlns="http://www.daisy.org/z3986/2005/ncx/" version="2005-1">
  <navMap>
    <navPoint id="p1" playOrder="1">
      <navLabel><text>Chapter 1</text></navLabel>
      <content src="text/chapter1.xhtml"/>
      <navPoint id="p1-1" playOrder="2">
        <navLabel><text>Section 1.1</text></navLabel>
        <content src="text/chapter1.xhtml#s1"/>
      </navPoint>
    </navPoint>
    <navPoint id="p2" playOrder="3">
      <navLabel><text>Chapter 2</text></navLabel>
      <content src="text/chapter2.xhtml"/>
    </navPoint>
  </navMap>
  <pageList>
    <pageTarget id="pg1" type="normal" value="1">
      <navLabel><text>1</text></navLabel>
      <content src="text/chapter1.xhtml#page1"/>
    </pageTarget>
  </pageList>
</ncx>)";
}

/**
 * EPUB 3 package with a navigation document and a leftover NCX item.
 */
inline std::string epub3_package() {
    return R"(<?xml version="1.0" encoding="UTF-8"?>
<package xmlns="http://www.idpf.org/2007/opf" version="3.0" unique-identifier="uid"
         prefix="rendition: http://www.idpf.org/vocab/rendition/#">
  <metadata xmlns:dc="http://purl.org/dc/elements/1.1/">
    <dc:identifier id="uid">urn:uuid:0f8fad5b-d9cb-469f-a165-70867728950e</dc:identifier>
    <dc:title id="t1">Collected Stories</dc:title>
    <meta refines="#t1" property="title-type">main</meta>
    <dc:title id="t2">Volume One</dc:title>
    <meta refines="#t2" property="title-type">subtitle</meta>
    <dc:creator id="c1">Jane Doe</dc:creator>
    <meta refines="#c1" property="role" scheme="marc:relators">aut</meta>
    <meta refines="#c1" property="file-as">Doe, Jane</meta>
    <dc:creator id="c2">John Roe</dc:creator>
    <meta refines="#c2" property="role" scheme="marc:relators">ill</meta>
    <dc:language>en</dc:language>
    <dc:publisher>Folio Press</dc:publisher>
    <meta property="dcterms:modified">2024-01-01T00:00:00Z</meta>
  </metadata>
  <manifest>
    <item id="nav" href="nav.xhtml" media-type="application/xhtml+xml" properties="nav"/>
    <item id="ncx" href="toc.ncx" media-type="application/x-dtbncx+xml"/>
    <item id="cover" href="images/cover.png" media-type="image/png" properties="cover-image"/>
    <item id="c1" href="chapter1.xhtml" media-type="application/xhtml+xml" properties="scripted mathml" media-overlay="c1-smil"/>
    <item id="c2" href="chapter%202.xhtml" media-type="application/xhtml+xml"/>
    <item id="c1-smil" href="smil/chapter1.smil" media-type="application/smil+xml"/>
  </manifest>
  <spine page-progression-direction="rtl">
    <itemref idref="c1" properties="page-spread-right"/>
    <itemref idref="c2" properties="rendition:page-spread-left rendition:layout-pre-paginated"/>
  </spine>
</package>)";
}

inline std::string epub3_nav() {
    return R"(<?xml version="1.0" encoding="UTF-8"?>
<html xmlns="http://www.w3.org/1999/xhtml" xmlns:epub="http://www.idpf.org/2007/ops">
  <body>
    <nav epub:type="toc">
      <h1>Contents</h1>
      <ol>
        <li><a href="chapter1.xhtml">  Chapter
            One </a>
          <ol>
            <li><a href="chapter1.xhtml#part">Part&nbsp;A</a></li>
          </ol>
        </li>
        <li><span>Unlinked</span>
          <ol><li><a href="chapter%202.xhtml">Chapter Two</a></li></ol>
        </li>
        <li><a href="chapter1.xhtml#empty"></a></li>
      </ol>
    </nav>
    <nav epub:type="landmarks">
      <ol><li><a epub:type="bodymatter" href="chapter1.xhtml">Start</a></li></ol>
    </nav>
    <nav epub:type="page-list" hidden="">
      <ol><li><a href="chapter1.xhtml#p1">1</a></li><li><a href="chapter1.xhtml#p2">2</a></li></ol>
    </nav>
  </body>
</html>)";
}

} // namespace folio::test
