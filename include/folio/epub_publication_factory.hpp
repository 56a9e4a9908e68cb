/**
 * Folio - EPUB publication factory
 *
 * Folds a parsed package document and the per-concern maps (navigation,
 * encryption, display options) into a Manifest.
 */

#pragma once

#include "epub_display_options.hpp"
#include "epub_encryption.hpp"
#include "epub_package.hpp"
#include "manifest.hpp"

#include <string>

namespace folio::epub {

class EpubPublicationFactory {
public:
    EpubPublicationFactory(const PackageDocument& package, std::string fallback_title);

    EpubPublicationFactory& navigation(NavigationMap navigation);
    EpubPublicationFactory& encryption(EncryptionMap encryption);
    EpubPublicationFactory& display_options(DisplayOptions options);

    Manifest create() const;

private:
    Metadata create_metadata() const;
    Link create_link(const Item& item) const;
    void apply_itemref(const ItemRef& itemref, Link& link) const;

    const PackageDocument& package_;
    std::string fallback_title_;
    NavigationMap navigation_;
    EncryptionMap encryption_;
    DisplayOptions display_options_;
};

} // namespace folio::epub
