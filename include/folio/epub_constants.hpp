/**
 * Folio - EPUB constants
 *
 * Namespace URIs, query bindings and well-known container paths.
 */

#pragma once

#include "xml.hpp"

namespace folio::epub {

// Namespaces
constexpr const char* NAMESPACE_CONTAINER = "urn:oasis:names:tc:opendocument:xmlns:container";
constexpr const char* NAMESPACE_OPF = "http://www.idpf.org/2007/opf";
constexpr const char* NAMESPACE_DC = "http://purl.org/dc/elements/1.1/";
constexpr const char* NAMESPACE_DCTERMS = "http://purl.org/dc/terms/";
constexpr const char* NAMESPACE_RENDITION = "http://www.idpf.org/2013/rendition";
constexpr const char* NAMESPACE_ENC = "http://www.w3.org/2001/04/xmlenc#";
constexpr const char* NAMESPACE_SIG = "http://www.w3.org/2000/09/xmldsig#";
constexpr const char* NAMESPACE_COMP = "http://www.idpf.org/2016/encryption#compression";
constexpr const char* NAMESPACE_NCX = "http://www.daisy.org/z3986/2005/ncx/";
constexpr const char* NAMESPACE_XHTML = "http://www.w3.org/1999/xhtml";
constexpr const char* NAMESPACE_OPS = "http://www.idpf.org/2007/ops";

// Well-known paths
constexpr const char* PATH_CONTAINER = "META-INF/container.xml";
constexpr const char* PATH_ENCRYPTION = "META-INF/encryption.xml";
constexpr const char* PATH_DISPLAY_OPTIONS_APPLE = "META-INF/com.apple.ibooks.display-options.xml";
constexpr const char* PATH_DISPLAY_OPTIONS_KOBO = "META-INF/com.kobobooks.display-options.xml";

// Display options documents, in lookup order
constexpr const char* DISPLAY_OPTIONS_PATHS[] = {
    PATH_DISPLAY_OPTIONS_APPLE,
    PATH_DISPLAY_OPTIONS_KOBO,
};

// Encryption algorithms and schemes
constexpr const char* ALGORITHM_IDPF_OBFUSCATION = "http://www.idpf.org/2008/embedding";
constexpr const char* ALGORITHM_ADOBE_OBFUSCATION = "http://ns.adobe.com/pdf/enc#RC";
constexpr const char* SCHEME_LCP = "http://readium.org/2014/01/lcp";
constexpr const char* LCP_CONTENT_KEY_URI = "license.lcpl#/encryption/content_key";

// Query bindings
inline const NamespaceBindings& container_bindings() {
    static const NamespaceBindings bindings = {{NAMESPACE_CONTAINER, "cn"}};
    return bindings;
}

inline const NamespaceBindings& package_bindings() {
    static const NamespaceBindings bindings = {
        {NAMESPACE_OPF, "opf"},
        {NAMESPACE_DC, "dc"},
        {NAMESPACE_DCTERMS, "dcterms"},
        {NAMESPACE_RENDITION, "rendition"},
    };
    return bindings;
}

inline const NamespaceBindings& encryption_bindings() {
    static const NamespaceBindings bindings = {
        {NAMESPACE_ENC, "enc"},
        {NAMESPACE_SIG, "ds"},
        {NAMESPACE_COMP, "comp"},
    };
    return bindings;
}

inline const NamespaceBindings& ncx_bindings() {
    static const NamespaceBindings bindings = {{NAMESPACE_NCX, "ncx"}};
    return bindings;
}

inline const NamespaceBindings& nav_bindings() {
    static const NamespaceBindings bindings = {
        {NAMESPACE_XHTML, "html"},
        {NAMESPACE_OPS, "epub"},
    };
    return bindings;
}

} // namespace folio::epub
