/**
 * Folio - Publication
 *
 * A Publication bundles the manifest, the fetcher serving its resources and
 * the services computed on demand (positions, content, guided navigation).
 * Parsers return a PublicationBuilder; the streamer builds it.
 */

#pragma once

#include "fetcher.hpp"
#include "manifest.hpp"
#include "result.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace folio {

/**
 * What a service sees of its publication. References stay valid for the
 * lifetime of the publication.
 */
struct ServiceContext {
    const Manifest& manifest;
    const FetcherPtr& fetcher;
};

class PublicationService {
public:
    virtual ~PublicationService() = default;

    virtual std::string name() const = 0;
};

using ServiceFactory = std::function<std::unique_ptr<PublicationService>(const ServiceContext&)>;

/**
 * Service name -> factory. Setting a name twice replaces the factory.
 */
class ServicesBuilder {
public:
    void set(const std::string& name, ServiceFactory factory);
    void remove(const std::string& name);
    bool has(const std::string& name) const;
    std::vector<std::string> names() const;

    std::vector<std::unique_ptr<PublicationService>> build(const ServiceContext& context) const;

private:
    std::map<std::string, ServiceFactory> factories_;
};

class Publication {
public:
    Publication(Manifest manifest, FetcherPtr fetcher, const ServicesBuilder& services = {});

    Publication(const Publication&) = delete;
    Publication& operator=(const Publication&) = delete;

    const Manifest& manifest() const { return manifest_; }
    const Metadata& metadata() const { return manifest_.metadata; }
    const FetcherPtr& fetcher() const { return fetcher_; }

    /**
     * Resource for href. The manifest link with that href is used when there
     * is one, so the fetcher sees its properties (encryption, ...).
     */
    ResourcePtr get(const std::string& href) const;
    ResourcePtr get(const Link& link) const;

    /**
     * Registered service with the given name, nullptr when absent.
     */
    PublicationService* find_service(const std::string& name) const;

    /**
     * First registered service of type S, nullptr when absent.
     */
    template<typename S>
    S* find_service() const {
        for (const auto& service : services_) {
            if (auto* typed = dynamic_cast<S*>(service.get())) return typed;
        }
        return nullptr;
    }

private:
    Manifest manifest_;
    FetcherPtr fetcher_;
    std::vector<std::unique_ptr<PublicationService>> services_;
};

/**
 * Everything a parser produces. Callers may adjust the manifest, wrap the
 * fetcher or change services before building.
 */
struct PublicationBuilder {
    Manifest manifest;
    FetcherPtr fetcher;
    ServicesBuilder services;

    std::unique_ptr<Publication> build();
};

} // namespace folio
