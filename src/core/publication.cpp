/**
 * Folio - Publication implementation
 */

#include "folio/publication.hpp"
#include "folio/logging.hpp"

namespace folio {

// ============================================================================
// ServicesBuilder
// ============================================================================

void ServicesBuilder::set(const std::string& name, ServiceFactory factory) {
    factories_[name] = std::move(factory);
}

void ServicesBuilder::remove(const std::string& name) {
    factories_.erase(name);
}

bool ServicesBuilder::has(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::vector<std::string> ServicesBuilder::names() const {
    std::vector<std::string> result;
    for (const auto& entry : factories_) {
        result.push_back(entry.first);
    }
    return result;
}

std::vector<std::unique_ptr<PublicationService>> ServicesBuilder::build(const ServiceContext& context) const {
    std::vector<std::unique_ptr<PublicationService>> services;
    for (const auto& [name, factory] : factories_) {
        if (!factory) continue;
        auto service = factory(context);
        if (service) {
            services.push_back(std::move(service));
        } else {
            LOG_DEBUG("Publication", "Service factory returned nothing: " << name);
        }
    }
    return services;
}

// ============================================================================
// Publication
// ============================================================================

Publication::Publication(Manifest manifest, FetcherPtr fetcher, const ServicesBuilder& services)
    : manifest_(std::move(manifest)), fetcher_(std::move(fetcher)) {
    services_ = services.build(ServiceContext{manifest_, fetcher_});
}

ResourcePtr Publication::get(const std::string& href) const {
    if (const Link* link = manifest_.link_with_href(href)) {
        Link requested = *link;
        requested.href = href;
        return fetcher_->get(requested);
    }
    return fetcher_->get(href);
}

ResourcePtr Publication::get(const Link& link) const {
    return fetcher_->get(link);
}

PublicationService* Publication::find_service(const std::string& name) const {
    for (const auto& service : services_) {
        if (service->name() == name) return service.get();
    }
    return nullptr;
}

// ============================================================================
// PublicationBuilder
// ============================================================================

std::unique_ptr<Publication> PublicationBuilder::build() {
    return std::make_unique<Publication>(std::move(manifest), std::move(fetcher), services);
}

} // namespace folio
