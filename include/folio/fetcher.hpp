/**
 * Folio - Resource access
 *
 * A Fetcher gives access to the resources of a publication container
 * (ZIP archive, directory, file) without the caller knowing which. It is the
 * only place where publication bytes are read.
 */

#pragma once

#include "link.hpp"
#include "result.hpp"
#include "xml.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace folio {

/**
 * One resource, bound to the link it was requested with.
 */
class Resource {
public:
    virtual ~Resource() = default;

    /**
     * Link the resource was requested with, including its properties.
     */
    virtual const Link& link() const = 0;

    /**
     * Whole content of the resource.
     */
    virtual Result<std::vector<uint8_t>> read() = 0;

    /**
     * Content length. The default implementation reads the resource.
     */
    virtual Result<uint64_t> length();

    Result<std::string> read_as_string();
    Result<XmlDocument> read_as_xml(const NamespaceBindings& bindings = {});
};

using ResourcePtr = std::unique_ptr<Resource>;

/**
 * Resource whose every read fails with the same error.
 */
class FailureResource : public Resource {
public:
    FailureResource(Link link, Error error) : link_(std::move(link)), error_(std::move(error)) {}

    const Link& link() const override { return link_; }
    Result<std::vector<uint8_t>> read() override { return error_; }
    Result<uint64_t> length() override { return error_; }

private:
    Link link_;
    Error error_;
};

/**
 * Resource served from memory.
 */
class BytesResource : public Resource {
public:
    BytesResource(Link link, std::vector<uint8_t> data) : link_(std::move(link)), data_(std::move(data)) {}

    const Link& link() const override { return link_; }
    Result<std::vector<uint8_t>> read() override { return data_; }
    Result<uint64_t> length() override { return static_cast<uint64_t>(data_.size()); }

private:
    Link link_;
    std::vector<uint8_t> data_;
};

class Fetcher {
public:
    virtual ~Fetcher() = default;

    /**
     * Every resource known to the fetcher, in container order.
     */
    virtual Result<LinkList> links() = 0;

    /**
     * Resource for link. Never null: unknown hrefs produce a FailureResource
     * reporting Error::Code::NotFound.
     */
    virtual ResourcePtr get(const Link& link) = 0;

    /**
     * Convenience for get() with a bare link.
     */
    ResourcePtr get(const std::string& href);
};

using FetcherPtr = std::shared_ptr<Fetcher>;

/**
 * Serves files from the local file system. Each href prefix maps to a file
 * or directory; a directory exposes every regular file below it.
 */
class FileFetcher : public Fetcher {
public:
    explicit FileFetcher(std::map<std::string, std::filesystem::path> paths);
    FileFetcher(const std::string& href, const std::filesystem::path& path);

    using Fetcher::get;
    Result<LinkList> links() override;
    ResourcePtr get(const Link& link) override;

private:
    std::map<std::string, std::filesystem::path> paths_;
};

/**
 * Resource transformation applied on every read of a TransformingFetcher.
 */
using ResourceTransformer = std::function<ResourcePtr(ResourcePtr)>;

/**
 * Passes every resource of the wrapped fetcher through a transformer.
 */
class TransformingFetcher : public Fetcher {
public:
    TransformingFetcher(FetcherPtr fetcher, ResourceTransformer transformer);

    using Fetcher::get;
    Result<LinkList> links() override { return fetcher_->links(); }
    ResourcePtr get(const Link& link) override;

    const FetcherPtr& wrapped() const { return fetcher_; }

private:
    FetcherPtr fetcher_;
    ResourceTransformer transformer_;
};

} // namespace folio
