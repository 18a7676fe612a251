// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/transport.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace ferry::core {

// Immutable description of the object being transferred; resolved once per
// session
struct RemoteObject {
    std::string id;
    std::string name;
    std::string url;
    std::uint64_t total_size{0};
    bool supports_ranges{false};
};

// Resolves an object id to its size and name
class ObjectCatalog {
public:
    virtual ~ObjectCatalog() = default;

    [[nodiscard]] virtual std::expected<RemoteObject, std::error_code>
    resolve(std::string_view id) noexcept = 0;
};

// Catalog backed by plain HTTP: the id is expanded through a URL template,
// then sized with HEAD, falling back to a one-byte range probe for servers
// that omit Content-Length on HEAD.
class HttpCatalog final : public ObjectCatalog {
public:
    explicit HttpCatalog(Transport& transport, std::string url_template = "{id}");

    [[nodiscard]] std::expected<RemoteObject, std::error_code>
    resolve(std::string_view id) noexcept override;

private:
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    probe(const std::string& url) noexcept;

    Transport& transport_;
    std::string url_template_;
};

// Safe local file name for an object: path separators and control characters
// are stripped, falling back to the id when nothing usable remains
[[nodiscard]] std::string sanitize_filename(std::string_view name, std::string_view fallback);

} // namespace ferry::core
