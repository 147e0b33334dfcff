#pragma once

#include <rdf_sync/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace rdf_sync {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// ---------------------------------------------------------------------------
// EndpointUrl - an http(s) endpoint split into the parts httplib needs.
// ---------------------------------------------------------------------------
struct EndpointUrl {
    bool use_https = false;
    std::string host;
    uint16_t port = 80;
    std::string path = "/";   // always starts with '/', no query string

    // scheme://host:port - the base URL for an HTTP client.
    [[nodiscard]] std::string Origin() const;
    // Origin() + path.
    [[nodiscard]] std::string ToString() const;
};

// Parse "http[s]://host[:port][/path]". Query strings and fragments are
// rejected; the SPARQL query is always sent as its own parameter.
Result<EndpointUrl, std::string> ParseEndpointUrl(std::string_view url);

} // namespace rdf_sync
