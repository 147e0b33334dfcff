#pragma once

#include <rdf_sync/core/url.hpp>
#include <rdf_sync/sparql/i_sparql_client.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace rdf_sync {

// ---------------------------------------------------------------------------
// SparqlClientOptions - transport settings for one endpoint.
// ---------------------------------------------------------------------------
struct SparqlClientOptions {
    std::chrono::seconds connect_timeout{30};
    // Queries longer than this (URL-encoded) are sent as a form POST.
    size_t max_get_query_length = 4096;
    bool use_post = false;
    bool disable_tls_verify = false;
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::string user_agent = "rdf-sync";
};

// ---------------------------------------------------------------------------
// SparqlClient - ISparqlClient over cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header.
//
//   - GET <path>?query=... by default
//   - POST application/x-www-form-urlencoded "query=..." when the encoded
//     query is too long or use_post is set
//   - optional HTTP basic auth (Authorization is redacted in logs)
//   - per-request read timeout
// ---------------------------------------------------------------------------
class SparqlClient : public ISparqlClient {
public:
    SparqlClient(const EndpointUrl& endpoint,
                 const SparqlClientOptions& options = {});
    ~SparqlClient() override;

    SparqlClient(const SparqlClient&) = delete;
    SparqlClient& operator=(const SparqlClient&) = delete;
    SparqlClient(SparqlClient&&) = delete;
    SparqlClient& operator=(SparqlClient&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Query(
        std::string_view query,
        std::string_view accept,
        std::chrono::seconds timeout) override;

    [[nodiscard]] const std::string& Endpoint() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rdf_sync
