#pragma once

#include <rdf_sync/core/result.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace rdf_sync {

// ---------------------------------------------------------------------------
// HttpHeaders - response headers as delivered. Names keep their original
// case; use FindHeader for case-insensitive lookup.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse - the result of one SPARQL protocol request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] bool IsSuccess() const {
        return status_code >= 200 && status_code < 300;
    }
};

/// Case-insensitive header lookup. Returns an empty string if absent.
[[nodiscard]] std::string FindHeader(const HttpHeaders& headers,
                                     std::string_view name);

// ---------------------------------------------------------------------------
// ISparqlClient - one read-only SPARQL endpoint.
//
// Everything that talks to a store depends on this interface rather than
// the HTTP client, so comparisons run offline against MockSparqlClient.
//
// Query() reports transport failures (connection refused, timeout) as Err.
// Any HTTP status, including 4xx/5xx, is returned as Ok; callers decide.
// ---------------------------------------------------------------------------
class ISparqlClient {
public:
    virtual ~ISparqlClient() = default;

    ISparqlClient(const ISparqlClient&) = delete;
    ISparqlClient& operator=(const ISparqlClient&) = delete;
    ISparqlClient(ISparqlClient&&) = delete;
    ISparqlClient& operator=(ISparqlClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Query(
        std::string_view query,
        std::string_view accept,
        std::chrono::seconds timeout) = 0;

    /// Endpoint URL, used as error and log context.
    [[nodiscard]] virtual const std::string& Endpoint() const = 0;

protected:
    ISparqlClient() = default;
};

} // namespace rdf_sync
