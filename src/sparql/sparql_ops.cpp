#include <rdf_sync/sparql/sparql_ops.hpp>

#include <rdf_sync/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace rdf_sync {

namespace {

std::string LowerMimeType(const std::string& content_type) {
    std::string mime = content_type.substr(0, content_type.find(';'));
    mime.erase(std::remove_if(mime.begin(), mime.end(),
                              [](unsigned char c) { return std::isspace(c) != 0; }),
               mime.end());
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return mime;
}

template <typename T>
Result<T, Error> WithEndpoint(Result<T, Error> result, const std::string& operation,
                              const std::string& endpoint) {
    if (result.IsOk()) {
        return result;
    }
    auto error = std::move(result).Error();
    error.operation = operation;
    error.endpoint = endpoint;
    return Result<T, Error>::Err(std::move(error));
}

} // anonymous namespace

Result<Graph, Error> ExecuteConstructQuery(ISparqlClient& client,
                                           std::string_view query,
                                           RdfFormat format,
                                           std::chrono::seconds timeout) {
    LogDebug("sparql", "CONSTRUCT against " + client.Endpoint() + ": " +
                           std::string(query));

    auto response = client.Query(query, RdfFormatMimeType(format), timeout);
    if (response.IsErr()) {
        return Result<Graph, Error>::Err(response.Error());
    }
    const auto& http = response.Value();
    if (!http.IsSuccess()) {
        return Result<Graph, Error>::Err(Error::FromHttpStatus(
            "ExecuteConstructQuery", client.Endpoint(), http.status_code, http.body));
    }

    auto delivered = RdfFormatFromContentType(FindHeader(http.headers, "Content-Type"));
    const RdfFormat parse_as = delivered.value_or(format);
    if (parse_as != format) {
        LogDebug("sparql", std::string("Endpoint answered with ") +
                               RdfFormatMimeType(parse_as) + " instead of " +
                               RdfFormatMimeType(format));
    }

    return WithEndpoint(ParseRdf(http.body, parse_as), "ExecuteConstructQuery",
                        client.Endpoint());
}

Result<SelectResult, Error> ExecuteSelectQuery(ISparqlClient& client,
                                               std::string_view query,
                                               std::chrono::seconds timeout) {
    LogDebug("sparql", "SELECT against " + client.Endpoint() + ": " +
                           std::string(query));

    const std::string accept =
        std::string(kSparqlResultsJson) + ", " + kSparqlResultsXml + ";q=0.9";
    auto response = client.Query(query, accept, timeout);
    if (response.IsErr()) {
        return Result<SelectResult, Error>::Err(response.Error());
    }
    const auto& http = response.Value();
    if (!http.IsSuccess()) {
        return Result<SelectResult, Error>::Err(Error::FromHttpStatus(
            "ExecuteSelectQuery", client.Endpoint(), http.status_code, http.body));
    }

    const auto mime = LowerMimeType(FindHeader(http.headers, "Content-Type"));
    if (mime == kSparqlResultsXml || mime == "application/xml" || mime == "text/xml") {
        return WithEndpoint(ParseSelectXml(http.body), "ExecuteSelectQuery",
                            client.Endpoint());
    }
    return WithEndpoint(ParseSelectJson(http.body), "ExecuteSelectQuery",
                        client.Endpoint());
}

} // namespace rdf_sync
