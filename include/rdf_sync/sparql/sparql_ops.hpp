#pragma once

#include <rdf_sync/core/result.hpp>
#include <rdf_sync/rdf/graph.hpp>
#include <rdf_sync/rdf/rdf_parser.hpp>
#include <rdf_sync/sparql/i_sparql_client.hpp>
#include <rdf_sync/sparql/results_codec.hpp>

#include <chrono>
#include <string_view>

namespace rdf_sync {

// ---------------------------------------------------------------------------
// ExecuteConstructQuery - run a CONSTRUCT query and parse the RDF response.
//
// Requests `format`; if the server answers with the other supported RDF
// syntax (per Content-Type) that syntax is parsed instead. Non-2xx
// responses become Error::FromHttpStatus; parse failures are Parse errors
// with the endpoint attached.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<Graph, Error> ExecuteConstructQuery(
    ISparqlClient& client,
    std::string_view query,
    RdfFormat format,
    std::chrono::seconds timeout);

// ---------------------------------------------------------------------------
// ExecuteSelectQuery - run a SELECT query. Requests JSON results (XML is
// accepted at lower priority and decoded when the server returns it).
// ---------------------------------------------------------------------------
[[nodiscard]] Result<SelectResult, Error> ExecuteSelectQuery(
    ISparqlClient& client,
    std::string_view query,
    std::chrono::seconds timeout);

} // namespace rdf_sync
