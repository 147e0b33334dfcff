#pragma once

#include <rdf_sync/core/result.hpp>
#include <rdf_sync/rdf/graph.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace rdf_sync {

enum class RdfFormat {
    NTriples,
    Turtle,
};

/// MIME type used in Accept headers: application/n-triples, text/turtle.
[[nodiscard]] const char* RdfFormatMimeType(RdfFormat format);

/// Map a Content-Type header value (parameters ignored) to a format.
[[nodiscard]] std::optional<RdfFormat> RdfFormatFromContentType(std::string_view content_type);

// ---------------------------------------------------------------------------
// ParseRdf - parse a Turtle or N-Triples document into a Graph.
//
// Every literal is NFC-normalized before it enters the graph. Blank-node
// labels are those assigned by the parser and are only meaningful within
// the returned graph. Malformed input yields a Parse-category Error that
// carries the parser's first message and line number.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<Graph, Error> ParseRdf(std::string_view document,
                                            RdfFormat format,
                                            const std::string& base_iri = "");

} // namespace rdf_sync
