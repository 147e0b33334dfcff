#pragma once

#include <rdf_sync/core/result.hpp>
#include <rdf_sync/rdf/term.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rdf_sync {

inline constexpr const char* kSparqlResultsJson = "application/sparql-results+json";
inline constexpr const char* kSparqlResultsXml = "application/sparql-results+xml";

// One solution row. Unbound variables are absent from the map.
using BindingRow = std::map<std::string, Term>;

// ---------------------------------------------------------------------------
// SelectResult - decoded SELECT response.
// ---------------------------------------------------------------------------
struct SelectResult {
    std::vector<std::string> variables;
    std::vector<BindingRow> rows;
};

/// Decode application/sparql-results+json (W3C SPARQL 1.1 JSON results).
/// Accepts the legacy "typed-literal" binding type. Literals are
/// NFC-normalized.
[[nodiscard]] Result<SelectResult, Error> ParseSelectJson(std::string_view body);

/// Decode application/sparql-results+xml.
[[nodiscard]] Result<SelectResult, Error> ParseSelectXml(std::string_view body);

} // namespace rdf_sync
