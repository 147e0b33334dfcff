#pragma once

#include <rdf_sync/core/result.hpp>
#include <rdf_sync/rdf/graph.hpp>
#include <rdf_sync/rdf/predicate_filter.hpp>
#include <rdf_sync/rdf/rdf_parser.hpp>
#include <rdf_sync/sparql/i_sparql_client.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace rdf_sync {

// ---------------------------------------------------------------------------
// CompareMode - how much of the store makes up one compared unit.
// ---------------------------------------------------------------------------
enum class CompareMode {
    WholeGraph,      // the named graph is one implicit entity, filtered
    EntityMetadata,  // triples with the entity as subject, filtered
    EntitySubject,   // triples with the entity as subject, unfiltered
    DeepSubgraph,    // entity plus its blank-node closure, unfiltered
};

/// "graph", "metadata", "subject", "deep".
[[nodiscard]] const char* CompareModeName(CompareMode mode);
[[nodiscard]] std::optional<CompareMode> ParseCompareMode(std::string_view name);

/// Predicate filters apply to WholeGraph and EntityMetadata only. Filtering
/// blank-node traversal edges would change the structure being compared.
[[nodiscard]] bool ModeUsesFilters(CompareMode mode);

// ---------------------------------------------------------------------------
// FetchTimeouts - per-request limits. A timeout is never retried.
// ---------------------------------------------------------------------------
struct FetchTimeouts {
    std::chrono::seconds entity{60};
    std::chrono::seconds discovery{120};
    std::chrono::seconds deep{120};
    std::chrono::seconds graph{300};

    [[nodiscard]] std::chrono::seconds ForMode(CompareMode mode) const;
};

// ---------------------------------------------------------------------------
// FetchSpec - everything needed to fetch one unit from one store.
// ---------------------------------------------------------------------------
struct FetchSpec {
    CompareMode mode = CompareMode::EntityMetadata;
    std::string graph_iri;
    FilterSet filters;
    RdfFormat format = RdfFormat::NTriples;
    FetchTimeouts timeouts;
};

/// Whole named graph. Excluded predicates are removed both in the query and
/// again after parsing.
[[nodiscard]] Result<Graph, Error> FetchWholeGraph(ISparqlClient& client,
                                                   const FetchSpec& spec);

/// One entity's unit according to spec.mode (not WholeGraph).
[[nodiscard]] Result<Graph, Error> FetchEntity(ISparqlClient& client,
                                               const FetchSpec& spec,
                                               const std::string& entity_iri);

/// Keep only triples whose subject is the entity or a blank node reachable
/// from it through blank-node objects. Drops anything a property path
/// reached through an intermediate IRI.
[[nodiscard]] Graph RestrictToBlankClosure(const Graph& graph,
                                           const std::string& entity_iri);

} // namespace rdf_sync
