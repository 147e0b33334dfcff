#pragma once

#include <rdf_sync/rdf/graph.hpp>

#include <set>
#include <string>

namespace rdf_sync {

// Set of predicate IRIs to drop before canonicalization. Immutable for a run.
using FilterSet = std::set<std::string>;

/// Exact-match membership test; no prefix or pattern matching.
[[nodiscard]] bool ShouldExclude(const std::string& predicate_iri,
                                 const FilterSet& filters);

/// Copy of the graph without triples whose predicate is excluded. Triples
/// with a blank subject or object are always kept.
[[nodiscard]] Graph FilterGraph(const Graph& graph, const FilterSet& filters);

} // namespace rdf_sync
