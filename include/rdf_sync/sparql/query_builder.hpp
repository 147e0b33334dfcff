#pragma once

#include <rdf_sync/rdf/predicate_filter.hpp>

#include <string>
#include <vector>

namespace rdf_sync {

// Predicate that never occurs in data; its negated property set matches
// every predicate.
inline constexpr const char* kNoPredicate = "urn:x-rdf-sync:none";

/// "FILTER (?p NOT IN (<a>, <b>))", or an empty string for no filters.
/// IRIs appear in FilterSet order so the text is deterministic. Each of
/// `blank_ends` adds an "isBlank(?x) ||" escape ahead of the list, so edges
/// to or from blank nodes pass regardless of predicate.
[[nodiscard]] std::string BuildFilterClause(
    const FilterSet& filters, const std::string& variable = "?p",
    const std::vector<std::string>& blank_ends = {});

/// All triples of a named graph, minus excluded predicates on edges between
/// non-blank terms.
[[nodiscard]] std::string BuildGraphQuery(const std::string& graph_iri,
                                          const FilterSet& filters);

/// Triples with the entity as subject, minus excluded predicates on edges to
/// non-blank objects.
[[nodiscard]] std::string BuildEntityQuery(const std::string& graph_iri,
                                           const std::string& entity_iri,
                                           const FilterSet& filters);

/// The entity's own triples plus the triples of every blank node reachable
/// from it. Never filtered.
[[nodiscard]] std::string BuildDeepSubgraphQuery(const std::string& graph_iri,
                                                 const std::string& entity_iri);

/// SELECT DISTINCT ?item of a type in a named graph, without LIMIT.
[[nodiscard]] std::string BuildPopulationQuery(const std::string& graph_iri,
                                               const std::string& type_iri);

} // namespace rdf_sync
