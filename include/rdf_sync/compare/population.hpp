#pragma once

#include <rdf_sync/core/result.hpp>
#include <rdf_sync/sparql/i_sparql_client.hpp>

#include <chrono>
#include <set>
#include <string>

namespace rdf_sync {

// Entity IRIs of one type in one store, sorted.
using Population = std::set<std::string>;

// ---------------------------------------------------------------------------
// PopulationComparison - existence-level comparison of two stores.
// Entities in only one store are a finding on their own and are never
// compared triple by triple.
// ---------------------------------------------------------------------------
struct PopulationComparison {
    Population shared;
    Population only_left;
    Population only_right;

    [[nodiscard]] bool Matches() const {
        return only_left.empty() && only_right.empty();
    }
};

/// Every IRI of rdf:type `type_iri` in `graph_iri`. The query carries no
/// LIMIT; blank-node and literal bindings are skipped.
[[nodiscard]] Result<Population, Error> DiscoverPopulation(
    ISparqlClient& client,
    const std::string& graph_iri,
    const std::string& type_iri,
    std::chrono::seconds timeout);

[[nodiscard]] PopulationComparison ComparePopulations(const Population& left,
                                                      const Population& right);

} // namespace rdf_sync
