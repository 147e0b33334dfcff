#include <rdf_sync/compare/population.hpp>

#include <rdf_sync/core/log.hpp>
#include <rdf_sync/sparql/query_builder.hpp>
#include <rdf_sync/sparql/sparql_ops.hpp>

#include <algorithm>
#include <iterator>

namespace rdf_sync {

Result<Population, Error> DiscoverPopulation(ISparqlClient& client,
                                             const std::string& graph_iri,
                                             const std::string& type_iri,
                                             std::chrono::seconds timeout) {
    auto select = ExecuteSelectQuery(
        client, BuildPopulationQuery(graph_iri, type_iri), timeout);
    if (select.IsErr()) {
        auto error = select.Error();
        error.operation = "DiscoverPopulation";
        return Result<Population, Error>::Err(std::move(error));
    }

    Population population;
    size_t skipped = 0;
    for (const auto& row : select.Value().rows) {
        auto it = row.find("item");
        if (it == row.end()) {
            continue;
        }
        if (const auto* iri = std::get_if<Iri>(&it->second)) {
            population.insert(iri->value);
        } else {
            ++skipped;
        }
    }
    if (skipped > 0) {
        LogDebug("workflow", "Skipped " + std::to_string(skipped) +
                                 " non-IRI items from " + client.Endpoint());
    }

    LogInfo("workflow", "Discovered " + std::to_string(population.size()) +
                            " <" + type_iri + "> in " + client.Endpoint());
    return Result<Population, Error>::Ok(std::move(population));
}

PopulationComparison ComparePopulations(const Population& left,
                                        const Population& right) {
    PopulationComparison cmp;
    std::set_intersection(left.begin(), left.end(), right.begin(), right.end(),
                          std::inserter(cmp.shared, cmp.shared.end()));
    std::set_difference(left.begin(), left.end(), right.begin(), right.end(),
                        std::inserter(cmp.only_left, cmp.only_left.end()));
    std::set_difference(right.begin(), right.end(), left.begin(), left.end(),
                        std::inserter(cmp.only_right, cmp.only_right.end()));
    return cmp;
}

} // namespace rdf_sync
