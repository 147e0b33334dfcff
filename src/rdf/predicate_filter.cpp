#include <rdf_sync/rdf/predicate_filter.hpp>

namespace rdf_sync {

bool ShouldExclude(const std::string& predicate_iri, const FilterSet& filters) {
    return filters.count(predicate_iri) > 0;
}

Graph FilterGraph(const Graph& graph, const FilterSet& filters) {
    if (filters.empty()) {
        return graph;
    }
    Graph out;
    for (const auto& triple : graph) {
        if (IsBlank(triple.subject) || IsBlank(triple.object) ||
            !ShouldExclude(triple.predicate.value, filters)) {
            out.Insert(triple);
        }
    }
    return out;
}

} // namespace rdf_sync
