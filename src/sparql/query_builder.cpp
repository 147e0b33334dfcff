#include <rdf_sync/sparql/query_builder.hpp>

namespace rdf_sync {

std::string BuildFilterClause(const FilterSet& filters, const std::string& variable,
                              const std::vector<std::string>& blank_ends) {
    if (filters.empty()) {
        return {};
    }
    std::string list;
    for (const auto& iri : filters) {
        if (!list.empty()) list += ", ";
        list += "<" + iri + ">";
    }
    std::string escapes;
    for (const auto& end : blank_ends) {
        escapes += "isBlank(" + end + ") || ";
    }
    return "FILTER (" + escapes + variable + " NOT IN (" + list + "))";
}

std::string BuildGraphQuery(const std::string& graph_iri, const FilterSet& filters) {
    std::string where = "?s ?p ?o .";
    const auto filter = BuildFilterClause(filters, "?p", {"?s", "?o"});
    if (!filter.empty()) where += " " + filter;
    return "CONSTRUCT { ?s ?p ?o } WHERE { GRAPH <" + graph_iri + "> { " +
           where + " } }";
}

std::string BuildEntityQuery(const std::string& graph_iri,
                             const std::string& entity_iri,
                             const FilterSet& filters) {
    const std::string entity = "<" + entity_iri + ">";
    std::string where = entity + " ?p ?o .";
    const auto filter = BuildFilterClause(filters, "?p", {"?o"});
    if (!filter.empty()) where += " " + filter;
    return "CONSTRUCT { " + entity + " ?p ?o . } WHERE { GRAPH <" + graph_iri +
           "> { " + where + " } }";
}

std::string BuildDeepSubgraphQuery(const std::string& graph_iri,
                                   const std::string& entity_iri) {
    const std::string entity = "<" + entity_iri + ">";
    return "CONSTRUCT { " + entity + " ?p ?o . ?bn ?p2 ?o2 . } "
           "WHERE { GRAPH <" + graph_iri + "> { "
           "{ " + entity + " ?p ?o . } "
           "UNION "
           "{ " + entity + " (!<" + kNoPredicate + ">)+ ?bn . "
           "FILTER (isBlank(?bn)) "
           "?bn ?p2 ?o2 . } "
           "} }";
}

std::string BuildPopulationQuery(const std::string& graph_iri,
                                 const std::string& type_iri) {
    return "SELECT DISTINCT ?item WHERE { GRAPH <" + graph_iri +
           "> { ?item a <" + type_iri + "> . } }";
}

} // namespace rdf_sync
