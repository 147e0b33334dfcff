#include <rdf_sync/compare/entity_fetch.hpp>

#include <rdf_sync/core/log.hpp>
#include <rdf_sync/sparql/query_builder.hpp>
#include <rdf_sync/sparql/sparql_ops.hpp>

#include <deque>
#include <map>
#include <set>
#include <vector>

namespace rdf_sync {

const char* CompareModeName(CompareMode mode) {
    switch (mode) {
        case CompareMode::WholeGraph:     return "graph";
        case CompareMode::EntityMetadata: return "metadata";
        case CompareMode::EntitySubject:  return "subject";
        case CompareMode::DeepSubgraph:   return "deep";
    }
    return "unknown";
}

std::optional<CompareMode> ParseCompareMode(std::string_view name) {
    if (name == "graph") return CompareMode::WholeGraph;
    if (name == "metadata") return CompareMode::EntityMetadata;
    if (name == "subject") return CompareMode::EntitySubject;
    if (name == "deep") return CompareMode::DeepSubgraph;
    return std::nullopt;
}

bool ModeUsesFilters(CompareMode mode) {
    return mode == CompareMode::WholeGraph || mode == CompareMode::EntityMetadata;
}

std::chrono::seconds FetchTimeouts::ForMode(CompareMode mode) const {
    switch (mode) {
        case CompareMode::WholeGraph:     return graph;
        case CompareMode::DeepSubgraph:   return deep;
        case CompareMode::EntityMetadata:
        case CompareMode::EntitySubject:  return entity;
    }
    return entity;
}

Result<Graph, Error> FetchWholeGraph(ISparqlClient& client, const FetchSpec& spec) {
    LogInfo("workflow", "Fetching graph <" + spec.graph_iri + "> from " +
                            client.Endpoint());
    auto graph = ExecuteConstructQuery(
        client, BuildGraphQuery(spec.graph_iri, spec.filters), spec.format,
        spec.timeouts.graph);
    if (graph.IsErr()) {
        return graph;
    }
    return Result<Graph, Error>::Ok(FilterGraph(graph.Value(), spec.filters));
}

Result<Graph, Error> FetchEntity(ISparqlClient& client, const FetchSpec& spec,
                                 const std::string& entity_iri) {
    switch (spec.mode) {
        case CompareMode::WholeGraph:
            return FetchWholeGraph(client, spec);

        case CompareMode::EntityMetadata: {
            auto graph = ExecuteConstructQuery(
                client, BuildEntityQuery(spec.graph_iri, entity_iri, spec.filters),
                spec.format, spec.timeouts.entity);
            if (graph.IsErr()) return graph;
            return Result<Graph, Error>::Ok(FilterGraph(graph.Value(), spec.filters));
        }

        case CompareMode::EntitySubject:
            return ExecuteConstructQuery(
                client, BuildEntityQuery(spec.graph_iri, entity_iri, {}),
                spec.format, spec.timeouts.entity);

        case CompareMode::DeepSubgraph: {
            auto graph = ExecuteConstructQuery(
                client, BuildDeepSubgraphQuery(spec.graph_iri, entity_iri),
                spec.format, spec.timeouts.deep);
            if (graph.IsErr()) return graph;
            auto restricted = RestrictToBlankClosure(graph.Value(), entity_iri);
            if (restricted.Size() != graph.Value().Size()) {
                LogDebug("workflow",
                         "Dropped " +
                             std::to_string(graph.Value().Size() - restricted.Size()) +
                             " triples outside the blank-node closure of <" +
                             entity_iri + ">");
            }
            return Result<Graph, Error>::Ok(std::move(restricted));
        }
    }
    return Result<Graph, Error>::Err(Error{
        "FetchEntity", client.Endpoint(), std::nullopt, "Unknown compare mode",
        std::nullopt, ErrorCategory::Internal});
}

Graph RestrictToBlankClosure(const Graph& graph, const std::string& entity_iri) {
    // Outgoing blank-node objects per subject.
    std::map<Term, std::vector<std::string>> blank_children;
    for (const auto& t : graph) {
        if (const auto* o = std::get_if<BlankNode>(&t.object)) {
            blank_children[t.subject].push_back(o->label);
        }
    }

    std::set<std::string> reached;
    std::deque<Term> frontier{Iri{entity_iri}};
    while (!frontier.empty()) {
        Term node = std::move(frontier.front());
        frontier.pop_front();
        auto it = blank_children.find(node);
        if (it == blank_children.end()) continue;
        for (const auto& label : it->second) {
            if (reached.insert(label).second) {
                frontier.emplace_back(BlankNode{label});
            }
        }
    }

    Graph out;
    for (const auto& t : graph) {
        const auto* s_iri = std::get_if<Iri>(&t.subject);
        const auto* s_bn = std::get_if<BlankNode>(&t.subject);
        if ((s_iri && s_iri->value == entity_iri) ||
            (s_bn && reached.count(s_bn->label) > 0)) {
            out.Insert(t);
        }
    }
    return out;
}

} // namespace rdf_sync
