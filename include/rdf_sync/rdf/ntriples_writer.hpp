#pragma once

#include <rdf_sync/core/result.hpp>
#include <rdf_sync/rdf/graph.hpp>

#include <string>
#include <vector>

namespace rdf_sync {

/// One N-Triples line per triple, sorted bytewise.
[[nodiscard]] std::vector<std::string> SortedNTriplesLines(const Graph& graph);

/// Sorted N-Triples document; every line, including the last, ends in '\n'.
[[nodiscard]] std::string SerializeNTriples(const Graph& graph);

/// Write SerializeNTriples(graph) to `path`, replacing any existing file.
[[nodiscard]] Result<void, Error> WriteNTriplesFile(const Graph& graph,
                                                    const std::string& path);

} // namespace rdf_sync
