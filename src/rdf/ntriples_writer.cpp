#include <rdf_sync/rdf/ntriples_writer.hpp>

#include <algorithm>
#include <fstream>

namespace rdf_sync {

std::vector<std::string> SortedNTriplesLines(const Graph& graph) {
    std::vector<std::string> lines;
    lines.reserve(graph.Size());
    for (const auto& triple : graph) {
        lines.push_back(ToNTriples(triple));
    }
    std::sort(lines.begin(), lines.end());
    return lines;
}

std::string SerializeNTriples(const Graph& graph) {
    std::string out;
    for (const auto& line : SortedNTriplesLines(graph)) {
        out += line;
        out += '\n';
    }
    return out;
}

Result<void, Error> WriteNTriplesFile(const Graph& graph, const std::string& path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        return Result<void, Error>::Err(Error{
            "WriteNTriplesFile", "", std::nullopt,
            "Cannot open file for writing: " + path, std::nullopt,
            ErrorCategory::Internal});
    }
    file << SerializeNTriples(graph);
    file.close();
    if (file.fail()) {
        return Result<void, Error>::Err(Error{
            "WriteNTriplesFile", "", std::nullopt,
            "Failed to write file: " + path, std::nullopt,
            ErrorCategory::Internal});
    }
    return Result<void, Error>::Ok();
}

} // namespace rdf_sync
