#include <rdf_sync/rdf/graph_diff.hpp>

namespace rdf_sync {

GraphDiff DiffCanonical(const CanonicalGraph& left, const CanonicalGraph& right) {
    GraphDiff diff;
    diff.complete = left.complete && right.complete;

    const auto& l = left.graph.Triples();
    const auto& r = right.graph.Triples();

    // Both sets are ordered by Triple, so one merge pass partitions them.
    auto li = l.begin();
    auto ri = r.begin();
    while (li != l.end() && ri != r.end()) {
        if (*li < *ri) {
            diff.only_left.Insert(*li++);
        } else if (*ri < *li) {
            diff.only_right.Insert(*ri++);
        } else {
            diff.shared.Insert(*li);
            ++li;
            ++ri;
        }
    }
    for (; li != l.end(); ++li) diff.only_left.Insert(*li);
    for (; ri != r.end(); ++ri) diff.only_right.Insert(*ri);
    return diff;
}

GraphDiff Diff(const Graph& left, const Graph& right,
               const CanonicalizerOptions& options) {
    return DiffCanonical(Canonicalize(left, options), Canonicalize(right, options));
}

} // namespace rdf_sync
