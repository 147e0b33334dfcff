#pragma once

#include <rdf_sync/rdf/canonicalizer.hpp>
#include <rdf_sync/rdf/graph.hpp>

namespace rdf_sync {

// ---------------------------------------------------------------------------
// GraphDiff - partition of two canonical graphs.
//
//   shared + only_left  == canonical(left)
//   shared + only_right == canonical(right)
//   only_left and only_right are disjoint
// ---------------------------------------------------------------------------
struct GraphDiff {
    Graph shared;
    Graph only_left;
    Graph only_right;
    bool complete = true;  // false if either canonicalization was incomplete

    [[nodiscard]] bool Identical() const {
        return only_left.Empty() && only_right.Empty();
    }
};

/// Diff two already canonical graphs.
[[nodiscard]] GraphDiff DiffCanonical(const CanonicalGraph& left,
                                      const CanonicalGraph& right);

/// Canonicalize both graphs and diff them.
[[nodiscard]] GraphDiff Diff(const Graph& left, const Graph& right,
                             const CanonicalizerOptions& options = {});

} // namespace rdf_sync
