#pragma once

#include <rdf_sync/rdf/graph.hpp>

#include <cstddef>
#include <map>
#include <string>

namespace rdf_sync {

struct CanonicalizerOptions {
    // Work allowed for the individualize-and-refine search, counted in
    // blank-node triples visited by refinement rounds and leaf serialization.
    size_t max_search_triples = size_t{1} << 22;
};

// ---------------------------------------------------------------------------
// CanonicalGraph - a graph whose blank nodes carry labels derived only from
// graph structure. Two graphs are isomorphic if their canonical triple sets
// are equal.
//
// `complete` is false when the search budget ran out and remaining ties
// were broken by input order. Equal canonical graphs still imply
// isomorphism; unequal ones may then be isomorphic after all.
// ---------------------------------------------------------------------------
struct CanonicalGraph {
    Graph graph;
    std::map<std::string, std::string> mapping;  // input label -> canonical label
    bool complete = true;
    size_t search_nodes = 0;
};

// ---------------------------------------------------------------------------
// Canonicalize - relabel blank nodes canonically.
//
// Colors start equal for all blank nodes and are refined Weisfeiler-Lehman
// style: a node's next color is the 64-bit FNV-1a hash of its color and the
// sorted signatures of its edges (direction, predicate, color or N-Triples
// text of the other end). Refinement stops when the partition stops
// growing. Remaining ties are broken by individualizing each member of the
// first non-singleton cell in turn; the discrete leaf whose sorted
// N-Triples text of the blank-node triples is smallest wins. Labels are
// "c" + 16 hex digits.
//
// A leaf equal to the best one found so far yields an automorphism. The
// search then backs up to where the two paths diverge, and siblings in the
// same orbit as an explored member are skipped.
//
// Always terminates: at most |B|+1 rounds per refinement, and once
// `max_search_triples` is spent the remaining ties are broken by index order
// in at most |B| further refinements.
// ---------------------------------------------------------------------------
[[nodiscard]] CanonicalGraph Canonicalize(const Graph& graph,
                                          const CanonicalizerOptions& options = {});

/// Blank-node-label-independent equality.
[[nodiscard]] bool IsIsomorphic(const Graph& a, const Graph& b,
                                const CanonicalizerOptions& options = {});

} // namespace rdf_sync
