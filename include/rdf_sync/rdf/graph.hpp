#pragma once

#include <rdf_sync/rdf/term.hpp>

#include <cstddef>
#include <set>
#include <string>

namespace rdf_sync {

// ---------------------------------------------------------------------------
// Graph - a set of triples. Duplicates collapse; iteration is in Triple
// order, which makes every serialization of a Graph deterministic.
// ---------------------------------------------------------------------------
class Graph {
public:
    using const_iterator = std::set<Triple>::const_iterator;

    Graph() = default;

    /// Returns false if the triple was already present.
    bool Insert(Triple triple);

    /// Set union. Blank nodes with the same label are treated as the same
    /// node, so only merge graphs that share a blank-node scope.
    void Merge(const Graph& other);

    /// Set union where every blank node of `other` is renamed to
    /// `prefix + label`, keeping separately parsed graphs apart.
    void MergeRenamingBlanks(const Graph& other, const std::string& prefix);

    [[nodiscard]] bool Contains(const Triple& triple) const;
    [[nodiscard]] size_t Size() const noexcept { return triples_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return triples_.empty(); }

    /// Labels of all blank nodes occurring as subject or object.
    [[nodiscard]] std::set<std::string> BlankNodeLabels() const;

    /// Number of triples whose subject is the given IRI.
    [[nodiscard]] size_t CountWithSubject(const std::string& iri) const;

    [[nodiscard]] const std::set<Triple>& Triples() const noexcept { return triples_; }
    [[nodiscard]] const_iterator begin() const { return triples_.begin(); }
    [[nodiscard]] const_iterator end() const { return triples_.end(); }

    bool operator==(const Graph& other) const { return triples_ == other.triples_; }
    bool operator!=(const Graph& other) const { return triples_ != other.triples_; }

private:
    std::set<Triple> triples_;
};

} // namespace rdf_sync
