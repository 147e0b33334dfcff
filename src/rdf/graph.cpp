#include <rdf_sync/rdf/graph.hpp>

namespace rdf_sync {

namespace {

Term RenameBlank(const Term& term, const std::string& prefix) {
    if (const auto* bn = std::get_if<BlankNode>(&term)) {
        return BlankNode{prefix + bn->label};
    }
    return term;
}

} // anonymous namespace

bool Graph::Insert(Triple triple) {
    return triples_.insert(std::move(triple)).second;
}

void Graph::Merge(const Graph& other) {
    triples_.insert(other.triples_.begin(), other.triples_.end());
}

void Graph::MergeRenamingBlanks(const Graph& other, const std::string& prefix) {
    for (const auto& t : other.triples_) {
        triples_.insert(Triple{RenameBlank(t.subject, prefix), t.predicate,
                               RenameBlank(t.object, prefix)});
    }
}

bool Graph::Contains(const Triple& triple) const {
    return triples_.count(triple) > 0;
}

std::set<std::string> Graph::BlankNodeLabels() const {
    std::set<std::string> labels;
    for (const auto& t : triples_) {
        if (const auto* s = std::get_if<BlankNode>(&t.subject)) {
            labels.insert(s->label);
        }
        if (const auto* o = std::get_if<BlankNode>(&t.object)) {
            labels.insert(o->label);
        }
    }
    return labels;
}

size_t Graph::CountWithSubject(const std::string& iri) const {
    size_t count = 0;
    for (const auto& t : triples_) {
        if (const auto* s = std::get_if<Iri>(&t.subject); s && s->value == iri) {
            ++count;
        }
    }
    return count;
}

} // namespace rdf_sync
