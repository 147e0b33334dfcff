#include <rdf_sync/rdf/canonicalizer.hpp>

#include <rdf_sync/core/log.hpp>
#include <rdf_sync/rdf/ntriples_writer.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rdf_sync {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

constexpr uint64_t kOutgoingTag = 0x2B;     // '+'
constexpr uint64_t kIncomingTag = 0x2D;     // '-'
constexpr uint64_t kIndividualizeTag = 0x21; // '!'

class Fnv1a {
public:
    Fnv1a& Add(uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            hash_ ^= (value >> (i * 8)) & 0xFF;
            hash_ *= kFnvPrime;
        }
        return *this;
    }
    Fnv1a& Add(const std::string& s) {
        for (unsigned char c : s) {
            hash_ ^= c;
            hash_ *= kFnvPrime;
        }
        // Length terminator keeps "ab"+"c" apart from "a"+"bc".
        return Add(static_cast<uint64_t>(s.size()));
    }
    [[nodiscard]] uint64_t Value() const { return hash_; }

private:
    uint64_t hash_ = kFnvOffset;
};

// One edge as seen from a blank node. `other` is the index of a blank node
// or, when `other_blank` is false, unused in favor of `fixed_hash`.
struct Edge {
    uint64_t tag;
    uint64_t predicate_hash;
    bool other_blank;
    size_t other;
    uint64_t fixed_hash;
};

using Colors = std::vector<uint64_t>;

class Canonicalizer {
public:
    Canonicalizer(const Graph& graph, const CanonicalizerOptions& options)
        : graph_(graph), options_(options) {
        IndexBlankNodes();
    }

    CanonicalGraph Run() {
        CanonicalGraph result;
        if (labels_.empty()) {
            result.graph = graph_;
            return result;
        }

        Colors initial(labels_.size(), kFnvOffset);
        Search(std::move(initial));

        const Colors& best = best_->colors;
        result.graph = Relabel(best);
        for (size_t i = 0; i < labels_.size(); ++i) {
            result.mapping[labels_[i]] = LabelFor(best[i]);
        }
        result.complete = complete_;
        result.search_nodes = search_nodes_;

        LogDebug("canon", "Canonicalized " + std::to_string(graph_.Size()) +
                              " triples, " + std::to_string(labels_.size()) +
                              " blank nodes, " + std::to_string(search_nodes_) +
                              " refinements, " +
                              std::to_string(automorphisms_.size()) +
                              " automorphisms");
        if (!complete_) {
            LogWarn("canon", "Search budget of " +
                                 std::to_string(options_.max_search_triples) +
                                 " triples exhausted for " +
                                 std::to_string(labels_.size()) +
                                 " blank nodes; symmetric structures may be "
                                 "reported as different");
        }
        return result;
    }

private:
    void IndexBlankNodes() {
        for (const auto& label : graph_.BlankNodeLabels()) {
            index_.emplace(label, labels_.size());
            labels_.push_back(label);
        }
        edges_.resize(labels_.size());

        for (const auto& t : graph_) {
            const auto* s = std::get_if<BlankNode>(&t.subject);
            const auto* o = std::get_if<BlankNode>(&t.object);
            if (s == nullptr && o == nullptr) {
                continue;
            }
            blank_triples_.push_back(t);
            const uint64_t pred = Fnv1a().Add(t.predicate.value).Value();
            const uint64_t subject_fixed =
                s ? 0 : Fnv1a().Add(ToNTriples(t.subject)).Value();
            const uint64_t object_fixed =
                o ? 0 : Fnv1a().Add(ToNTriples(t.object)).Value();

            if (s != nullptr) {
                edges_[index_.at(s->label)].push_back(
                    Edge{kOutgoingTag, pred, o != nullptr,
                         o ? index_.at(o->label) : 0, object_fixed});
            }
            if (o != nullptr) {
                edges_[index_.at(o->label)].push_back(
                    Edge{kIncomingTag, pred, s != nullptr,
                         s ? index_.at(s->label) : 0, subject_fixed});
            }
        }
        // Every blank triple yields one or two edges; a refinement round
        // visits each edge and each node once.
        round_cost_ = 2 * blank_triples_.size() + labels_.size();
    }

    static size_t CountDistinct(const Colors& colors) {
        std::unordered_set<uint64_t> distinct(colors.begin(), colors.end());
        return distinct.size();
    }

    // Iterate until the number of color classes stops growing.
    Colors Refine(Colors colors) {
        ++search_nodes_;
        size_t classes = CountDistinct(colors);
        std::vector<uint64_t> signatures;

        for (size_t round = 0; round <= labels_.size(); ++round) {
            spent_ += round_cost_;
            Colors next(colors.size());
            for (size_t i = 0; i < colors.size(); ++i) {
                signatures.clear();
                for (const auto& e : edges_[i]) {
                    const uint64_t other =
                        e.other_blank ? colors[e.other] : e.fixed_hash;
                    signatures.push_back(Fnv1a()
                                             .Add(e.tag)
                                             .Add(e.predicate_hash)
                                             .Add(other)
                                             .Value());
                }
                std::sort(signatures.begin(), signatures.end());
                Fnv1a h;
                h.Add(colors[i]);
                for (uint64_t sig : signatures) {
                    h.Add(sig);
                }
                next[i] = h.Value();
            }
            const size_t next_classes = CountDistinct(next);
            colors = std::move(next);
            if (next_classes == classes) {
                break;
            }
            classes = next_classes;
        }
        return colors;
    }

    // Members of the non-singleton cell with the smallest color, in index
    // order. Empty if the coloring is discrete.
    static std::vector<size_t> FirstNonSingletonCell(const Colors& colors) {
        std::unordered_map<uint64_t, size_t> sizes;
        for (uint64_t c : colors) {
            ++sizes[c];
        }
        std::optional<uint64_t> target;
        for (const auto& [color, size] : sizes) {
            if (size > 1 && (!target.has_value() || color < *target)) {
                target = color;
            }
        }
        std::vector<size_t> cell;
        if (!target.has_value()) {
            return cell;
        }
        for (size_t i = 0; i < colors.size(); ++i) {
            if (colors[i] == *target) {
                cell.push_back(i);
            }
        }
        return cell;
    }

    static Colors Individualize(Colors colors, size_t member) {
        colors[member] = Fnv1a().Add(colors[member]).Add(kIndividualizeTag).Value();
        return colors;
    }

    [[nodiscard]] bool OverBudget() const {
        return spent_ >= options_.max_search_triples;
    }

    // Breaks every remaining tie by index order. Used once the budget is
    // spent so that a leaf exists without further branching.
    Colors Greedy(Colors colors) {
        for (size_t pass = 0; pass < labels_.size(); ++pass) {
            const auto cell = FirstNonSingletonCell(colors);
            if (cell.empty()) {
                break;
            }
            for (size_t k = 0; k < cell.size(); ++k) {
                colors[cell[k]] = Fnv1a()
                                      .Add(colors[cell[k]])
                                      .Add(kIndividualizeTag)
                                      .Add(static_cast<uint64_t>(k))
                                      .Value();
            }
            colors = Refine(std::move(colors));
        }
        return colors;
    }

    // Automorphisms that fix every node individualized on the current path.
    // Siblings in the same orbit under them lead to the same set of leaves.
    [[nodiscard]] bool SharesOrbit(size_t member,
                                   const std::vector<size_t>& explored) const {
        std::vector<size_t> parent(labels_.size());
        for (size_t i = 0; i < parent.size(); ++i) {
            parent[i] = i;
        }
        const auto find = [&parent](size_t x) {
            while (parent[x] != x) {
                parent[x] = parent[parent[x]];
                x = parent[x];
            }
            return x;
        };

        for (const auto& perm : automorphisms_) {
            const bool fixes_path =
                std::all_of(path_.begin(), path_.end(),
                            [&perm](size_t p) { return perm[p] == p; });
            if (!fixes_path) {
                continue;
            }
            for (size_t i = 0; i < perm.size(); ++i) {
                const size_t a = find(i);
                const size_t b = find(perm[i]);
                if (a != b) {
                    parent[a] = b;
                }
            }
        }

        const size_t root = find(member);
        return std::any_of(explored.begin(), explored.end(),
                           [&](size_t e) { return find(e) == root; });
    }

    void Search(Colors colors) {
        colors = Refine(std::move(colors));

        const auto cell = FirstNonSingletonCell(colors);
        if (cell.empty()) {
            ConsiderLeaf(colors);
            return;
        }
        if (OverBudget()) {
            complete_ = false;
            if (!best_.has_value()) {
                ConsiderLeaf(Greedy(std::move(colors)));
            }
            return;
        }

        const size_t depth = path_.size();
        std::vector<size_t> explored;
        for (size_t member : cell) {
            if (!explored.empty()) {
                if (OverBudget()) {
                    complete_ = false;
                    return;
                }
                if (SharesOrbit(member, explored)) {
                    continue;
                }
            }
            explored.push_back(member);
            path_.push_back(member);
            Search(Individualize(colors, member));
            path_.pop_back();

            if (backjump_.has_value()) {
                if (*backjump_ < depth) {
                    return;
                }
                backjump_.reset();
            }
        }
    }

    // Only triples touching a blank node can differ between leaves, so the
    // ground triples are left out of the comparison.
    void ConsiderLeaf(const Colors& colors) {
        spent_ += blank_triples_.size();
        Graph touched;
        for (const auto& t : blank_triples_) {
            touched.Insert(Triple{RelabelTerm(t.subject, colors), t.predicate,
                                  RelabelTerm(t.object, colors)});
        }
        auto serialized = SerializeNTriples(touched);

        if (!best_.has_value() || serialized < best_->serialized) {
            best_ = Leaf{std::move(serialized), colors, path_};
            return;
        }
        if (serialized != best_->serialized || !complete_) {
            return;
        }

        // Equal leaves: mapping each node of the best leaf to the node with
        // the same color here is an automorphism. It fixes the shared prefix
        // of both paths and maps the subtree at the point of divergence onto
        // one already searched.
        std::unordered_map<uint64_t, size_t> position;
        for (size_t i = 0; i < colors.size(); ++i) {
            position.emplace(colors[i], i);
        }
        std::vector<size_t> perm(colors.size());
        for (size_t i = 0; i < colors.size(); ++i) {
            perm[i] = position.at(best_->colors[i]);
        }
        automorphisms_.push_back(std::move(perm));

        size_t common = 0;
        while (common < path_.size() && common < best_->path.size() &&
               path_[common] == best_->path[common]) {
            ++common;
        }
        backjump_ = common;
    }

    static std::string LabelFor(uint64_t color) {
        char buf[20];
        std::snprintf(buf, sizeof(buf), "c%016llx",
                      static_cast<unsigned long long>(color));
        return buf;
    }

    Term RelabelTerm(const Term& term, const Colors& colors) const {
        if (const auto* bn = std::get_if<BlankNode>(&term)) {
            return BlankNode{LabelFor(colors[index_.at(bn->label)])};
        }
        return term;
    }

    Graph Relabel(const Colors& colors) const {
        Graph out;
        for (const auto& t : graph_) {
            out.Insert(Triple{RelabelTerm(t.subject, colors), t.predicate,
                              RelabelTerm(t.object, colors)});
        }
        return out;
    }

    const Graph& graph_;
    const CanonicalizerOptions& options_;

    std::vector<std::string> labels_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::vector<Edge>> edges_;

    std::vector<Triple> blank_triples_;
    size_t round_cost_ = 0;

    struct Leaf {
        std::string serialized;
        Colors colors;
        std::vector<size_t> path;
    };

    size_t search_nodes_ = 0;
    size_t spent_ = 0;
    bool complete_ = true;
    std::vector<size_t> path_;
    std::optional<Leaf> best_;
    std::vector<std::vector<size_t>> automorphisms_;
    std::optional<size_t> backjump_;
};

size_t CountBlankNodes(const Graph& g) {
    return g.BlankNodeLabels().size();
}

} // anonymous namespace

CanonicalGraph Canonicalize(const Graph& graph, const CanonicalizerOptions& options) {
    return Canonicalizer(graph, options).Run();
}

bool IsIsomorphic(const Graph& a, const Graph& b, const CanonicalizerOptions& options) {
    if (a.Size() != b.Size() || CountBlankNodes(a) != CountBlankNodes(b)) {
        return false;
    }
    return Canonicalize(a, options).graph == Canonicalize(b, options).graph;
}

} // namespace rdf_sync
