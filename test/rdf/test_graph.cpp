#include <catch2/catch_test_macros.hpp>

#include <rdf_sync/rdf/graph.hpp>

using namespace rdf_sync;

TEST_CASE("Graph: duplicates collapse", "[rdf][graph]") {
    Graph g;
    CHECK(g.Insert(Triple{Iri{"urn:s"}, Iri{"urn:p"}, MakeLiteral("o")}));
    CHECK_FALSE(g.Insert(Triple{Iri{"urn:s"}, Iri{"urn:p"}, MakeLiteral("o")}));
    CHECK(g.Size() == 1);
    CHECK_FALSE(g.Empty());
}

TEST_CASE("Graph: BlankNodeLabels collects subjects and objects", "[rdf][graph]") {
    Graph g;
    g.Insert(Triple{Iri{"urn:s"}, Iri{"urn:p"}, BlankNode{"a"}});
    g.Insert(Triple{BlankNode{"a"}, Iri{"urn:p"}, BlankNode{"b"}});
    g.Insert(Triple{Iri{"urn:s"}, Iri{"urn:q"}, MakeLiteral("_:c")});
    auto labels = g.BlankNodeLabels();
    CHECK(labels == std::set<std::string>{"a", "b"});
}

TEST_CASE("Graph: CountWithSubject", "[rdf][graph]") {
    Graph g;
    g.Insert(Triple{Iri{"urn:s"}, Iri{"urn:p"}, MakeLiteral("1")});
    g.Insert(Triple{Iri{"urn:s"}, Iri{"urn:p"}, MakeLiteral("2")});
    g.Insert(Triple{Iri{"urn:t"}, Iri{"urn:p"}, Iri{"urn:s"}});
    CHECK(g.CountWithSubject("urn:s") == 2);
    CHECK(g.CountWithSubject("urn:x") == 0);
}

TEST_CASE("Graph: Merge shares blank-node scope", "[rdf][graph]") {
    Graph a;
    a.Insert(Triple{BlankNode{"b"}, Iri{"urn:p"}, MakeLiteral("1")});
    Graph b;
    b.Insert(Triple{BlankNode{"b"}, Iri{"urn:p"}, MakeLiteral("2")});
    a.Merge(b);
    CHECK(a.Size() == 2);
    CHECK(a.BlankNodeLabels().size() == 1);
}

TEST_CASE("Graph: MergeRenamingBlanks keeps scopes apart", "[rdf][graph]") {
    Graph a;
    a.Insert(Triple{BlankNode{"b"}, Iri{"urn:p"}, MakeLiteral("1")});
    Graph b;
    b.Insert(Triple{BlankNode{"b"}, Iri{"urn:p"}, MakeLiteral("1")});
    b.Insert(Triple{Iri{"urn:s"}, Iri{"urn:p"}, BlankNode{"b"}});

    Graph u;
    u.MergeRenamingBlanks(a, "e0_");
    u.MergeRenamingBlanks(b, "e1_");
    CHECK(u.Size() == 3);
    CHECK(u.BlankNodeLabels() == std::set<std::string>{"e0_b", "e1_b"});
    CHECK(u.Contains(Triple{Iri{"urn:s"}, Iri{"urn:p"}, BlankNode{"e1_b"}}));
}
