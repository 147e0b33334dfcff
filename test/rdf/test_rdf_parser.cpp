#include <catch2/catch_test_macros.hpp>

#include <rdf_sync/rdf/canonicalizer.hpp>
#include <rdf_sync/rdf/rdf_parser.hpp>

#include <fstream>
#include <sstream>
#include <string>

using namespace rdf_sync;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));    // .../test/rdf
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));     // .../test
    return test_root + "/testdata/" + filename;
}

std::string LoadFixture(const std::string& filename) {
    std::ifstream in(TestDataPath(filename), std::ios::binary);
    REQUIRE(in.is_open());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // anonymous namespace

TEST_CASE("RdfFormatFromContentType: known types", "[rdf][parser]") {
    CHECK(RdfFormatFromContentType("application/n-triples") == RdfFormat::NTriples);
    CHECK(RdfFormatFromContentType("text/plain; charset=utf-8") == RdfFormat::NTriples);
    CHECK(RdfFormatFromContentType("text/turtle;charset=UTF-8") == RdfFormat::Turtle);
    CHECK(RdfFormatFromContentType("Application/X-Turtle") == RdfFormat::Turtle);
    CHECK_FALSE(RdfFormatFromContentType("application/rdf+xml").has_value());
    CHECK_FALSE(RdfFormatFromContentType("").has_value());
}

TEST_CASE("RdfFormatMimeType", "[rdf][parser]") {
    CHECK(std::string(RdfFormatMimeType(RdfFormat::NTriples)) == "application/n-triples");
    CHECK(std::string(RdfFormatMimeType(RdfFormat::Turtle)) == "text/turtle");
}

TEST_CASE("ParseRdf: empty document yields empty graph", "[rdf][parser]") {
    auto r = ParseRdf("  \n\t", RdfFormat::NTriples);
    REQUIRE(r.IsOk());
    CHECK(r.Value().Empty());
}

TEST_CASE("ParseRdf: N-Triples literals are NFC-normalized", "[rdf][parser]") {
    auto r = ParseRdf(LoadFixture("cube_nfd.nt"), RdfFormat::NTriples);
    REQUIRE(r.IsOk());
    const auto& g = r.Value();
    CHECK(g.Size() == 5);
    CHECK(g.Contains(Triple{Iri{"https://example.org/cube/1"}, Iri{"http://schema.org/name"},
                            MakeLiteral("Pr\xC3\xA4vention Waldbr\xC3\xA4nde", "de")}));
    CHECK(g.Contains(Triple{Iri{"https://example.org/cube/1"}, Iri{"http://schema.org/name"},
                            MakeLiteral("Pr\xC3\xA9vention des feux", "fr")}));
}

TEST_CASE("ParseRdf: explicit xsd:string equals a simple literal", "[rdf][parser]") {
    auto r = ParseRdf(LoadFixture("cube_nfd.nt"), RdfFormat::NTriples);
    REQUIRE(r.IsOk());
    CHECK(r.Value().Contains(Triple{Iri{"https://example.org/cube/1"},
                                    Iri{"http://schema.org/identifier"},
                                    MakeLiteral("ffp")}));
}

TEST_CASE("ParseRdf: Turtle blank nodes and lists", "[rdf][parser]") {
    auto r = ParseRdf(LoadFixture("constraint_stardog.ttl"), RdfFormat::Turtle);
    REQUIRE(r.IsOk());
    const auto& g = r.Value();
    CHECK(g.Size() == 17);
    // Two property shapes plus two list cells.
    CHECK(g.BlankNodeLabels().size() == 4);
    CHECK(g.CountWithSubject("https://example.org/cube/1/shape") == 5);
}

TEST_CASE("ParseRdf: Turtle and N-Triples serializations are isomorphic", "[rdf][parser]") {
    auto st = ParseRdf(LoadFixture("constraint_stardog.ttl"), RdfFormat::Turtle);
    auto gdb = ParseRdf(LoadFixture("constraint_graphdb.nt"), RdfFormat::NTriples);
    REQUIRE(st.IsOk());
    REQUIRE(gdb.IsOk());
    CHECK(st.Value() != gdb.Value());
    CHECK(IsIsomorphic(st.Value(), gdb.Value()));
}

TEST_CASE("ParseRdf: relative IRIs resolve against the base", "[rdf][parser]") {
    auto r = ParseRdf("<a> <http://schema.org/name> \"x\" .", RdfFormat::Turtle,
                      "https://example.org/");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().Size() == 1);
    CHECK(r.Value().CountWithSubject("https://example.org/a") == 1);
}

TEST_CASE("ParseRdf: malformed N-Triples is a parse error with a line", "[rdf][parser]") {
    auto r = ParseRdf(LoadFixture("malformed.nt"), RdfFormat::NTriples);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Parse);
    CHECK(r.Error().message.find("Invalid N-Triples") == 0);
    CHECK(r.Error().message.find("line 2") != std::string::npos);
}

TEST_CASE("ParseRdf: malformed Turtle is a parse error", "[rdf][parser]") {
    auto r = ParseRdf("@prefix ex: <urn:ex:> .\nex:a ex:b ", RdfFormat::Turtle);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Parse);
    CHECK(r.Error().message.find("Invalid Turtle") == 0);
}
