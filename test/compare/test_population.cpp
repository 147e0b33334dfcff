#include <catch2/catch_test_macros.hpp>

#include <rdf_sync/compare/population.hpp>

#include "../mocks/mock_sparql_client.hpp"

using namespace rdf_sync;
using namespace rdf_sync::testing;

namespace {

constexpr const char* kGraph = "https://lindas.admin.ch/foen/forest-fire";
constexpr const char* kCube = "https://cube.link/Cube";

} // anonymous namespace

TEST_CASE("ComparePopulations: shared and one-sided members", "[compare][population]") {
    auto cmp = ComparePopulations({"urn:a", "urn:b"}, {"urn:b", "urn:c"});
    CHECK(cmp.shared == Population{"urn:b"});
    CHECK(cmp.only_left == Population{"urn:a"});
    CHECK(cmp.only_right == Population{"urn:c"});
    CHECK_FALSE(cmp.Matches());
}

TEST_CASE("ComparePopulations: equal populations match", "[compare][population]") {
    auto cmp = ComparePopulations({"urn:a", "urn:b"}, {"urn:a", "urn:b"});
    CHECK(cmp.Matches());
    CHECK(cmp.shared.size() == 2);
}

TEST_CASE("ComparePopulations: disjoint populations share nothing", "[compare][population]") {
    auto cmp = ComparePopulations({"urn:a"}, {"urn:z"});
    CHECK(cmp.shared.empty());
    CHECK(cmp.only_left.size() + cmp.only_right.size() == 2);
}

TEST_CASE("ComparePopulations: empty sides", "[compare][population]") {
    CHECK(ComparePopulations({}, {}).Matches());
    auto cmp = ComparePopulations({}, {"urn:a"});
    CHECK(cmp.only_right == Population{"urn:a"});
}

TEST_CASE("DiscoverPopulation: collects IRIs and queries the graph", "[compare][population]") {
    MockSparqlClient mock;
    mock.Enqueue(ItemsJson({"urn:b", "urn:a", "urn:b"}));

    auto r = DiscoverPopulation(mock, kGraph, kCube, std::chrono::seconds(120));
    REQUIRE(r.IsOk());
    CHECK(r.Value() == Population{"urn:a", "urn:b"});

    REQUIRE(mock.CallCount() == 1);
    const auto& call = mock.Calls()[0];
    CHECK(call.query.find("GRAPH <https://lindas.admin.ch/foen/forest-fire>") != std::string::npos);
    CHECK(call.query.find("?item a <https://cube.link/Cube>") != std::string::npos);
    CHECK(call.timeout == std::chrono::seconds(120));
}

TEST_CASE("DiscoverPopulation: skips non-IRI bindings", "[compare][population]") {
    MockSparqlClient mock;
    mock.Enqueue(Result<HttpResponse, Error>::Ok(HttpResponse{
        200, {{"Content-Type", "application/sparql-results+json"}},
        R"({"head":{"vars":["item"]},"results":{"bindings":[
            {"item":{"type":"uri","value":"urn:a"}},
            {"item":{"type":"bnode","value":"b1"}},
            {"item":{"type":"literal","value":"urn:c"}}]}})"}));
    auto r = DiscoverPopulation(mock, kGraph, kCube, std::chrono::seconds(5));
    REQUIRE(r.IsOk());
    CHECK(r.Value() == Population{"urn:a"});
}

TEST_CASE("DiscoverPopulation: empty result is an empty population", "[compare][population]") {
    MockSparqlClient mock;
    mock.Enqueue(ItemsJson({}));
    auto r = DiscoverPopulation(mock, kGraph, kCube, std::chrono::seconds(5));
    REQUIRE(r.IsOk());
    CHECK(r.Value().empty());
}

TEST_CASE("DiscoverPopulation: errors are attributed to discovery", "[compare][population]") {
    MockSparqlClient mock;
    mock.Enqueue(HttpStatus(503));
    auto r = DiscoverPopulation(mock, kGraph, kCube, std::chrono::seconds(5));
    REQUIRE(r.IsErr());
    CHECK(r.Error().operation == "DiscoverPopulation");
    CHECK(r.Error().category == ErrorCategory::Connection);
}
