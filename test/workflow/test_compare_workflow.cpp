#include <catch2/catch_test_macros.hpp>

#include <rdf_sync/workflow/compare_workflow.hpp>
#include "../mocks/mock_sparql_client.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace rdf_sync;
using namespace rdf_sync::testing;

namespace {

constexpr const char* kLeftGraph = "https://lindas.admin.ch/foen/cube";
constexpr const char* kRightGraph = "https://lindas.admin.ch/foen/cube-migrated";
constexpr const char* kCubeType = "https://cube.link/Cube";

CompareRequest MakeRequest(CompareMode mode = CompareMode::EntityMetadata) {
    CompareRequest request;
    request.label = "cube";
    request.mode = mode;
    request.left_graph_iri = kLeftGraph;
    request.right_graph_iri = kRightGraph;
    request.type_iri = kCubeType;
    request.seed = 42;
    return request;
}

std::string NameTriple(const std::string& iri, const std::string& name) {
    return "<" + iri + "> <http://schema.org/name> \"" + name + "\" .\n";
}

// Enqueue the same entity body on both sides.
void EnqueueMatchingEntity(MockSparqlClient& left, MockSparqlClient& right,
                           const std::string& iri) {
    left.Enqueue(NTriples(NameTriple(iri, "same")));
    right.Enqueue(NTriples(NameTriple(iri, "same")));
}

std::vector<RunState> EntityRunStates() {
    return {RunState::Idle,     RunState::Discovering,
            RunState::PopulationCompared, RunState::Sampling,
            RunState::Fetching, RunState::PerEntityComparing,
            RunState::Reporting, RunState::Done};
}

} // anonymous namespace

// ===========================================================================
// Entity modes
// ===========================================================================

TEST_CASE("CompareWorkflow: identical stores", "[workflow][compare]") {
    MockSparqlClient left("https://stardog.example/query");
    MockSparqlClient right("https://graphdb.example/repositories/lindas");
    left.Enqueue(ItemsJson({"urn:cube:1", "urn:cube:2"}));
    right.Enqueue(ItemsJson({"urn:cube:2", "urn:cube:1"}));
    EnqueueMatchingEntity(left, right, "urn:cube:1");
    EnqueueMatchingEntity(left, right, "urn:cube:2");

    auto request = MakeRequest();
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    const auto& outcome = result.Value();
    CHECK(outcome.verdict == RunVerdict::Identical);
    CHECK(outcome.ExitCode() == 0);
    CHECK(outcome.states == EntityRunStates());
    CHECK(outcome.FinalState() == RunState::Done);
    REQUIRE(outcome.population.has_value());
    CHECK(outcome.population->shared.size() == 2);
    CHECK(outcome.sampled == 2);
    CHECK(outcome.report.Count(Outcome::Match) == 2);
    CHECK(outcome.left_graph.Size() == 2);
    CHECK(outcome.right_graph.Size() == 2);
    CHECK(left.Pending() == 0);
    CHECK(right.Pending() == 0);
}

TEST_CASE("CompareWorkflow: entity mismatch", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({"urn:cube:1"}));
    right.Enqueue(ItemsJson({"urn:cube:1"}));
    left.Enqueue(NTriples(NameTriple("urn:cube:1", "Forest fire")));
    right.Enqueue(NTriples(NameTriple("urn:cube:1", "Forest fires")));

    auto request = MakeRequest();
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    CHECK(result.Value().verdict == RunVerdict::Different);
    CHECK(result.Value().ExitCode() == 1);
    REQUIRE(result.Value().report.results.size() == 1);
    const auto& row = result.Value().report.results[0];
    CHECK(row.outcome == Outcome::Mismatch);
    CHECK(row.only_left_count == 1);
    CHECK(row.only_right_count == 1);
}

TEST_CASE("CompareWorkflow: population difference", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({"urn:a", "urn:b"}));
    right.Enqueue(ItemsJson({"urn:b", "urn:c"}));
    EnqueueMatchingEntity(left, right, "urn:b");

    auto request = MakeRequest();
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    const auto& outcome = result.Value();
    CHECK(outcome.verdict == RunVerdict::Different);
    REQUIRE(outcome.population.has_value());
    CHECK(outcome.population->only_left == Population{"urn:a"});
    CHECK(outcome.population->only_right == Population{"urn:c"});
    // Only the shared entity is fetched.
    REQUIRE(outcome.report.results.size() == 1);
    CHECK(outcome.report.results[0].iri == "urn:b");
    CHECK(outcome.report.results[0].outcome == Outcome::Match);
}

TEST_CASE("CompareWorkflow: no shared entities aborts", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({"urn:a"}));
    right.Enqueue(ItemsJson({}));

    auto request = MakeRequest();
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    CHECK(result.Value().verdict == RunVerdict::Aborted);
    CHECK(result.Value().ExitCode() == 2);
    CHECK(result.Value().FinalState() == RunState::Aborted);
    CHECK(result.Value().report.results.empty());
    CHECK(left.CallCount() == 1);
    CHECK(right.CallCount() == 1);
}

TEST_CASE("CompareWorkflow: discovery failure is an error", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(TransportError(ErrorCategory::Connection, "Connection refused"));

    auto request = MakeRequest();
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Connection);
    CHECK(workflow.State() == RunState::Discovering);
    // Sequential discovery stops before asking the second store.
    CHECK(right.CallCount() == 0);
}

TEST_CASE("CompareWorkflow: entity timeout continues the run", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({"urn:a", "urn:b"}));
    right.Enqueue(ItemsJson({"urn:a", "urn:b"}));
    // urn:a times out on the left only.
    left.Enqueue(TransportError(ErrorCategory::Timeout, "Query timed out after 60s"));
    right.Enqueue(NTriples(NameTriple("urn:a", "A")));
    EnqueueMatchingEntity(left, right, "urn:b");

    auto request = MakeRequest();
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    const auto& outcome = result.Value();
    CHECK(outcome.verdict == RunVerdict::Different);
    CHECK(outcome.FinalState() == RunState::Done);
    REQUIRE(outcome.report.results.size() == 2);
    const auto& errored = outcome.report.results[0];
    CHECK(errored.outcome == Outcome::Error);
    CHECK_FALSE(errored.match);
    CHECK(errored.error.find("[stardog]") != std::string::npos);
    CHECK(errored.error.find("urn:a") != std::string::npos);
    CHECK(errored.error.find("timed out") != std::string::npos);
    CHECK(errored.right_triple_count == 1);
    CHECK(outcome.report.results[1].outcome == Outcome::Match);
}

TEST_CASE("CompareWorkflow: sampling limits fetched entities", "[workflow][compare]") {
    MockSparqlClient left, right;
    std::vector<std::string> items = {"urn:o:1", "urn:o:2", "urn:o:3", "urn:o:4", "urn:o:5"};
    left.Enqueue(ItemsJson(items));
    right.Enqueue(ItemsJson(items));
    for (int i = 0; i < 2; ++i) {
        left.Enqueue(NTriples("<urn:x> <urn:p> \"v\" .\n"));
        right.Enqueue(NTriples("<urn:x> <urn:p> \"v\" .\n"));
    }

    auto request = MakeRequest(CompareMode::EntitySubject);
    request.sample_size = 2;
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    CHECK(result.Value().sampled == 2);
    CHECK(result.Value().report.results.size() == 2);
    CHECK(result.Value().verdict == RunVerdict::Identical);
    CHECK(left.CallCount() == 3);
    CHECK(right.CallCount() == 3);
}

TEST_CASE("CompareWorkflow: same seed samples the same entities", "[workflow][compare]") {
    std::vector<std::string> items;
    for (int i = 0; i < 20; ++i) items.push_back("urn:o:" + std::to_string(i));

    auto run = [&items] {
        MockSparqlClient left, right;
        left.Enqueue(ItemsJson(items));
        right.Enqueue(ItemsJson(items));
        for (int i = 0; i < 3; ++i) {
            left.Enqueue(NTriples(""));
            right.Enqueue(NTriples(""));
        }
        auto request = MakeRequest(CompareMode::EntitySubject);
        request.sample_size = 3;
        request.seed = 7;
        CompareWorkflow workflow(left, right, request);
        auto result = workflow.Execute();
        std::vector<std::string> iris;
        if (result.IsOk()) {
            for (const auto& r : result.Value().report.results) iris.push_back(r.iri);
        }
        return iris;
    };
    auto first = run();
    CHECK(first.size() == 3);
    CHECK(first == run());
}

TEST_CASE("CompareWorkflow: metadata mode sends filters", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({"urn:cube:1"}));
    right.Enqueue(ItemsJson({"urn:cube:1"}));
    left.Enqueue(NTriples(
        "<urn:cube:1> <http://purl.org/dc/terms/modified> \"2024-01-01\" .\n" +
        NameTriple("urn:cube:1", "Cube")));
    right.Enqueue(NTriples(
        "<urn:cube:1> <http://purl.org/dc/terms/modified> \"2024-06-30\" .\n" +
        NameTriple("urn:cube:1", "Cube")));

    auto request = MakeRequest();
    request.filters = {"http://purl.org/dc/terms/modified"};
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    CHECK(result.Value().verdict == RunVerdict::Identical);
    CHECK(left.Calls()[1].query.find("NOT IN") != std::string::npos);
    CHECK(right.Calls()[1].query.find("NOT IN") != std::string::npos);
}

TEST_CASE("CompareWorkflow: deep mode ignores filters", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({"urn:shape"}));
    right.Enqueue(ItemsJson({"urn:shape"}));
    left.Enqueue(NTriples("<urn:shape> <urn:p> _:b1 .\n_:b1 <urn:q> \"v\" .\n"));
    right.Enqueue(NTriples("<urn:shape> <urn:p> _:x .\n_:x <urn:q> \"v\" .\n"));

    auto request = MakeRequest(CompareMode::DeepSubgraph);
    request.filters = {"urn:q"};
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    CHECK(result.Value().verdict == RunVerdict::Identical);
    CHECK(result.Value().report.results[0].triple_count == 2);
    CHECK(left.Calls()[1].query.find("NOT IN") == std::string::npos);
    CHECK(left.Calls()[1].timeout == std::chrono::seconds(120));
}

TEST_CASE("CompareWorkflow: parallel discovery", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({"urn:a"}));
    right.Enqueue(ItemsJson({"urn:a"}));
    EnqueueMatchingEntity(left, right, "urn:a");

    auto request = MakeRequest();
    request.parallel_discovery = true;
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    CHECK(result.Value().verdict == RunVerdict::Identical);
    CHECK(left.CallCount() == 2);
    CHECK(right.CallCount() == 2);
}

TEST_CASE("CompareWorkflow: parallel discovery reports the failing side", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({"urn:a"}));
    right.Enqueue(HttpStatus(401, "Unauthorized"));

    auto request = MakeRequest();
    request.parallel_discovery = true;
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Authentication);
}

TEST_CASE("CompareWorkflow: runs once", "[workflow][compare]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({}));
    right.Enqueue(ItemsJson({}));

    auto request = MakeRequest();
    CompareWorkflow workflow(left, right, request);
    REQUIRE(workflow.Execute().IsOk());
    auto again = workflow.Execute();
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::Internal);
}

// ===========================================================================
// Whole-graph mode
// ===========================================================================

TEST_CASE("CompareWorkflow: whole graph identical up to blank labels", "[workflow][graph]") {
    MockSparqlClient left, right;
    left.Enqueue(NTriples("<urn:s> <urn:p> _:a .\n_:a <urn:q> \"x\" .\n"));
    right.Enqueue(NTriples("<urn:s> <urn:p> _:z .\n_:z <urn:q> \"x\" .\n"));

    auto request = MakeRequest(CompareMode::WholeGraph);
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    const auto& outcome = result.Value();
    CHECK(outcome.verdict == RunVerdict::Identical);
    CHECK_FALSE(outcome.population.has_value());
    CHECK(outcome.states == std::vector<RunState>{
        RunState::Idle, RunState::Fetching, RunState::PerEntityComparing,
        RunState::Reporting, RunState::Done});
    REQUIRE(outcome.graph_diff.has_value());
    CHECK(outcome.graph_diff->Identical());
    CHECK(left.Calls()[0].timeout == std::chrono::seconds(300));
}

TEST_CASE("CompareWorkflow: whole graph difference", "[workflow][graph]") {
    MockSparqlClient left, right;
    left.Enqueue(NTriples("<urn:s> <urn:p> \"1\" .\n<urn:s> <urn:q> \"kept\" .\n"));
    right.Enqueue(NTriples("<urn:s> <urn:p> \"2\" .\n<urn:s> <urn:q> \"kept\" .\n"
                           "<urn:t> <urn:p> \"3\" .\n"));

    auto request = MakeRequest(CompareMode::WholeGraph);
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsOk());
    const auto& outcome = result.Value();
    CHECK(outcome.verdict == RunVerdict::Different);
    REQUIRE(outcome.graph_diff.has_value());
    CHECK(outcome.graph_diff->only_left.Size() == 1);
    CHECK(outcome.graph_diff->only_right.Size() == 2);
    CHECK(outcome.graph_diff->shared.Size() == 1);
    REQUIRE(outcome.report.results.size() == 1);
    CHECK(outcome.report.results[0].iri == kLeftGraph);
    CHECK(outcome.report.results[0].triple_count == 2);
    CHECK(outcome.report.results[0].right_triple_count == 3);
}

TEST_CASE("CompareWorkflow: whole graph fetch failure", "[workflow][graph]") {
    MockSparqlClient left, right;
    left.Enqueue(NTriples("<urn:s> <urn:p> \"1\" .\n"));
    right.Enqueue(TransportError(ErrorCategory::Timeout, "Query timed out after 300s"));

    auto request = MakeRequest(CompareMode::WholeGraph);
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(result.Error().ExitCode() == 4);
}

// ===========================================================================
// Export
// ===========================================================================

TEST_CASE("ExportOutcome: entity run files", "[workflow][export]") {
    MockSparqlClient left, right;
    left.Enqueue(ItemsJson({"urn:a"}));
    right.Enqueue(ItemsJson({"urn:a"}));
    EnqueueMatchingEntity(left, right, "urn:a");

    auto request = MakeRequest();
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();
    REQUIRE(result.IsOk());

    auto dir = std::filesystem::temp_directory_path() / "rdf_sync_export_entities";
    std::filesystem::remove_all(dir);
    auto written = ExportOutcome(result.Value(), dir.string(), "cube");
    REQUIRE(written.IsOk());
    REQUIRE(written.Value().size() == 3);
    CHECK(std::filesystem::exists(dir / "cube_st.nt"));
    CHECK(std::filesystem::exists(dir / "cube_gdb.nt"));
    CHECK(std::filesystem::exists(dir / "cube_report.csv"));
    CHECK_FALSE(std::filesystem::exists(dir / "cube_only_st.nt"));
    std::filesystem::remove_all(dir);
}

TEST_CASE("ExportOutcome: whole graph differences", "[workflow][export]") {
    MockSparqlClient left, right;
    left.Enqueue(NTriples("<urn:s> <urn:p> \"1\" .\n"));
    right.Enqueue(NTriples("<urn:s> <urn:p> \"2\" .\n"));

    auto request = MakeRequest(CompareMode::WholeGraph);
    CompareWorkflow workflow(left, right, request);
    auto result = workflow.Execute();
    REQUIRE(result.IsOk());

    auto dir = std::filesystem::temp_directory_path() / "rdf_sync_export_graph";
    std::filesystem::remove_all(dir);
    auto written = ExportOutcome(result.Value(), dir.string(), "graph");
    REQUIRE(written.IsOk());
    CHECK(written.Value().size() == 5);
    CHECK(std::filesystem::exists(dir / "graph_only_st.nt"));
    CHECK(std::filesystem::exists(dir / "graph_only_gdb.nt"));
    std::filesystem::remove_all(dir);
}
