#pragma once

#include <rdf_sync/compare/entity_fetch.hpp>
#include <rdf_sync/compare/population.hpp>
#include <rdf_sync/compare/report.hpp>
#include <rdf_sync/core/result.hpp>
#include <rdf_sync/rdf/canonicalizer.hpp>
#include <rdf_sync/rdf/graph.hpp>
#include <rdf_sync/rdf/graph_diff.hpp>
#include <rdf_sync/sparql/i_sparql_client.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rdf_sync {

// ---------------------------------------------------------------------------
// RunState - states of one comparison run.
//
//   Idle -> Discovering -> PopulationCompared -> Aborted
//                                             -> Sampling -> Fetching
//        -> PerEntityComparing -> Reporting -> Done
//
// Whole-graph runs skip discovery: Idle -> Fetching -> PerEntityComparing
// -> Reporting -> Done.
// ---------------------------------------------------------------------------
enum class RunState {
    Idle,
    Discovering,
    PopulationCompared,
    Aborted,
    Sampling,
    Fetching,
    PerEntityComparing,
    Reporting,
    Done,
};

[[nodiscard]] const char* RunStateName(RunState state);

// ---------------------------------------------------------------------------
// RunVerdict - overall result of a completed run.
// ---------------------------------------------------------------------------
enum class RunVerdict {
    Identical,  // populations equal and every compared unit matched
    Different,  // a population difference, a mismatch, or an errored entity
    Aborted,    // no shared entities to compare
};

[[nodiscard]] const char* RunVerdictName(RunVerdict verdict);

// ---------------------------------------------------------------------------
// CompareRequest - parameters of one run. Left is the Stardog store, right
// the GraphDB store.
// ---------------------------------------------------------------------------
struct CompareRequest {
    std::string label = "comparison";  // used in logs and export file names
    CompareMode mode = CompareMode::EntityMetadata;
    std::string left_graph_iri;
    std::string right_graph_iri;
    std::string type_iri;                 // ignored in WholeGraph mode
    FilterSet filters;                    // ignored unless ModeUsesFilters
    std::optional<size_t> sample_size;    // nullopt: compare every shared entity
    uint64_t seed = 0;
    RdfFormat format = RdfFormat::NTriples;
    FetchTimeouts timeouts;
    bool parallel_discovery = false;
    CanonicalizerOptions canonicalizer;
};

// ---------------------------------------------------------------------------
// CompareOutcome - everything a completed run reports.
// ---------------------------------------------------------------------------
struct CompareOutcome {
    RunVerdict verdict = RunVerdict::Identical;
    std::vector<RunState> states;
    std::optional<PopulationComparison> population;  // entity modes only
    size_t sampled = 0;
    ComparisonReport report;
    Graph left_graph;   // union of everything fetched from the left store
    Graph right_graph;
    std::optional<GraphDiff> graph_diff;  // WholeGraph mode only
    std::chrono::milliseconds duration{0};

    [[nodiscard]] RunState FinalState() const {
        return states.empty() ? RunState::Idle : states.back();
    }

    /// 0 identical, 1 different, 2 aborted.
    [[nodiscard]] int ExitCode() const;
};

// ---------------------------------------------------------------------------
// CompareWorkflow - drives one run through RunState.
//
// Constructed fresh per run; holds no state beyond that run. Discovery
// errors and whole-graph fetch errors abort the run (Err, no report).
// Per-entity fetch or parse errors become Outcome::Error results and the
// run continues with the next entity.
//
// References to both clients must outlive this object. With
// parallel_discovery the two clients are used from different threads, one
// each.
// ---------------------------------------------------------------------------
class CompareWorkflow {
public:
    CompareWorkflow(ISparqlClient& left,
                    ISparqlClient& right,
                    const CompareRequest& request);

    CompareWorkflow(const CompareWorkflow&) = delete;
    CompareWorkflow& operator=(const CompareWorkflow&) = delete;
    CompareWorkflow(CompareWorkflow&&) = delete;
    CompareWorkflow& operator=(CompareWorkflow&&) = delete;

    [[nodiscard]] Result<CompareOutcome, Error> Execute();

    [[nodiscard]] RunState State() const noexcept { return state_; }
    [[nodiscard]] const std::vector<RunState>& States() const noexcept { return states_; }

private:
    void Transition(RunState next);

    Result<CompareOutcome, Error> ExecuteWholeGraph();
    Result<CompareOutcome, Error> ExecuteEntities();

    Result<PopulationComparison, Error> Discover();
    ComparisonResult CompareEntity(const std::string& iri, size_t index,
                                   CompareOutcome& outcome);
    FetchSpec SpecFor(const std::string& graph_iri) const;

    ISparqlClient& left_;
    ISparqlClient& right_;
    const CompareRequest& request_;
    RunState state_ = RunState::Idle;
    std::vector<RunState> states_;
};

/// Write the run's artifacts to `out_dir` (created if missing):
///   <label>_st.nt, <label>_gdb.nt, <label>_report.csv and, for whole-graph
///   runs with differences, <label>_only_st.nt and <label>_only_gdb.nt.
/// Returns the written paths.
[[nodiscard]] Result<std::vector<std::string>, Error> ExportOutcome(
    const CompareOutcome& outcome,
    const std::string& out_dir,
    const std::string& label);

} // namespace rdf_sync
