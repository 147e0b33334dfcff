#include <rdf_sync/workflow/compare_workflow.hpp>

#include <rdf_sync/compare/sampler.hpp>
#include <rdf_sync/core/log.hpp>
#include <rdf_sync/core/types.hpp>
#include <rdf_sync/rdf/ntriples_writer.hpp>

#include <filesystem>
#include <future>
#include <random>
#include <system_error>

namespace rdf_sync {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string SideContext(StoreSide side, const std::string& iri, const Error& error) {
    return std::string("[") + StoreSideName(side) + "] <" + iri + ">: " +
           error.ToString();
}

} // namespace

const char* RunStateName(RunState state) {
    switch (state) {
        case RunState::Idle:               return "IDLE";
        case RunState::Discovering:        return "DISCOVERING";
        case RunState::PopulationCompared: return "POPULATION_COMPARED";
        case RunState::Aborted:            return "ABORTED";
        case RunState::Sampling:           return "SAMPLING";
        case RunState::Fetching:           return "FETCHING";
        case RunState::PerEntityComparing: return "PER_ENTITY_COMPARING";
        case RunState::Reporting:          return "REPORTING";
        case RunState::Done:               return "DONE";
    }
    return "UNKNOWN";
}

const char* RunVerdictName(RunVerdict verdict) {
    switch (verdict) {
        case RunVerdict::Identical: return "identical";
        case RunVerdict::Different: return "different";
        case RunVerdict::Aborted:   return "aborted";
    }
    return "unknown";
}

int CompareOutcome::ExitCode() const {
    switch (verdict) {
        case RunVerdict::Identical: return 0;
        case RunVerdict::Different: return 1;
        case RunVerdict::Aborted:   return 2;
    }
    return 99;
}

CompareWorkflow::CompareWorkflow(ISparqlClient& left,
                                 ISparqlClient& right,
                                 const CompareRequest& request)
    : left_(left), right_(right), request_(request) {
    states_.push_back(RunState::Idle);
}

void CompareWorkflow::Transition(RunState next) {
    LogDebug("workflow", std::string(RunStateName(state_)) + " -> " +
                             RunStateName(next));
    state_ = next;
    states_.push_back(next);
}

FetchSpec CompareWorkflow::SpecFor(const std::string& graph_iri) const {
    FetchSpec spec;
    spec.mode = request_.mode;
    spec.graph_iri = graph_iri;
    if (ModeUsesFilters(request_.mode)) {
        spec.filters = request_.filters;
    }
    spec.format = request_.format;
    spec.timeouts = request_.timeouts;
    return spec;
}

Result<CompareOutcome, Error> CompareWorkflow::Execute() {
    if (state_ != RunState::Idle) {
        return Result<CompareOutcome, Error>::Err(Error{
            "CompareWorkflow", "", std::nullopt,
            "A workflow object runs once; construct a new one per run",
            std::nullopt, ErrorCategory::Internal});
    }
    LogInfo("workflow", "Starting " + request_.label + " comparison (" +
                            CompareModeName(request_.mode) + " mode)");
    if (request_.mode == CompareMode::WholeGraph) {
        return ExecuteWholeGraph();
    }
    return ExecuteEntities();
}

Result<CompareOutcome, Error> CompareWorkflow::ExecuteWholeGraph() {
    const auto start = Clock::now();

    Transition(RunState::Fetching);
    auto left = FetchWholeGraph(left_, SpecFor(request_.left_graph_iri));
    if (left.IsErr()) {
        return Result<CompareOutcome, Error>::Err(left.Error());
    }
    auto right = FetchWholeGraph(right_, SpecFor(request_.right_graph_iri));
    if (right.IsErr()) {
        return Result<CompareOutcome, Error>::Err(right.Error());
    }

    Transition(RunState::PerEntityComparing);
    CompareOutcome outcome;
    outcome.left_graph = std::move(left).Value();
    outcome.right_graph = std::move(right).Value();
    auto diff = Diff(outcome.left_graph, outcome.right_graph, request_.canonicalizer);

    ComparisonResult row;
    row.iri = request_.left_graph_iri;
    row.match = diff.Identical();
    row.outcome = row.match ? Outcome::Match : Outcome::Mismatch;
    row.triple_count = outcome.left_graph.Size();
    row.right_triple_count = outcome.right_graph.Size();
    row.only_left_count = diff.only_left.Size();
    row.only_right_count = diff.only_right.Size();
    row.complete = diff.complete;
    outcome.report.results.push_back(row);
    outcome.sampled = 1;

    Transition(RunState::Reporting);
    outcome.verdict = row.match ? RunVerdict::Identical : RunVerdict::Different;
    if (row.match) {
        LogInfo("workflow", "Graphs are identical (" +
                                std::to_string(row.triple_count) + " triples)");
    } else {
        LogInfo("workflow", "Graph mismatch: " + std::to_string(row.only_left_count) +
                                " only in " + StoreSideName(StoreSide::Stardog) + ", " +
                                std::to_string(row.only_right_count) + " only in " +
                                StoreSideName(StoreSide::GraphDb));
    }
    outcome.graph_diff = std::move(diff);

    Transition(RunState::Done);
    outcome.states = states_;
    outcome.duration = Elapsed(start);
    return Result<CompareOutcome, Error>::Ok(std::move(outcome));
}

Result<PopulationComparison, Error> CompareWorkflow::Discover() {
    const auto timeout = request_.timeouts.discovery;
    const auto& type = request_.type_iri;

    Result<Population, Error> left = Result<Population, Error>::Ok(Population{});
    Result<Population, Error> right = Result<Population, Error>::Ok(Population{});

    if (request_.parallel_discovery) {
        auto left_future = std::async(std::launch::async, [&] {
            return DiscoverPopulation(left_, request_.left_graph_iri, type, timeout);
        });
        right = DiscoverPopulation(right_, request_.right_graph_iri, type, timeout);
        left = left_future.get();
    } else {
        left = DiscoverPopulation(left_, request_.left_graph_iri, type, timeout);
        if (left.IsErr()) {
            return Result<PopulationComparison, Error>::Err(left.Error());
        }
        right = DiscoverPopulation(right_, request_.right_graph_iri, type, timeout);
    }

    if (left.IsErr()) {
        return Result<PopulationComparison, Error>::Err(left.Error());
    }
    if (right.IsErr()) {
        return Result<PopulationComparison, Error>::Err(right.Error());
    }
    return Result<PopulationComparison, Error>::Ok(
        ComparePopulations(left.Value(), right.Value()));
}

ComparisonResult CompareWorkflow::CompareEntity(const std::string& iri, size_t index,
                                                CompareOutcome& outcome) {
    ComparisonResult row;
    row.iri = iri;

    auto left = FetchEntity(left_, SpecFor(request_.left_graph_iri), iri);
    auto right = FetchEntity(right_, SpecFor(request_.right_graph_iri), iri);

    const std::string scope = "e" + std::to_string(index) + "_";
    if (left.IsOk()) {
        row.triple_count = left.Value().Size();
        outcome.left_graph.MergeRenamingBlanks(left.Value(), scope);
    }
    if (right.IsOk()) {
        row.right_triple_count = right.Value().Size();
        outcome.right_graph.MergeRenamingBlanks(right.Value(), scope);
    }

    if (left.IsErr() || right.IsErr()) {
        row.outcome = Outcome::Error;
        row.match = false;
        if (left.IsErr()) {
            row.error = SideContext(StoreSide::Stardog, iri, left.Error());
        }
        if (right.IsErr()) {
            if (!row.error.empty()) row.error += "; ";
            row.error += SideContext(StoreSide::GraphDb, iri, right.Error());
        }
        LogWarn("workflow", row.error);
        return row;
    }

    const auto diff = Diff(left.Value(), right.Value(), request_.canonicalizer);
    row.match = diff.Identical();
    row.outcome = row.match ? Outcome::Match : Outcome::Mismatch;
    row.only_left_count = diff.only_left.Size();
    row.only_right_count = diff.only_right.Size();
    row.complete = diff.complete;
    if (!row.match) {
        LogInfo("workflow", "Mismatch for <" + iri + ">: " +
                                std::to_string(row.only_left_count) + " / " +
                                std::to_string(row.only_right_count) +
                                " unshared triples");
    }
    return row;
}

Result<CompareOutcome, Error> CompareWorkflow::ExecuteEntities() {
    const auto start = Clock::now();
    CompareOutcome outcome;

    Transition(RunState::Discovering);
    auto population = Discover();
    if (population.IsErr()) {
        return Result<CompareOutcome, Error>::Err(population.Error());
    }

    Transition(RunState::PopulationCompared);
    outcome.population = std::move(population).Value();
    const auto& pop = *outcome.population;
    if (!pop.Matches()) {
        LogWarn("workflow", "Population mismatch: " +
                                std::to_string(pop.only_left.size()) + " only in " +
                                StoreSideName(StoreSide::Stardog) + ", " +
                                std::to_string(pop.only_right.size()) + " only in " +
                                StoreSideName(StoreSide::GraphDb));
    }

    if (pop.shared.empty()) {
        Transition(RunState::Aborted);
        LogWarn("workflow", "No shared entities of <" + request_.type_iri +
                                ">; nothing to compare");
        outcome.verdict = RunVerdict::Aborted;
        outcome.states = states_;
        outcome.duration = Elapsed(start);
        return Result<CompareOutcome, Error>::Ok(std::move(outcome));
    }

    Transition(RunState::Sampling);
    std::vector<std::string> entities;
    if (request_.sample_size.has_value()) {
        std::mt19937_64 rng(request_.seed);
        entities = SampleEntities(pop.shared, *request_.sample_size, rng);
        if (entities.size() < pop.shared.size()) {
            LogInfo("workflow", "Sampling " + std::to_string(entities.size()) +
                                    " of " + std::to_string(pop.shared.size()) +
                                    " shared entities");
        }
    } else {
        entities.assign(pop.shared.begin(), pop.shared.end());
    }
    outcome.sampled = entities.size();

    Transition(RunState::Fetching);
    Transition(RunState::PerEntityComparing);
    for (size_t i = 0; i < entities.size(); ++i) {
        LogDebug("workflow", "Checking " + std::to_string(i + 1) + "/" +
                                 std::to_string(entities.size()) + ": <" +
                                 entities[i] + ">");
        outcome.report.results.push_back(CompareEntity(entities[i], i, outcome));
    }

    Transition(RunState::Reporting);
    const bool all_matched = outcome.report.AllMatched();
    outcome.verdict = (pop.Matches() && all_matched) ? RunVerdict::Identical
                                                     : RunVerdict::Different;
    LogInfo("workflow", request_.label + ": " +
                            std::to_string(outcome.report.Count(Outcome::Match)) +
                            " matched, " +
                            std::to_string(outcome.report.Count(Outcome::Mismatch)) +
                            " mismatched, " +
                            std::to_string(outcome.report.Count(Outcome::Error)) +
                            " errored");

    Transition(RunState::Done);
    outcome.states = states_;
    outcome.duration = Elapsed(start);
    return Result<CompareOutcome, Error>::Ok(std::move(outcome));
}

Result<std::vector<std::string>, Error> ExportOutcome(const CompareOutcome& outcome,
                                                      const std::string& out_dir,
                                                      const std::string& label) {
    namespace fs = std::filesystem;
    using R = Result<std::vector<std::string>, Error>;

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        return R::Err(Error{"ExportOutcome", "", std::nullopt,
                            "Cannot create output directory " + out_dir + ": " +
                                ec.message(),
                            std::nullopt, ErrorCategory::Internal});
    }

    std::vector<std::string> written;
    auto path_for = [&](const std::string& suffix) {
        return (fs::path(out_dir) / (label + suffix)).string();
    };
    auto write_graph = [&](const Graph& graph, const std::string& suffix) {
        const auto path = path_for(suffix);
        auto result = WriteNTriplesFile(graph, path);
        if (result.IsOk()) written.push_back(path);
        return result;
    };

    if (auto r = write_graph(outcome.left_graph, "_st.nt"); r.IsErr()) {
        return R::Err(r.Error());
    }
    if (auto r = write_graph(outcome.right_graph, "_gdb.nt"); r.IsErr()) {
        return R::Err(r.Error());
    }
    if (outcome.graph_diff.has_value() && !outcome.graph_diff->Identical()) {
        if (auto r = write_graph(outcome.graph_diff->only_left, "_only_st.nt"); r.IsErr()) {
            return R::Err(r.Error());
        }
        if (auto r = write_graph(outcome.graph_diff->only_right, "_only_gdb.nt"); r.IsErr()) {
            return R::Err(r.Error());
        }
    }

    const auto csv = path_for("_report.csv");
    if (auto r = WriteCsvReport(outcome.report, csv); r.IsErr()) {
        return R::Err(r.Error());
    }
    written.push_back(csv);

    for (const auto& path : written) {
        LogInfo("workflow", "Wrote " + path);
    }
    return R::Ok(std::move(written));
}

} // namespace rdf_sync
