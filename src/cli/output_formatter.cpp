#include <rdf_sync/cli/output_formatter.hpp>
#include <rdf_sync/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace rdf_sync {

namespace {

using namespace rdf_sync::ansi;

// Populations larger than this are summarized in human output.
constexpr size_t kMaxListedEntities = 20;

const char* VerdictColor(RunVerdict verdict) {
    switch (verdict) {
        case RunVerdict::Identical: return kGreen;
        case RunVerdict::Different: return kRed;
        case RunVerdict::Aborted:   return kYellow;
    }
    return kReset;
}

nlohmann::json PopulationToJson(const Population& population) {
    auto arr = nlohmann::json::array();
    for (const auto& iri : population) {
        arr.push_back(iri);
    }
    return arr;
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto arr = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            arr.push_back(std::move(obj));
        }
        out_ << arr.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        table_data.insert(table_data.end(), rows.begin(), rows.end());

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c])) << headers[c];
    }
    out_ << "\n";
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << kBold << error.operation << kReset;
        if (!error.endpoint.empty()) {
            err_ << kDim << " [" << error.endpoint << "]" << kReset;
        }
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << *error.http_status << ")" << kReset;
        }
        err_ << "\n  " << error.message << "\n";
        if (error.server_error.has_value() && !error.server_error->empty()) {
            err_ << "  " << kDim << "Server: " << kReset << *error.server_error << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.endpoint.empty()) {
        err_ << " [" << error.endpoint << "]";
    }
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << *error.http_status << ")";
    }
    err_ << "\n  " << error.message << "\n";
    if (error.server_error.has_value() && !error.server_error->empty()) {
        err_ << "  Server: " << *error.server_error << "\n";
    }
}

// ---------------------------------------------------------------------------
// PrintOutcome
// ---------------------------------------------------------------------------
void OutputFormatter::PrintOutcome(const CompareRequest& request,
                                   const CompareOutcome& outcome,
                                   const std::vector<std::string>& exported) const {
    if (json_mode_) {
        PrintOutcomeJson(request, outcome, exported);
        return;
    }

    const char* bold = color_mode_ ? kBold : "";
    const char* dim = color_mode_ ? kDim : "";
    const char* reset = color_mode_ ? kReset : "";

    out_ << bold << request.label << reset << dim << " ("
         << CompareModeName(request.mode) << ")" << reset << "\n";
    out_ << "  Stardog graph: " << request.left_graph_iri << "\n";
    out_ << "  GraphDB graph: " << request.right_graph_iri << "\n";
    if (!request.type_iri.empty() && request.mode != CompareMode::WholeGraph) {
        out_ << "  Entity type:   " << request.type_iri << "\n";
    }
    out_ << "\n";

    if (outcome.population.has_value()) {
        const auto& pop = *outcome.population;
        out_ << bold << "Population" << reset << "\n";
        out_ << "  shared: " << pop.shared.size()
             << "  only in Stardog: " << pop.only_left.size()
             << "  only in GraphDB: " << pop.only_right.size() << "\n";
        auto list = [&](const Population& entities, const char* side) {
            size_t shown = 0;
            for (const auto& iri : entities) {
                if (shown++ == kMaxListedEntities) {
                    out_ << "    " << dim << "... " << entities.size() - kMaxListedEntities
                         << " more" << reset << "\n";
                    break;
                }
                out_ << "    " << side << " " << iri << "\n";
            }
        };
        list(pop.only_left, "<");
        list(pop.only_right, ">");
        if (outcome.sampled > 0 && outcome.sampled < pop.shared.size()) {
            out_ << "  sampled " << outcome.sampled << " of " << pop.shared.size()
                 << " shared entities (seed " << request.seed << ")\n";
        }
        out_ << "\n";
    }

    if (!outcome.report.results.empty()) {
        std::vector<std::vector<std::string>> rows;
        for (const auto& r : outcome.report.results) {
            std::string note = r.error;
            if (!r.complete && note.empty()) {
                note = "canonical search incomplete";
            }
            rows.push_back({r.iri, OutcomeName(r.outcome),
                            std::to_string(r.triple_count),
                            std::to_string(r.right_triple_count),
                            std::to_string(r.only_left_count),
                            std::to_string(r.only_right_count), note});
        }
        PrintTable({"IRI", "Outcome", "Stardog", "GraphDB", "Only Stardog",
                    "Only GraphDB", "Note"},
                   rows);
        out_ << "\n";
    }

    const auto& report = outcome.report;
    if (color_mode_) {
        out_ << VerdictColor(outcome.verdict);
    }
    out_ << RunVerdictName(outcome.verdict) << reset << ": "
         << report.Count(Outcome::Match) << " matched, "
         << report.Count(Outcome::Mismatch) << " mismatched, "
         << report.Count(Outcome::Error) << " errors"
         << dim << " (" << RunStateName(outcome.FinalState()) << ", "
         << outcome.duration.count() << "ms)" << reset << "\n";

    for (const auto& path : exported) {
        out_ << "  wrote " << path << "\n";
    }
}

void OutputFormatter::PrintOutcomeJson(const CompareRequest& request,
                                       const CompareOutcome& outcome,
                                       const std::vector<std::string>& exported) const {
    nlohmann::json j;
    j["label"] = request.label;
    j["mode"] = CompareModeName(request.mode);
    j["stardog_graph"] = request.left_graph_iri;
    j["graphdb_graph"] = request.right_graph_iri;
    if (request.mode != CompareMode::WholeGraph) {
        j["type"] = request.type_iri;
        j["seed"] = request.seed;
    }
    j["verdict"] = RunVerdictName(outcome.verdict);
    j["exit_code"] = outcome.ExitCode();

    auto states = nlohmann::json::array();
    for (auto s : outcome.states) {
        states.push_back(RunStateName(s));
    }
    j["states"] = std::move(states);

    if (outcome.population.has_value()) {
        const auto& pop = *outcome.population;
        j["population"] = {
            {"shared", pop.shared.size()},
            {"only_stardog", PopulationToJson(pop.only_left)},
            {"only_graphdb", PopulationToJson(pop.only_right)},
            {"sampled", outcome.sampled},
        };
    }

    auto results = nlohmann::json::array();
    for (const auto& r : outcome.report.results) {
        nlohmann::json row = {
            {"iri", r.iri},
            {"outcome", OutcomeName(r.outcome)},
            {"match", r.match},
            {"triples", r.triple_count},
            {"right_triples", r.right_triple_count},
            {"only_stardog", r.only_left_count},
            {"only_graphdb", r.only_right_count},
            {"complete", r.complete},
        };
        if (!r.error.empty()) {
            row["error"] = r.error;
        }
        results.push_back(std::move(row));
    }
    j["results"] = std::move(results);
    j["duration_ms"] = outcome.duration.count();
    j["exported"] = exported;

    out_ << j.dump() << "\n";
}

// ---------------------------------------------------------------------------
// PrintPresets
// ---------------------------------------------------------------------------
void OutputFormatter::PrintPresets(const AppConfig& config) const {
    if (json_mode_) {
        nlohmann::json j;
        auto endpoints = [](const std::vector<EndpointConfig>& list) {
            auto arr = nlohmann::json::array();
            for (const auto& ep : list) {
                arr.push_back({{"name", ep.name}, {"url", ep.url}});
            }
            return arr;
        };
        j["endpoints_stardog"] = endpoints(config.endpoints_stardog);
        j["endpoints_graphdb"] = endpoints(config.endpoints_graphdb);
        auto presets = nlohmann::json::array();
        for (const auto& p : config.presets) {
            presets.push_back({{"name", p.name},
                               {"st_graph", p.st_graph},
                               {"gdb_graph", p.gdb_graph},
                               {"default_filters", p.default_filters}});
        }
        j["presets"] = std::move(presets);
        j["filter_definitions"] = config.filter_definitions;
        out_ << j.dump() << "\n";
        return;
    }

    std::vector<std::vector<std::string>> endpoint_rows;
    for (const auto& ep : config.endpoints_stardog) {
        endpoint_rows.push_back({"stardog", ep.name, ep.url});
    }
    for (const auto& ep : config.endpoints_graphdb) {
        endpoint_rows.push_back({"graphdb", ep.name, ep.url});
    }
    PrintTable({"Store", "Name", "URL"}, endpoint_rows);
    out_ << "\n";

    std::vector<std::vector<std::string>> preset_rows;
    for (const auto& p : config.presets) {
        std::string filters;
        for (const auto& f : p.default_filters) {
            if (!filters.empty()) filters += ", ";
            filters += f;
        }
        preset_rows.push_back({p.name, p.st_graph, p.gdb_graph, filters});
    }
    PrintTable({"Preset", "Stardog graph", "GraphDB graph", "Filters"}, preset_rows);
    out_ << "\n";

    std::vector<std::vector<std::string>> filter_rows;
    for (const auto& [label, iri] : config.filter_definitions) {
        filter_rows.push_back({label, iri});
    }
    PrintTable({"Filter", "Predicate"}, filter_rows);
}

} // namespace rdf_sync
