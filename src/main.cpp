#include <rdf_sync/cli/output_formatter.hpp>
#include <rdf_sync/config/config_loader.hpp>
#include <rdf_sync/core/log.hpp>
#include <rdf_sync/core/terminal.hpp>
#include <rdf_sync/core/url.hpp>
#include <rdf_sync/core/version.hpp>
#include <rdf_sync/sparql/sparql_client.hpp>
#include <rdf_sync/workflow/compare_workflow.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig = 7;

void PrintUsage(std::ostream& out) {
    out << "rdf-sync " << rdf_sync::kVersion << "\n"
        << "Compare RDF data between a Stardog and a GraphDB SPARQL endpoint.\n\n"
        << "Usage: rdf-sync <command> [options]\n\n"
        << "Commands:\n"
        << "  graph        Compare a whole named graph (filtered)\n"
        << "  cube         Compare cube:Cube metadata (filtered)\n"
        << "  observation  Compare sampled cube:Observation subject triples\n"
        << "  constraint   Compare cube:Constraint shapes with their blank nodes\n"
        << "  entities     Compare entities of --type in --mode metadata|subject|deep\n"
        << "  presets      List endpoints, presets and filter labels\n\n"
        << "Options:\n"
        << "  -c, --config <file>     YAML presets file\n"
        << "  --preset <name>         Preset (pair of graph IRIs)\n"
        << "  --stardog <name|url>    Stardog endpoint\n"
        << "  --graphdb <name|url>    GraphDB endpoint\n"
        << "  --st-graph <iri>        Stardog named graph\n"
        << "  --gdb-graph <iri>       GraphDB named graph\n"
        << "  --exclude <label|iri>   Exclude a predicate (repeatable)\n"
        << "  --no-default-filters    Ignore the preset's filters\n"
        << "  --type <iri>            Entity type (entities)\n"
        << "  --mode <mode>           metadata | subject | deep (entities)\n"
        << "  --sample-size <n>       Max shared entities compared (default 100)\n"
        << "  --seed <n>              Sampling seed\n"
        << "  --format nt|ttl         RDF format requested from the stores\n"
        << "  --timeout <seconds>     Timeout for every request\n"
        << "  --parallel-discovery    Discover both populations concurrently\n"
        << "  --post                  Send queries as form POST\n"
        << "  --user <name>           HTTP basic auth user\n"
        << "  --password-env <var>    Variable holding the password\n"
        << "  --out-dir <dir>         Export .nt and .csv files\n"
        << "  --json                  JSON output\n"
        << "  --color / --no-color    Force or disable colors\n"
        << "  --log-file <file>       Append JSON log lines to a file\n"
        << "  -v, -vv                 Info / debug logging\n"
        << "  --version               Print version\n\n"
        << "Exit codes: 0 identical, 1 different, 2 aborted, 3 connection,\n"
        << "  4 timeout, 5 HTTP error, 6 parse error, 7 config error,\n"
        << "  8 canonicalization, 99 internal.\n";
}

bool HasFlag(int argc, const char* const* argv, std::string_view a,
             std::string_view b = {}) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == a || (!b.empty() && arg == b)) return true;
    }
    return false;
}

// -c/--config value, or empty.
std::string FindConfigPath(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.substr(0, 9) == "--config=") {
            return std::string(arg.substr(9));
        }
    }
    return "";
}

// Build argv without the command token, so LoadFromCli sees plain flags.
std::vector<const char*> StripCommand(int argc, const char* const* argv) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
        stripped.push_back(argv[i]);
    }
    return stripped;
}

rdf_sync::LogLevel LevelFor(int verbosity) {
    if (verbosity >= 2) return rdf_sync::LogLevel::Debug;
    if (verbosity == 1) return rdf_sync::LogLevel::Info;
    return rdf_sync::LogLevel::Warn;
}

void InitLogging(const rdf_sync::AppConfig& config) {
    using namespace rdf_sync;
    const bool use_color = ResolveColor(config.color, config.no_color, IsStderrTty());
    auto console = std::make_unique<ColorConsoleSink>(use_color);
    if (!config.log_file.has_value()) {
        InitGlobalLogger(std::move(console), LevelFor(config.verbosity));
        return;
    }
    auto tee = std::make_unique<TeeSink>();
    tee->Add(std::move(console));
    auto file = std::make_unique<JsonFileSink>(*config.log_file);
    const bool opened = file->IsOpen();
    tee->Add(std::move(file));
    InitGlobalLogger(std::move(tee), LevelFor(config.verbosity));
    if (!opened) {
        LogWarn("main", "Cannot open log file " + *config.log_file);
    }
}

rdf_sync::Result<rdf_sync::EndpointUrl, rdf_sync::Error> ParseEndpoint(
    const rdf_sync::EndpointConfig& endpoint) {
    using R = rdf_sync::Result<rdf_sync::EndpointUrl, rdf_sync::Error>;
    auto url = rdf_sync::ParseEndpointUrl(endpoint.url);
    if (url.IsErr()) {
        return R::Err(rdf_sync::Error{"ConfigLoader", endpoint.url, std::nullopt,
                                      "Endpoint '" + endpoint.name + "': " + url.Error(),
                                      std::nullopt, rdf_sync::ErrorCategory::Config});
    }
    return R::Ok(std::move(url).Value());
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace rdf_sync;

    if (argc == 1) {
        PrintUsage(std::cout);
        return kExitSuccess;
    }
    if (HasFlag(argc, argv, "--version")) {
        std::cout << "rdf-sync " << kVersion << "\n";
        return kExitSuccess;
    }
    if (HasFlag(argc, argv, "--help", "-h")) {
        PrintUsage(std::cout);
        return kExitSuccess;
    }

    const bool json_output = HasFlag(argc, argv, "--json");
    const bool stdout_color = !json_output &&
        ResolveColor(HasFlag(argc, argv, "--color"), HasFlag(argc, argv, "--no-color"),
                     IsStdoutTty());
    OutputFormatter formatter(json_output, stdout_color);

    auto command = ParseCommand(argv[1]);
    if (!command.has_value()) {
        formatter.PrintError(Error{"ConfigLoader", "", std::nullopt,
                                   "Unknown command '" + std::string(argv[1]) +
                                       "' (see rdf-sync --help)",
                                   std::nullopt, ErrorCategory::Config});
        return kExitConfig;
    }

    auto stripped = StripCommand(argc, argv);
    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli_result.IsErr()) {
        formatter.PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto cli_config = std::move(cli_result).Value();
    InitLogging(cli_config);

    // Catalog: YAML file if given, built-in LINDAS catalog otherwise.
    AppConfig base;
    const auto config_path = FindConfigPath(argc, argv);
    if (!config_path.empty()) {
        auto yaml_result = LoadFromYaml(config_path);
        if (yaml_result.IsErr()) {
            formatter.PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        base = std::move(yaml_result).Value();
    } else {
        base = BuiltinCatalog();
    }
    auto merged = MergeConfigs(base, cli_config);
    if (merged.log_file != cli_config.log_file) {
        InitLogging(merged);
    }

    auto resolved = ResolvePasswordEnv(std::move(merged));
    if (resolved.IsErr()) {
        formatter.PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }
    const auto config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        formatter.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    if (*command == Command::Presets) {
        formatter.PrintPresets(config);
        return kExitSuccess;
    }

    auto run_result = ResolveSelection(config, *command);
    if (run_result.IsErr()) {
        formatter.PrintError(run_result.Error());
        return run_result.Error().ExitCode();
    }
    const auto run = std::move(run_result).Value();

    SparqlClientOptions client_opts;
    client_opts.use_post = config.use_post;
    if (config.user.has_value()) {
        client_opts.user = config.user;
        client_opts.password = config.password;
    }

    auto stardog_url = ParseEndpoint(run.stardog);
    if (stardog_url.IsErr()) {
        formatter.PrintError(stardog_url.Error());
        return stardog_url.Error().ExitCode();
    }
    auto graphdb_url = ParseEndpoint(run.graphdb);
    if (graphdb_url.IsErr()) {
        formatter.PrintError(graphdb_url.Error());
        return graphdb_url.Error().ExitCode();
    }

    LogInfo("main", "Comparing " + run.stardog.name + " (" + run.stardog.url +
                        ") with " + run.graphdb.name + " (" + run.graphdb.url + ")");
    SparqlClient stardog(stardog_url.Value(), client_opts);
    SparqlClient graphdb(graphdb_url.Value(), client_opts);

    CompareWorkflow workflow(stardog, graphdb, run.request);
    auto result = workflow.Execute();
    if (result.IsErr()) {
        formatter.PrintError(result.Error());
        return result.Error().ExitCode();
    }
    const auto outcome = std::move(result).Value();

    std::vector<std::string> exported;
    if (config.out_dir.has_value()) {
        auto written = ExportOutcome(outcome, *config.out_dir, run.request.label);
        if (written.IsErr()) {
            formatter.PrintOutcome(run.request, outcome);
            formatter.PrintError(written.Error());
            return written.Error().ExitCode();
        }
        exported = std::move(written).Value();
    }

    formatter.PrintOutcome(run.request, outcome, exported);
    return outcome.ExitCode();
}
