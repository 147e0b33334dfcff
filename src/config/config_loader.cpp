#include <rdf_sync/config/config_loader.hpp>

#include <rdf_sync/core/log.hpp>
#include <rdf_sync/core/types.hpp>
#include <rdf_sync/core/url.hpp>
#include <rdf_sync/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <random>
#include <set>

namespace rdf_sync {

namespace {

constexpr const char* kCubeType = "https://cube.link/Cube";
constexpr const char* kObservationType = "https://cube.link/Observation";
constexpr const char* kConstraintType = "https://cube.link/Constraint";

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

Result<std::vector<EndpointConfig>, Error> ParseYamlEndpoints(
    const YAML::Node& node, const std::string& key) {
    std::vector<EndpointConfig> endpoints;
    if (!node.IsSequence()) {
        return Result<std::vector<EndpointConfig>, Error>::Err(
            MakeConfigError("'" + key + "' must be a list"));
    }
    for (const auto& entry : node) {
        if (!entry["name"] || !entry["url"]) {
            return Result<std::vector<EndpointConfig>, Error>::Err(
                MakeConfigError("Entry in '" + key + "' needs 'name' and 'url'"));
        }
        endpoints.push_back(EndpointConfig{entry["name"].as<std::string>(),
                                           entry["url"].as<std::string>()});
    }
    return Result<std::vector<EndpointConfig>, Error>::Ok(std::move(endpoints));
}

Result<PresetConfig, Error> ParseYamlPreset(const YAML::Node& node) {
    if (!node["name"]) {
        return Result<PresetConfig, Error>::Err(
            MakeConfigError("Preset entry missing 'name' field"));
    }
    PresetConfig preset;
    preset.name = node["name"].as<std::string>();
    if (node["st_graph"]) {
        preset.st_graph = node["st_graph"].as<std::string>();
    }
    if (node["gdb_graph"]) {
        preset.gdb_graph = node["gdb_graph"].as<std::string>();
    }
    if (node["default_filters"]) {
        for (const auto& label : node["default_filters"]) {
            preset.default_filters.push_back(label.as<std::string>());
        }
    }
    return Result<PresetConfig, Error>::Ok(std::move(preset));
}

// Endpoint by name, or the value itself when it is a URL. An empty
// selection picks the first configured endpoint.
Result<EndpointConfig, Error> ResolveEndpoint(
    const std::vector<EndpointConfig>& endpoints,
    const std::optional<std::string>& selection,
    const char* kind) {
    if (!selection.has_value()) {
        if (endpoints.empty()) {
            return Result<EndpointConfig, Error>::Err(MakeConfigError(
                std::string("No ") + kind + " endpoint configured"));
        }
        return Result<EndpointConfig, Error>::Ok(endpoints.front());
    }
    for (const auto& ep : endpoints) {
        if (ep.name == *selection) {
            return Result<EndpointConfig, Error>::Ok(ep);
        }
    }
    if (ParseEndpointUrl(*selection).IsOk()) {
        return Result<EndpointConfig, Error>::Ok(EndpointConfig{*selection, *selection});
    }
    return Result<EndpointConfig, Error>::Err(MakeConfigError(
        std::string("Unknown ") + kind + " endpoint '" + *selection +
        "' (not a configured name or an http(s) URL)"));
}

Result<std::string, Error> ResolveFilter(const AppConfig& config,
                                         const std::string& entry) {
    auto it = config.filter_definitions.find(entry);
    if (it != config.filter_definitions.end()) {
        return Result<std::string, Error>::Ok(it->second);
    }
    if (IriRef::Create(entry).IsOk()) {
        return Result<std::string, Error>::Ok(entry);
    }
    return Result<std::string, Error>::Err(MakeConfigError(
        "Unknown filter '" + entry + "' (not a filter label or an IRI)"));
}

Result<std::string, Error> RequireIri(const std::string& value, const std::string& what) {
    if (value.empty()) {
        return Result<std::string, Error>::Err(MakeConfigError("Missing " + what));
    }
    auto iri = IriRef::Create(value);
    if (iri.IsErr()) {
        return Result<std::string, Error>::Err(
            MakeConfigError("Invalid " + what + ": " + iri.Error()));
    }
    return Result<std::string, Error>::Ok(iri.Value().Value());
}

uint64_t RandomSeed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        if (root["endpoints_stardog"]) {
            auto eps = ParseYamlEndpoints(root["endpoints_stardog"], "endpoints_stardog");
            if (eps.IsErr()) return Result<AppConfig, Error>::Err(eps.Error());
            config.endpoints_stardog = std::move(eps).Value();
        }
        if (root["endpoints_graphdb"]) {
            auto eps = ParseYamlEndpoints(root["endpoints_graphdb"], "endpoints_graphdb");
            if (eps.IsErr()) return Result<AppConfig, Error>::Err(eps.Error());
            config.endpoints_graphdb = std::move(eps).Value();
        }

        if (root["presets"]) {
            for (const auto& preset_node : root["presets"]) {
                auto preset = ParseYamlPreset(preset_node);
                if (preset.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(preset).Error());
                }
                config.presets.push_back(std::move(preset).Value());
            }
        }

        if (root["filter_definitions"]) {
            for (const auto& kv : root["filter_definitions"]) {
                config.filter_definitions[kv.first.as<std::string>()] =
                    kv.second.as<std::string>();
            }
        }

        if (root["sample_size"]) {
            const auto n = root["sample_size"].as<long long>();
            if (n < 0) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("sample_size must not be negative"));
            }
            config.sample_size = static_cast<size_t>(n);
        }

        if (const auto t = root["timeouts"]) {
            if (t["entity"]) config.timeouts.entity = std::chrono::seconds(t["entity"].as<int>());
            if (t["discovery"]) config.timeouts.discovery = std::chrono::seconds(t["discovery"].as<int>());
            if (t["deep"]) config.timeouts.deep = std::chrono::seconds(t["deep"].as<int>());
            if (t["graph"]) config.timeouts.graph = std::chrono::seconds(t["graph"].as<int>());
        }

        // -- Options --
        if (root["user"]) {
            config.user = root["user"].as<std::string>();
        }
        if (root["password_env"]) {
            config.password_env = root["password_env"].as<std::string>();
        }
        if (root["parallel_discovery"]) {
            config.parallel_discovery = root["parallel_discovery"].as<bool>();
        }
        if (root["use_post"]) {
            config.use_post = root["use_post"].as<bool>();
        }
        if (root["out_dir"]) {
            config.out_dir = root["out_dir"].as<std::string>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " +
                            std::string(e.what())));
    }

    LogInfo("config", "Loaded " + std::to_string(config.presets.size()) +
                          " presets from " + std::string(file_path));
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("rdf-sync", kVersion,
                                     argparse::default_arguments::none);

    // Selection
    program.add_argument("-c", "--config")
        .help("Path to YAML presets file");
    program.add_argument("--preset")
        .help("Preset name (pair of graph IRIs)");
    program.add_argument("--stardog")
        .help("Stardog endpoint name or URL");
    program.add_argument("--graphdb")
        .help("GraphDB endpoint name or URL");
    program.add_argument("--st-graph")
        .help("Named graph IRI in Stardog");
    program.add_argument("--gdb-graph")
        .help("Named graph IRI in GraphDB");
    program.add_argument("--exclude")
        .help("Predicate to exclude (filter label or IRI), repeatable")
        .append();
    program.add_argument("--no-default-filters")
        .help("Ignore the preset's default filters")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--type")
        .help("Entity rdf:type IRI (entities command)");
    program.add_argument("--mode")
        .help("metadata | subject | deep (entities command)");
    program.add_argument("--sample-size")
        .help("Maximum number of shared entities compared triple by triple")
        .scan<'i', int>();
    program.add_argument("--seed")
        .help("Sampling seed")
        .scan<'u', unsigned long long>();
    program.add_argument("--format")
        .help("RDF format requested from the stores: nt | ttl");

    // Transport
    program.add_argument("--timeout")
        .help("Timeout in seconds for every request")
        .scan<'i', int>();
    program.add_argument("--parallel-discovery")
        .help("Discover both populations concurrently")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--post")
        .help("Always send queries as form POST")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--user")
        .help("HTTP basic auth user");
    program.add_argument("--password-env")
        .help("Environment variable containing the HTTP basic auth password");

    // Output
    program.add_argument("--out-dir")
        .help("Directory for .nt and .csv exports");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append JSON log lines to this file");
    program.add_argument("-v", "--verbose")
        .help("Info logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    // Selection
    if (auto val = program.present("--preset")) config.preset = *val;
    if (auto val = program.present("--stardog")) config.stardog = *val;
    if (auto val = program.present("--graphdb")) config.graphdb = *val;
    if (auto val = program.present("--st-graph")) config.st_graph = *val;
    if (auto val = program.present("--gdb-graph")) config.gdb_graph = *val;
    if (auto val = program.present<std::vector<std::string>>("--exclude")) {
        config.excludes = *val;
    }
    config.no_default_filters = program.get<bool>("--no-default-filters");
    if (auto val = program.present("--type")) config.type_iri = *val;
    if (auto val = program.present("--mode")) {
        auto mode = ParseCompareMode(*val);
        if (!mode.has_value() || *mode == CompareMode::WholeGraph) {
            return Result<AppConfig, Error>::Err(MakeConfigError(
                "Invalid --mode '" + *val + "' (expected metadata, subject or deep)"));
        }
        config.mode = *mode;
    }
    if (auto val = program.present<int>("--sample-size")) {
        if (*val < 0) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("--sample-size must not be negative"));
        }
        config.sample_size = static_cast<size_t>(*val);
    }
    if (auto val = program.present<unsigned long long>("--seed")) {
        config.seed = static_cast<uint64_t>(*val);
    }
    if (auto val = program.present("--format")) {
        if (*val == "nt" || *val == "ntriples") {
            config.format = RdfFormat::NTriples;
        } else if (*val == "ttl" || *val == "turtle") {
            config.format = RdfFormat::Turtle;
        } else {
            return Result<AppConfig, Error>::Err(MakeConfigError(
                "Invalid --format '" + *val + "' (expected nt or ttl)"));
        }
    }

    // Transport
    if (auto val = program.present<int>("--timeout")) config.timeout_seconds = *val;
    config.parallel_discovery = program.get<bool>("--parallel-discovery");
    config.use_post = program.get<bool>("--post");
    if (auto val = program.present("--user")) config.user = *val;
    if (auto val = program.present("--password-env")) config.password_env = *val;

    // Output
    if (auto val = program.present("--out-dir")) config.out_dir = *val;
    if (auto val = program.present("--log-file")) config.log_file = *val;
    config.json_output = program.get<bool>("--json");
    config.color = program.get<bool>("--color");
    config.no_color = program.get<bool>("--no-color");
    if (program.get<bool>("-vv")) {
        config.verbosity = 2;
    } else if (program.get<bool>("--verbose")) {
        config.verbosity = 1;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    // Selection
    if (cli_overrides.preset.has_value()) merged.preset = cli_overrides.preset;
    if (cli_overrides.stardog.has_value()) merged.stardog = cli_overrides.stardog;
    if (cli_overrides.graphdb.has_value()) merged.graphdb = cli_overrides.graphdb;
    if (cli_overrides.st_graph.has_value()) merged.st_graph = cli_overrides.st_graph;
    if (cli_overrides.gdb_graph.has_value()) merged.gdb_graph = cli_overrides.gdb_graph;
    if (!cli_overrides.excludes.empty()) merged.excludes = cli_overrides.excludes;
    if (cli_overrides.no_default_filters) merged.no_default_filters = true;
    if (cli_overrides.type_iri.has_value()) merged.type_iri = cli_overrides.type_iri;
    if (cli_overrides.mode.has_value()) merged.mode = cli_overrides.mode;
    if (cli_overrides.sample_size.has_value()) merged.sample_size = cli_overrides.sample_size;
    if (cli_overrides.seed.has_value()) merged.seed = cli_overrides.seed;
    if (cli_overrides.format != RdfFormat::NTriples) merged.format = cli_overrides.format;

    // Transport
    if (cli_overrides.timeout_seconds.has_value()) {
        merged.timeout_seconds = cli_overrides.timeout_seconds;
    }
    if (cli_overrides.parallel_discovery) merged.parallel_discovery = true;
    if (cli_overrides.use_post) merged.use_post = true;
    if (cli_overrides.user.has_value()) merged.user = cli_overrides.user;
    if (!cli_overrides.password.empty()) merged.password = cli_overrides.password;
    if (cli_overrides.password_env.has_value()) merged.password_env = cli_overrides.password_env;

    // Output
    if (cli_overrides.out_dir.has_value()) merged.out_dir = cli_overrides.out_dir;
    if (cli_overrides.log_file.has_value()) merged.log_file = cli_overrides.log_file;
    if (cli_overrides.json_output) merged.json_output = true;
    if (cli_overrides.color) merged.color = true;
    if (cli_overrides.no_color) merged.no_color = true;
    if (cli_overrides.verbosity > merged.verbosity) merged.verbosity = cli_overrides.verbosity;

    return merged;
}

// ---------------------------------------------------------------------------
// ResolvePasswordEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config) {
    if (config.password.empty() && config.password_env.has_value()) {
        const auto& env_var = *config.password_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by password_env)"));
        }
        config.password = env_val;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.sample_size.has_value() && *config.sample_size == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Sample size must be at least 1"));
    }
    if (config.timeout_seconds.has_value() && *config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Timeout must be positive, got " + std::to_string(*config.timeout_seconds)));
    }
    const auto& t = config.timeouts;
    if (t.entity.count() <= 0 || t.discovery.count() <= 0 || t.deep.count() <= 0 ||
        t.graph.count() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Every entry in 'timeouts' must be positive"));
    }
    if (config.color && config.no_color) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    if (config.password_env.has_value() && !config.user.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("password_env requires user"));
    }

    for (const auto* list : {&config.endpoints_stardog, &config.endpoints_graphdb}) {
        for (const auto& ep : *list) {
            auto url = ParseEndpointUrl(ep.url);
            if (url.IsErr()) {
                return Result<void, Error>::Err(MakeConfigError(
                    "Endpoint '" + ep.name + "': " + url.Error()));
            }
        }
    }
    for (const auto& [label, iri] : config.filter_definitions) {
        auto ref = IriRef::Create(iri);
        if (ref.IsErr()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Filter '" + label + "': " + ref.Error()));
        }
    }
    std::set<std::string> names;
    for (const auto& preset : config.presets) {
        if (!names.insert(preset.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate preset name: " + preset.name));
        }
        for (const auto& label : preset.default_filters) {
            if (config.filter_definitions.count(label) == 0) {
                return Result<void, Error>::Err(MakeConfigError(
                    "Preset '" + preset.name + "' refers to unknown filter '" +
                    label + "'"));
            }
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveSelection
// ---------------------------------------------------------------------------
Result<ResolvedRun, Error> ResolveSelection(const AppConfig& config, Command command) {
    using R = Result<ResolvedRun, Error>;
    ResolvedRun run;

    if (command == Command::Presets) {
        return R::Err(MakeConfigError("The presets command does not run a comparison"));
    }

    auto stardog = ResolveEndpoint(config.endpoints_stardog, config.stardog, "Stardog");
    if (stardog.IsErr()) return R::Err(stardog.Error());
    run.stardog = std::move(stardog).Value();

    auto graphdb = ResolveEndpoint(config.endpoints_graphdb, config.graphdb, "GraphDB");
    if (graphdb.IsErr()) return R::Err(graphdb.Error());
    run.graphdb = std::move(graphdb).Value();

    // Preset: by name, or the first one when no graph IRIs are given.
    const PresetConfig* preset = nullptr;
    if (config.preset.has_value()) {
        for (const auto& p : config.presets) {
            if (p.name == *config.preset) preset = &p;
        }
        if (preset == nullptr) {
            return R::Err(MakeConfigError("Unknown preset '" + *config.preset + "'"));
        }
    } else if (!config.presets.empty() &&
               !(config.st_graph.has_value() && config.gdb_graph.has_value())) {
        preset = &config.presets.front();
    }

    auto& req = run.request;
    auto st_graph = RequireIri(config.st_graph.value_or(preset ? preset->st_graph : ""),
                               "Stardog graph IRI (--st-graph or preset)");
    if (st_graph.IsErr()) return R::Err(st_graph.Error());
    req.left_graph_iri = std::move(st_graph).Value();

    auto gdb_graph = RequireIri(config.gdb_graph.value_or(preset ? preset->gdb_graph : ""),
                                "GraphDB graph IRI (--gdb-graph or preset)");
    if (gdb_graph.IsErr()) return R::Err(gdb_graph.Error());
    req.right_graph_iri = std::move(gdb_graph).Value();

    // Filters: preset defaults plus --exclude entries.
    std::vector<std::string> filter_entries;
    if (preset != nullptr && !config.no_default_filters) {
        filter_entries = preset->default_filters;
    }
    filter_entries.insert(filter_entries.end(), config.excludes.begin(),
                          config.excludes.end());
    for (const auto& entry : filter_entries) {
        auto iri = ResolveFilter(config, entry);
        if (iri.IsErr()) return R::Err(iri.Error());
        req.filters.insert(std::move(iri).Value());
    }

    const size_t sample_size = config.sample_size.value_or(kDefaultSampleSize);
    switch (command) {
        case Command::Graph:
            req.mode = CompareMode::WholeGraph;
            break;
        case Command::Cube:
            req.mode = CompareMode::EntityMetadata;
            req.type_iri = kCubeType;
            break;
        case Command::Observation:
            req.mode = CompareMode::EntitySubject;
            req.type_iri = kObservationType;
            req.sample_size = sample_size;
            break;
        case Command::Constraint:
            req.mode = CompareMode::DeepSubgraph;
            req.type_iri = kConstraintType;
            break;
        case Command::Entities: {
            auto type = RequireIri(config.type_iri.value_or(""), "entity type (--type)");
            if (type.IsErr()) return R::Err(type.Error());
            req.type_iri = std::move(type).Value();
            req.mode = config.mode.value_or(CompareMode::EntityMetadata);
            req.sample_size = sample_size;
            break;
        }
        case Command::Presets:
            break;
    }
    if (command != Command::Entities &&
        (config.type_iri.has_value() || config.mode.has_value())) {
        LogWarn("config", std::string("--type and --mode only apply to the "
                                      "entities command; ignored for ") +
                              CommandName(command));
    }
    if (!ModeUsesFilters(req.mode) && !req.filters.empty()) {
        LogInfo("config", std::string("Predicate filters are not applied in ") +
                              CompareModeName(req.mode) + " mode");
    }

    req.label = CommandName(command);
    req.seed = config.seed.has_value() ? *config.seed : RandomSeed();
    req.format = config.format;
    req.timeouts = config.timeouts;
    if (config.timeout_seconds.has_value()) {
        const std::chrono::seconds all{*config.timeout_seconds};
        req.timeouts = FetchTimeouts{all, all, all, all};
    }
    req.parallel_discovery = config.parallel_discovery;

    return R::Ok(std::move(run));
}

} // namespace rdf_sync
