#pragma once

#include <rdf_sync/compare/entity_fetch.hpp>
#include <rdf_sync/rdf/rdf_parser.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rdf_sync {

inline constexpr size_t kDefaultSampleSize = 100;

// ---------------------------------------------------------------------------
// Command - the CLI subcommand to execute.
// ---------------------------------------------------------------------------
enum class Command {
    Graph,        // whole named graph
    Cube,         // cube:Cube metadata, filtered
    Observation,  // cube:Observation subject triples, sampled
    Constraint,   // cube:Constraint deep subgraph
    Entities,     // custom --type / --mode
    Presets,      // list configured endpoints, presets and filters
};

[[nodiscard]] std::optional<Command> ParseCommand(std::string_view name);
[[nodiscard]] const char* CommandName(Command command);

struct EndpointConfig {
    std::string name;
    std::string url;
};

struct PresetConfig {
    std::string name;
    std::string st_graph;
    std::string gdb_graph;
    std::vector<std::string> default_filters;  // labels from filter_definitions
};

// ---------------------------------------------------------------------------
// AppConfig - YAML file contents plus CLI flags. Everything optional here is
// resolved by ResolveSelection.
// ---------------------------------------------------------------------------
struct AppConfig {
    // -- Catalog (YAML) --
    std::vector<EndpointConfig> endpoints_stardog;
    std::vector<EndpointConfig> endpoints_graphdb;
    std::vector<PresetConfig> presets;
    std::map<std::string, std::string> filter_definitions;  // label -> IRI
    std::optional<size_t> sample_size;
    FetchTimeouts timeouts;

    // -- Selection --
    std::optional<std::string> stardog;  // endpoint name or URL
    std::optional<std::string> graphdb;
    std::optional<std::string> preset;
    std::optional<std::string> st_graph;
    std::optional<std::string> gdb_graph;
    std::vector<std::string> excludes;   // filter labels or predicate IRIs
    bool no_default_filters = false;
    std::optional<std::string> type_iri;
    std::optional<CompareMode> mode;
    std::optional<uint64_t> seed;
    RdfFormat format = RdfFormat::NTriples;

    // -- Transport --
    std::optional<int> timeout_seconds;  // overrides every fetch timeout
    bool parallel_discovery = false;
    bool use_post = false;
    std::optional<std::string> user;
    std::string password;
    std::optional<std::string> password_env;

    // -- Output --
    std::optional<std::string> out_dir;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool color = false;
    bool no_color = false;
    int verbosity = 0;  // 0 warn, 1 info, 2 debug
};

/// Endpoints, the Forest Fire Prevention preset and the two common
/// modification-date filters, used when no config file is given.
[[nodiscard]] AppConfig BuiltinCatalog();

} // namespace rdf_sync
