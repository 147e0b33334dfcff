#pragma once

#include <rdf_sync/config/app_config.hpp>
#include <rdf_sync/core/result.hpp>
#include <rdf_sync/workflow/compare_workflow.hpp>

#include <string>
#include <string_view>

namespace rdf_sync {

// Parse a YAML presets file into the catalog part of an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments (without the subcommand) into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Catalog entries come from yaml_base; selection and output fields from the
// CLI replace those in yaml_base when set.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Resolve password_env: if password is empty and password_env is set,
// read the environment variable and populate password.
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config);

// Validate that values are sane (sample size, timeouts, catalog IRIs).
Result<void, Error> ValidateConfig(const AppConfig& config);

// ---------------------------------------------------------------------------
// ResolvedRun - concrete endpoints and a ready-to-run CompareRequest.
// ---------------------------------------------------------------------------
struct ResolvedRun {
    EndpointConfig stardog;
    EndpointConfig graphdb;
    CompareRequest request;
};

// Resolve endpoint names to URLs, the preset to graph IRIs, filter labels
// to predicate IRIs, and the command to a mode and entity type.
Result<ResolvedRun, Error> ResolveSelection(const AppConfig& config, Command command);

} // namespace rdf_sync
