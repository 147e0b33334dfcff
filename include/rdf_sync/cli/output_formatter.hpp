#pragma once

#include <rdf_sync/config/app_config.hpp>
#include <rdf_sync/core/result.hpp>
#include <rdf_sync/workflow/compare_workflow.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace rdf_sync {

// ---------------------------------------------------------------------------
// OutputFormatter - human-readable and JSON output for CLI commands.
//
// Results go to `out`, errors to `err`. With color_mode (never together
// with json_mode) tables are rendered with FTXUI and verdicts are colored.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // In JSON mode, outputs a JSON array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    void PrintError(const Error& error) const;

    // Population finding, per-unit table, summary line and exported files.
    void PrintOutcome(const CompareRequest& request,
                      const CompareOutcome& outcome,
                      const std::vector<std::string>& exported = {}) const;

    // Endpoints, presets and filter labels of the catalog.
    void PrintPresets(const AppConfig& config) const;

private:
    void PrintOutcomeJson(const CompareRequest& request,
                          const CompareOutcome& outcome,
                          const std::vector<std::string>& exported) const;

    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace rdf_sync
