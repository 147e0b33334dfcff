#include <rdf_sync/config/app_config.hpp>

namespace rdf_sync {

std::optional<Command> ParseCommand(std::string_view name) {
    if (name == "graph") return Command::Graph;
    if (name == "cube") return Command::Cube;
    if (name == "observation") return Command::Observation;
    if (name == "constraint") return Command::Constraint;
    if (name == "entities") return Command::Entities;
    if (name == "presets") return Command::Presets;
    return std::nullopt;
}

const char* CommandName(Command command) {
    switch (command) {
        case Command::Graph:       return "graph";
        case Command::Cube:        return "cube";
        case Command::Observation: return "observation";
        case Command::Constraint:  return "constraint";
        case Command::Entities:    return "entities";
        case Command::Presets:     return "presets";
    }
    return "unknown";
}

AppConfig BuiltinCatalog() {
    AppConfig config;
    config.endpoints_stardog = {
        {"LINDAS PROD", "https://lindas.admin.ch/query"},
        {"LINDAS INT", "https://int.lindas.admin.ch/query"},
    };
    config.endpoints_graphdb = {
        {"LINDASnext PROD", "https://lindas.cz-aws.net/query"},
        {"LINDASnext INT", "https://lindas.int.cz-aws.net/query"},
    };
    config.presets = {
        {"Forest Fire Prevention",
         "https://lindas.admin.ch/foen/gefahren-waldbrand-praeventionsmassnahmen-kantone",
         "https://lindas.admin.ch/foen/forest-fire-prevention-measures-cantons",
         {}},
    };
    config.filter_definitions = {
        {"DCAT: dateModified", "http://www.w3.org/ns/dcat#dateModified"},
        {"DCTERMS: modified", "http://purl.org/dc/terms/modified"},
    };
    return config;
}

} // namespace rdf_sync
