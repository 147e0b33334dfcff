#include <rdf_sync/sparql/results_codec.hpp>

#include <rdf_sync/rdf/literal_normalizer.hpp>

#include <nlohmann/json.hpp>
#include <tinyxml2.h>

#include <cstring>

namespace rdf_sync {

namespace {

Error MakeParseError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Parse};
}

std::string StringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

Result<Term, Error> JsonBindingToTerm(const std::string& var,
                                      const nlohmann::json& binding) {
    if (!binding.is_object()) {
        return Result<Term, Error>::Err(MakeParseError(
            "ParseSelectJson", "Binding for ?" + var + " is not an object"));
    }
    const auto type = StringField(binding, "type");
    auto value = StringField(binding, "value");

    if (type == "uri") {
        return Result<Term, Error>::Ok(Iri{std::move(value)});
    }
    if (type == "bnode") {
        return Result<Term, Error>::Ok(BlankNode{std::move(value)});
    }
    if (type == "literal" || type == "typed-literal") {
        return Result<Term, Error>::Ok(NormalizeLiteral(MakeLiteral(
            std::move(value), StringField(binding, "xml:lang"),
            StringField(binding, "datatype"))));
    }
    return Result<Term, Error>::Err(MakeParseError(
        "ParseSelectJson",
        "Unknown binding type '" + type + "' for ?" + var));
}

Result<Term, Error> XmlBindingToTerm(const std::string& var,
                                     const tinyxml2::XMLElement* binding) {
    const auto* value = binding->FirstChildElement();
    if (value == nullptr) {
        return Result<Term, Error>::Err(MakeParseError(
            "ParseSelectXml", "Empty binding for ?" + var));
    }
    const char* text = value->GetText();
    std::string content = text ? text : "";

    if (std::strcmp(value->Name(), "uri") == 0) {
        return Result<Term, Error>::Ok(Iri{std::move(content)});
    }
    if (std::strcmp(value->Name(), "bnode") == 0) {
        return Result<Term, Error>::Ok(BlankNode{std::move(content)});
    }
    if (std::strcmp(value->Name(), "literal") == 0) {
        const char* lang = value->Attribute("xml:lang");
        const char* datatype = value->Attribute("datatype");
        return Result<Term, Error>::Ok(NormalizeLiteral(MakeLiteral(
            std::move(content), lang ? lang : "", datatype ? datatype : "")));
    }
    return Result<Term, Error>::Err(MakeParseError(
        "ParseSelectXml",
        std::string("Unknown binding element <") + value->Name() + "> for ?" + var));
}

} // anonymous namespace

Result<SelectResult, Error> ParseSelectJson(std::string_view body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body.begin(), body.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<SelectResult, Error>::Err(MakeParseError(
            "ParseSelectJson", "Malformed JSON results: " + std::string(e.what())));
    }

    if (!j.is_object() || !j.contains("results") || !j["results"].is_object() ||
        !j["results"].contains("bindings") || !j["results"]["bindings"].is_array()) {
        return Result<SelectResult, Error>::Err(MakeParseError(
            "ParseSelectJson", "Response has no results.bindings array"));
    }

    SelectResult result;
    if (j.contains("head") && j["head"].is_object() &&
        j["head"].contains("vars") && j["head"]["vars"].is_array()) {
        for (const auto& var : j["head"]["vars"]) {
            if (var.is_string()) {
                result.variables.push_back(var.get<std::string>());
            }
        }
    }

    for (const auto& row_json : j["results"]["bindings"]) {
        if (!row_json.is_object()) {
            return Result<SelectResult, Error>::Err(MakeParseError(
                "ParseSelectJson", "Solution is not an object"));
        }
        BindingRow row;
        for (const auto& [var, binding] : row_json.items()) {
            auto term = JsonBindingToTerm(var, binding);
            if (term.IsErr()) {
                return Result<SelectResult, Error>::Err(term.Error());
            }
            row.emplace(var, std::move(term).Value());
        }
        result.rows.push_back(std::move(row));
    }

    return Result<SelectResult, Error>::Ok(std::move(result));
}

Result<SelectResult, Error> ParseSelectXml(std::string_view body) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(body.data(), body.size()) != tinyxml2::XML_SUCCESS) {
        return Result<SelectResult, Error>::Err(MakeParseError(
            "ParseSelectXml",
            std::string("Malformed XML results: ") +
                (doc.ErrorStr() ? doc.ErrorStr() : "unknown error")));
    }

    const auto* root = doc.RootElement();
    if (root == nullptr || std::strcmp(root->Name(), "sparql") != 0) {
        return Result<SelectResult, Error>::Err(MakeParseError(
            "ParseSelectXml", "Root element is not <sparql>"));
    }

    SelectResult result;
    if (const auto* head = root->FirstChildElement("head")) {
        for (const auto* v = head->FirstChildElement("variable"); v;
             v = v->NextSiblingElement("variable")) {
            const char* name = v->Attribute("name");
            if (name) result.variables.emplace_back(name);
        }
    }

    const auto* results = root->FirstChildElement("results");
    if (results == nullptr) {
        return Result<SelectResult, Error>::Err(MakeParseError(
            "ParseSelectXml", "Response has no <results> element"));
    }

    for (const auto* r = results->FirstChildElement("result"); r;
         r = r->NextSiblingElement("result")) {
        BindingRow row;
        for (const auto* b = r->FirstChildElement("binding"); b;
             b = b->NextSiblingElement("binding")) {
            const char* name = b->Attribute("name");
            if (!name) continue;
            auto term = XmlBindingToTerm(name, b);
            if (term.IsErr()) {
                return Result<SelectResult, Error>::Err(term.Error());
            }
            row.emplace(name, std::move(term).Value());
        }
        result.rows.push_back(std::move(row));
    }

    return Result<SelectResult, Error>::Ok(std::move(result));
}

} // namespace rdf_sync
