#include <rdf_sync/rdf/term.hpp>

namespace rdf_sync {

namespace {

// Helper for exhaustive std::visit over Term.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const char* TermKindName(const Term& t) {
    return std::visit(Overloaded{
        [](const Iri&) { return "IRI"; },
        [](const BlankNode&) { return "blank node"; },
        [](const Literal&) { return "literal"; },
    }, t);
}

} // anonymous namespace

Literal MakeLiteral(std::string lexical, std::string language,
                    std::string datatype) {
    if (language.empty() && datatype == kXsdString) {
        datatype.clear();
    }
    if (!language.empty() && datatype == kRdfLangString) {
        datatype.clear();
    }
    return Literal{std::move(lexical), std::move(language), std::move(datatype)};
}

Result<Triple, Error> MakeTriple(Term subject, Term predicate, Term object) {
    if (IsLiteral(subject)) {
        return Result<Triple, Error>::Err(Error{
            "MakeTriple", "", std::nullopt,
            "Literal in subject position: " + ToNTriples(subject),
            std::nullopt, ErrorCategory::Parse});
    }
    if (!IsIri(predicate)) {
        return Result<Triple, Error>::Err(Error{
            "MakeTriple", "", std::nullopt,
            std::string("Predicate must be an IRI, got a ") +
                TermKindName(predicate) + ": " + ToNTriples(predicate),
            std::nullopt, ErrorCategory::Parse});
    }
    return Result<Triple, Error>::Ok(Triple{
        std::move(subject), std::get<Iri>(std::move(predicate)),
        std::move(object)});
}

std::string EscapeNTriplesString(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

std::string ToNTriples(const Term& term) {
    return std::visit(Overloaded{
        [](const Iri& iri) { return "<" + iri.value + ">"; },
        [](const BlankNode& bn) { return "_:" + bn.label; },
        [](const Literal& lit) {
            std::string out = "\"" + EscapeNTriplesString(lit.lexical) + "\"";
            if (!lit.language.empty()) {
                out += "@" + lit.language;
            } else if (!lit.datatype.empty()) {
                out += "^^<" + lit.datatype + ">";
            }
            return out;
        },
    }, term);
}

std::string ToNTriples(const Triple& triple) {
    return ToNTriples(triple.subject) + " <" + triple.predicate.value + "> " +
           ToNTriples(triple.object) + " .";
}

} // namespace rdf_sync
