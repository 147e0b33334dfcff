#pragma once

#include <rdf_sync/core/result.hpp>

#include <string>
#include <tuple>
#include <variant>

namespace rdf_sync {

inline constexpr const char* kXsdString =
    "http://www.w3.org/2001/XMLSchema#string";
inline constexpr const char* kRdfLangString =
    "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";

// ---------------------------------------------------------------------------
// RDF terms. A Term is exactly one of Iri, BlankNode or Literal; consumers
// handle all three with std::visit.
// ---------------------------------------------------------------------------
struct Iri {
    std::string value;

    bool operator==(const Iri& o) const { return value == o.value; }
    bool operator!=(const Iri& o) const { return value != o.value; }
    bool operator<(const Iri& o) const { return value < o.value; }
};

// Label is scoped to the parse (or canonicalization) that produced it.
struct BlankNode {
    std::string label;

    bool operator==(const BlankNode& o) const { return label == o.label; }
    bool operator!=(const BlankNode& o) const { return label != o.label; }
    bool operator<(const BlankNode& o) const { return label < o.label; }
};

// A simple literal has an empty language and an empty datatype; the
// xsd:string datatype is folded into that form by MakeLiteral.
struct Literal {
    std::string lexical;
    std::string language;
    std::string datatype;

    bool operator==(const Literal& o) const {
        return lexical == o.lexical && language == o.language &&
               datatype == o.datatype;
    }
    bool operator!=(const Literal& o) const { return !(*this == o); }
    bool operator<(const Literal& o) const {
        return std::tie(lexical, language, datatype) <
               std::tie(o.lexical, o.language, o.datatype);
    }
};

using Term = std::variant<Iri, BlankNode, Literal>;

/// Build a literal, dropping the datatype when it is implied
/// (xsd:string without a language, rdf:langString with one).
[[nodiscard]] Literal MakeLiteral(std::string lexical,
                                  std::string language = "",
                                  std::string datatype = "");

[[nodiscard]] inline bool IsIri(const Term& t) { return std::holds_alternative<Iri>(t); }
[[nodiscard]] inline bool IsBlank(const Term& t) { return std::holds_alternative<BlankNode>(t); }
[[nodiscard]] inline bool IsLiteral(const Term& t) { return std::holds_alternative<Literal>(t); }

// ---------------------------------------------------------------------------
// Triple - subject is an Iri or BlankNode, predicate an Iri, object any Term.
// Ordering is lexicographic over (subject, predicate, object).
// ---------------------------------------------------------------------------
struct Triple {
    Term subject;
    Iri predicate;
    Term object;

    bool operator==(const Triple& o) const {
        return subject == o.subject && predicate == o.predicate &&
               object == o.object;
    }
    bool operator!=(const Triple& o) const { return !(*this == o); }
    bool operator<(const Triple& o) const {
        return std::tie(subject, predicate, object) <
               std::tie(o.subject, o.predicate, o.object);
    }
};

/// Validating constructor: rejects literal subjects and non-IRI predicates
/// with a Parse-category error.
[[nodiscard]] Result<Triple, Error> MakeTriple(Term subject, Term predicate,
                                               Term object);

/// N-Triples rendering of one term: <iri>, _:label, "lex"@lang, "lex"^^<dt>.
[[nodiscard]] std::string ToNTriples(const Term& term);

/// One N-Triples line without the trailing newline: "s p o ."
[[nodiscard]] std::string ToNTriples(const Triple& triple);

/// Escape a literal lexical form for N-Triples (\\, \", \n, \r, \t).
[[nodiscard]] std::string EscapeNTriplesString(const std::string& s);

} // namespace rdf_sync
