#pragma once

#include <string>

constexpr char XSD_STRING[] = "http://www.w3.org/2001/XMLSchema#string";

// The object of a triple. Either a resource (an IRI) or a literal
// with an optional datatype.
struct RdfTerm
{
    enum Kind { RESOURCE, LITERAL };

    Kind kind = LITERAL;
    // IRI of a resource, or lexical form of a literal.
    std::string value;
    // Datatype IRI of a literal. Empty for plain literals.
    std::string datatype;

    static RdfTerm resource(const std::string& iri);
    static RdfTerm literal(const std::string& lexical,
                           const std::string& datatype = "");

    // External string form of the term. For a typed literal this is
    // “lexical^^datatype”, the way the legacy serialization spells
    // it. Plain and xsd:string literals are just the lexical form.
    std::string str() const;

    bool operator==(const RdfTerm&) const = default;
};

struct Triple
{
    std::string subject;
    std::string predicate;
    RdfTerm object;

    bool operator==(const Triple&) const = default;
};
