#include "rdf_types.hpp"

RdfTerm RdfTerm::resource(const std::string& iri)
{
    RdfTerm t;
    t.kind = RESOURCE;
    t.value = iri;
    return t;
}

RdfTerm RdfTerm::literal(const std::string& lexical,
                         const std::string& datatype)
{
    RdfTerm t;
    t.kind = LITERAL;
    t.value = lexical;
    t.datatype = datatype;
    return t;
}

std::string RdfTerm::str() const
{
    if(kind == RESOURCE || datatype.empty() || datatype == XSD_STRING)
    {
        return value;
    }
    return value + "^^" + datatype;
}
