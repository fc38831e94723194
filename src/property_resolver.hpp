#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mw/error.hpp>

#include "rdf_types.hpp"
#include "triple_store.hpp"
#include "vocabulary.hpp"

namespace property_resolver
{

// Suffix of the external form of an rdf:XMLLiteral, as written by the
// legacy serialization.
constexpr char XML_LITERAL_SUFFIX[] =
    "^^http://www.w3.org/1999/02/22-rdf-syntax-ns#XMLLiteral";

// Find the value of “property” on “node”. The candidate predicates
// are tried in order, and the first triple of the first predicate
// that has any match wins. Returns nullopt if nothing matches.
mw::E<std::optional<RdfTerm>> resolve(TripleStoreInterface& store,
                                      const std::string& node,
                                      const VersionedProperty& property);

// Like resolve(), but returns all values of the first matching
// predicate.
mw::E<std::vector<RdfTerm>> resolveAll(TripleStoreInterface& store,
                                       const std::string& node,
                                       const VersionedProperty& property);

// Strip the XML literal suffix from the external form of a literal.
std::string extractText(std::string_view literal);
std::string extractText(const RdfTerm& term);

} // namespace property_resolver
