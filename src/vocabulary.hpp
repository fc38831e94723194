#pragma once

#include <string>
#include <vector>

// A field that has been stored under different predicate names over
// the schema versions. Reads try the candidates in order; writes only
// ever use the first one.
struct VersionedProperty
{
    std::vector<std::string> predicates;

    const std::string& canonical() const
    {
        return predicates.front();
    }
};

namespace vocab
{

constexpr char SPDX_NS[] = "http://spdx.org/rdf/terms#";
constexpr char RDF_NS[] = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
constexpr char RDFS_NS[] = "http://www.w3.org/2000/01/rdf-schema#";

constexpr char XML_LITERAL[] =
    "http://www.w3.org/1999/02/22-rdf-syntax-ns#XMLLiteral";
constexpr char RDF_TYPE[] = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
constexpr char CLASS_LISTED_LICENSE[] = "http://spdx.org/rdf/terms#ListedLicense";

// Base licensing info fields. These never changed name.
inline const VersionedProperty LICENSE_ID{{"http://spdx.org/rdf/terms#licenseId"}};
inline const VersionedProperty NAME{{"http://spdx.org/rdf/terms#name"}};
inline const VersionedProperty COMMENT{
    {"http://www.w3.org/2000/01/rdf-schema#comment"}};
inline const VersionedProperty SEE_ALSO{
    {"http://www.w3.org/2000/01/rdf-schema#seeAlso"}};

inline const VersionedProperty LICENSE_TEXT{
    {"http://spdx.org/rdf/terms#licenseText"}};
// Current name, then the SPDX 1.0 name.
inline const VersionedProperty STD_LICENSE_HEADER{
    {"http://spdx.org/rdf/terms#standardLicenseHeader",
     "http://spdx.org/rdf/terms#licenseHeader"}};
inline const VersionedProperty STD_LICENSE_TEMPLATE{
    {"http://spdx.org/rdf/terms#standardLicenseTemplate",
     "http://spdx.org/rdf/terms#licenseTemplate"}};
inline const VersionedProperty OSI_APPROVED{
    {"http://spdx.org/rdf/terms#isOsiApproved",
     "http://spdx.org/rdf/terms#osiApproved"}};

} // namespace vocab
