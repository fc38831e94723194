#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mw/error.hpp>

#include "license_fields.hpp"
#include "triple_store.hpp"
#include "vocabulary.hpp"

namespace license_mapper
{

// The values to store for a field: none for an empty or missing
// value, otherwise just the value.
std::vector<std::string> valuesOf(const std::optional<std::string>& value);
std::vector<std::string> valuesOf(const std::string& value);

// Parse the value of the OSI approved property. Only “true”, “1”,
// “false” and “0” are accepted, after trimming.
mw::E<bool> parseOsiApproved(std::string_view value);

// Read all license fields of “node” into “fields”. The HTML flags in
// “fields” decide whether text and template are converted from HTML.
// On error “fields” is left untouched.
mw::E<void> read(TripleStoreInterface& store, const std::string& node,
                 LicenseFields& fields);

// Remove every value of “property” from “node”, under the canonical
// and the legacy predicates, then add “values” under the canonical
// predicate.
mw::E<void> replace(TripleStoreInterface& store, const std::string& node,
                    const VersionedProperty& property,
                    const std::vector<std::string>& values);

// Write a complete license onto “node”, replacing whatever values the
// license fields had there.
mw::E<void> project(TripleStoreInterface& store, const std::string& node,
                    const LicenseFields& fields);

} // namespace license_mapper
