#pragma once

#include <string>
#include <vector>

#include <mw/error.hpp>
#include <nlohmann/json.hpp>

#include "license_fields.hpp"

namespace license_json
{

// Normalizes a field that can be a single string or a list of strings
// into a vector of strings.
std::vector<std::string> asList(const nlohmann::json& j,
                                const std::string& key);

nlohmann::json toJson(const LicenseFields& fields);
// “licenseId” is required; everything else is optional.
mw::E<LicenseFields> fromJson(const nlohmann::json& j);

} // namespace license_json
