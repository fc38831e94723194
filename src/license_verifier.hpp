#pragma once

#include <string>
#include <vector>

class License;

// Problems that make “license” incomplete, one message per missing
// required field. An empty result means the license is valid.
std::vector<std::string> verifyLicense(const License& license);
