#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace license_compare
{

// Split license text into normalized word tokens: lower case, no
// punctuation, variant spellings mapped to one form.
std::vector<std::string> tokenize(std::string_view text);

// True if the two texts are the same license text, ignoring
// differences in whitespace, punctuation, case and common spelling
// variants.
bool isLicenseTextEquivalent(std::string_view a, std::string_view b);

} // namespace license_compare
