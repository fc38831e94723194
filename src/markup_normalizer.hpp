#pragma once

#include <string>

namespace markup_normalizer
{

// Body text and template. Converted from HTML only if “is_html”.
std::string normalizeText(const std::string& text, bool is_html);

// Headers always get their HTML entities decoded, regardless of any
// HTML flag, and never go through the full HTML conversion.
std::string normalizeHeader(const std::string& text);

} // namespace markup_normalizer
