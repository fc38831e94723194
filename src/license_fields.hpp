#pragma once

#include <optional>
#include <string>
#include <vector>

// Plain field values of a license.
struct LicenseFields
{
    std::string license_id;
    std::string name;
    std::string license_text;
    std::optional<std::string> standard_header;
    std::optional<std::string> standard_template;
    bool osi_approved = false;
    std::optional<std::string> comment;
    std::vector<std::string> see_also;

    // Whether the text and the template still need to be converted
    // from HTML when read from a store. Once a field is set in memory
    // it is plain text for good.
    bool text_is_html = true;
    bool template_is_html = true;
};
