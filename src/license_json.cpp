#include "license_json.hpp"

#include <format>
#include <optional>

namespace
{

mw::E<std::optional<std::string>> optionalString(const nlohmann::json& j,
                                                 const std::string& key)
{
    if(!j.contains(key) || j[key].is_null())
    {
        return std::nullopt;
    }
    if(!j[key].is_string())
    {
        return std::unexpected(mw::runtimeError(
            std::format("Invalid license JSON: {} must be a string", key)));
    }
    return j[key].get<std::string>();
}

} // namespace

namespace license_json
{

std::vector<std::string> asList(const nlohmann::json& j,
                                const std::string& key)
{
    std::vector<std::string> result;
    if(!j.contains(key))
    {
        return result;
    }

    const auto& val = j[key];
    if(val.is_array())
    {
        for(const auto& item : val)
        {
            if(item.is_string())
            {
                result.push_back(item.get<std::string>());
            }
        }
    }
    else if(val.is_string())
    {
        result.push_back(val.get<std::string>());
    }
    return result;
}

nlohmann::json toJson(const LicenseFields& fields)
{
    nlohmann::json j = {{"licenseId", fields.license_id},
                        {"name", fields.name},
                        {"licenseText", fields.license_text},
                        {"isOsiApproved", fields.osi_approved},
                        {"seeAlso", fields.see_also}};
    if(fields.standard_header.has_value())
    {
        j["standardLicenseHeader"] = *fields.standard_header;
    }
    if(fields.standard_template.has_value())
    {
        j["standardLicenseTemplate"] = *fields.standard_template;
    }
    if(fields.comment.has_value())
    {
        j["comment"] = *fields.comment;
    }
    return j;
}

mw::E<LicenseFields> fromJson(const nlohmann::json& j)
{
    if(!j.is_object())
    {
        return std::unexpected(mw::runtimeError(
            "Invalid license JSON: not an object"));
    }

    LicenseFields fields;
    ASSIGN_OR_RETURN(auto id, optionalString(j, "licenseId"));
    if(!id.has_value() || id->empty())
    {
        return std::unexpected(mw::runtimeError(
            "Invalid license JSON: missing licenseId"));
    }
    fields.license_id = *std::move(id);
    ASSIGN_OR_RETURN(auto name, optionalString(j, "name"));
    fields.name = name.value_or("");
    ASSIGN_OR_RETURN(auto text, optionalString(j, "licenseText"));
    fields.license_text = text.value_or("");
    ASSIGN_OR_RETURN(auto header, optionalString(j, "standardLicenseHeader"));
    fields.standard_header = std::move(header);
    ASSIGN_OR_RETURN(auto tmpl, optionalString(j, "standardLicenseTemplate"));
    fields.standard_template = std::move(tmpl);
    ASSIGN_OR_RETURN(auto comment, optionalString(j, "comment"));
    fields.comment = std::move(comment);
    fields.see_also = asList(j, "seeAlso");

    if(j.contains("isOsiApproved"))
    {
        if(!j["isOsiApproved"].is_boolean())
        {
            return std::unexpected(mw::runtimeError(
                "Invalid license JSON: isOsiApproved must be a boolean"));
        }
        fields.osi_approved = j["isOsiApproved"].get<bool>();
    }
    // Imported values are already plain text.
    fields.text_is_html = false;
    fields.template_is_html = false;
    return fields;
}

} // namespace license_json
