#include "license_mapper.hpp"

#include <format>

#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

#include "markup_normalizer.hpp"
#include "property_resolver.hpp"
#include "vocabulary.hpp"

namespace
{

mw::E<std::optional<std::string>> readText(TripleStoreInterface& store,
                                           const std::string& node,
                                           const VersionedProperty& property)
{
    ASSIGN_OR_RETURN(auto term, property_resolver::resolve(store, node,
                                                           property));
    if(!term.has_value())
    {
        return std::nullopt;
    }
    return property_resolver::extractText(*term);
}

} // namespace

namespace license_mapper
{

std::vector<std::string> valuesOf(const std::optional<std::string>& value)
{
    if(value.has_value())
    {
        return {*value};
    }
    return {};
}

std::vector<std::string> valuesOf(const std::string& value)
{
    if(value.empty())
    {
        return {};
    }
    return {value};
}

mw::E<bool> parseOsiApproved(std::string_view value)
{
    std::string v(mw::strip(value));
    if(v == "true" || v == "1")
    {
        return true;
    }
    if(v == "false" || v == "0")
    {
        return false;
    }
    return std::unexpected(mw::runtimeError(std::format(
        "Invalid value for OSI Approved - must be {{true, false, 0, 1}}: {}",
        value)));
}

mw::E<void> replace(TripleStoreInterface& store, const std::string& node,
                    const VersionedProperty& property,
                    const std::vector<std::string>& values)
{
    for(const std::string& predicate : property.predicates)
    {
        DO_OR_RETURN(store.removeTriples(node, predicate));
    }
    for(const std::string& value : values)
    {
        DO_OR_RETURN(store.addTriple({node, property.canonical(),
                                      RdfTerm::literal(value)}));
    }
    return {};
}

mw::E<void> read(TripleStoreInterface& store, const std::string& node,
                 LicenseFields& fields)
{
    LicenseFields result = fields;

    ASSIGN_OR_RETURN(auto id, readText(store, node, vocab::LICENSE_ID));
    result.license_id = id.value_or("");
    ASSIGN_OR_RETURN(auto name, readText(store, node, vocab::NAME));
    result.name = name.value_or("");
    ASSIGN_OR_RETURN(auto comment, readText(store, node, vocab::COMMENT));
    result.comment = std::move(comment);
    ASSIGN_OR_RETURN(auto see_also, property_resolver::resolveAll(
                         store, node, vocab::SEE_ALSO));
    result.see_also.clear();
    for(const RdfTerm& url : see_also)
    {
        result.see_also.push_back(url.value);
    }

    // The license text has never been stored under any other name.
    ASSIGN_OR_RETURN(auto text, readText(store, node, vocab::LICENSE_TEXT));
    result.license_text = markup_normalizer::normalizeText(
        text.value_or(""), result.text_is_html);

    // Headers are not stored as XML literals, so there is no suffix to
    // strip; only entities are decoded.
    ASSIGN_OR_RETURN(auto header, property_resolver::resolve(
                         store, node, vocab::STD_LICENSE_HEADER));
    if(header.has_value())
    {
        result.standard_header =
            markup_normalizer::normalizeHeader(header->str());
    }
    else
    {
        result.standard_header = std::nullopt;
    }

    ASSIGN_OR_RETURN(auto tmpl, readText(store, node,
                                         vocab::STD_LICENSE_TEMPLATE));
    if(tmpl.has_value())
    {
        result.standard_template = markup_normalizer::normalizeText(
            *tmpl, result.template_is_html);
    }
    else
    {
        result.standard_template = std::nullopt;
    }

    ASSIGN_OR_RETURN(auto osi, property_resolver::resolve(
                         store, node, vocab::OSI_APPROVED));
    if(osi.has_value())
    {
        ASSIGN_OR_RETURN(bool approved, parseOsiApproved(
                             property_resolver::extractText(*osi)));
        result.osi_approved = approved;
    }
    else
    {
        result.osi_approved = false;
    }

    spdlog::debug("Read license {} from {}", result.license_id, node);
    fields = std::move(result);
    return {};
}

mw::E<void> project(TripleStoreInterface& store, const std::string& node,
                    const LicenseFields& fields)
{
    DO_OR_RETURN(store.removeTriples(node, vocab::RDF_TYPE));
    DO_OR_RETURN(store.addTriple({node, vocab::RDF_TYPE, RdfTerm::resource(
                vocab::CLASS_LISTED_LICENSE)}));

    DO_OR_RETURN(replace(store, node, vocab::LICENSE_ID,
                         valuesOf(fields.license_id)));
    DO_OR_RETURN(replace(store, node, vocab::NAME, valuesOf(fields.name)));
    DO_OR_RETURN(replace(store, node, vocab::COMMENT,
                         valuesOf(fields.comment)));
    DO_OR_RETURN(replace(store, node, vocab::SEE_ALSO, fields.see_also));

    DO_OR_RETURN(replace(store, node, vocab::LICENSE_TEXT,
                         valuesOf(fields.license_text)));
    DO_OR_RETURN(replace(store, node, vocab::STD_LICENSE_HEADER,
                         valuesOf(fields.standard_header)));
    DO_OR_RETURN(replace(store, node, vocab::STD_LICENSE_TEMPLATE,
                         valuesOf(fields.standard_template)));
    // False is the default on read, so it is not written.
    std::vector<std::string> osi;
    if(fields.osi_approved)
    {
        osi.push_back("true");
    }
    return replace(store, node, vocab::OSI_APPROVED, osi);
}

} // namespace license_mapper
