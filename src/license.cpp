#include "license.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "license_compare.hpp"
#include "license_mapper.hpp"

NodeBinding::NodeBinding(TripleStoreInterface& store, const std::string& node)
        : store(store), node_iri(node)
{
}

mw::E<void> NodeBinding::replace(const VersionedProperty& property,
                                 const std::vector<std::string>& values)
{
    return license_mapper::replace(store, node_iri, property, values);
}

mw::E<void> NodeBinding::refresh(LicenseFields& fields)
{
    return license_mapper::read(store, node_iri, fields);
}

License::License(LicenseFields fields)
        : License(std::move(fields), std::make_unique<DetachedBinding>())
{
}

License::License(LicenseFields fields,
                 std::unique_ptr<LicenseBindingInterface> binding)
        : data(std::move(fields)), binding(std::move(binding))
{
}

License::License(License&& other)
        : data(std::exchange(other.data, {})),
          binding(std::exchange(other.binding,
                                std::make_unique<DetachedBinding>()))
{
}

License& License::operator=(License&& other)
{
    if(this != &other)
    {
        data = std::exchange(other.data, {});
        binding = std::exchange(other.binding,
                                std::make_unique<DetachedBinding>());
    }
    return *this;
}

mw::E<License> License::load(TripleStoreInterface& store,
                             const std::string& node)
{
    License license(LicenseFields(),
                    std::make_unique<NodeBinding>(store, node));
    DO_OR_RETURN(license.reload());
    return license;
}

mw::E<License> License::create(TripleStoreInterface& store,
                               const std::string& node, const License& source)
{
    LicenseFields fields = source.data;
    // What gets written is the in-memory text, which is already plain.
    fields.text_is_html = false;
    fields.template_is_html = false;
    DO_OR_RETURN(license_mapper::project(store, node, fields));
    spdlog::debug("Created license {} at {}", fields.license_id, node);
    return License(std::move(fields),
                   std::make_unique<NodeBinding>(store, node));
}

License License::clone() const
{
    return License(data);
}

mw::E<void> License::copyFrom(const License& other)
{
    DO_OR_RETURN(setComment(other.comment()));
    DO_OR_RETURN(setLicenseId(other.licenseId()));
    DO_OR_RETURN(setLicenseText(other.licenseText()));
    DO_OR_RETURN(setName(other.name()));
    DO_OR_RETURN(setOsiApproved(other.osiApproved()));
    DO_OR_RETURN(setSeeAlso(other.seeAlso()));
    DO_OR_RETURN(setStandardLicenseHeader(other.standardLicenseHeader()));
    return setStandardLicenseTemplate(other.standardLicenseTemplate());
}

mw::E<void> License::reload()
{
    return binding->refresh(data);
}

mw::E<void> License::setLicenseId(const std::string& id)
{
    data.license_id = id;
    return binding->replace(vocab::LICENSE_ID,
                            license_mapper::valuesOf(id));
}

mw::E<void> License::setName(const std::string& name)
{
    data.name = name;
    return binding->replace(vocab::NAME,
                            license_mapper::valuesOf(name));
}

mw::E<void> License::setLicenseText(const std::string& text)
{
    data.license_text = text;
    data.text_is_html = false;
    return binding->replace(vocab::LICENSE_TEXT,
                            license_mapper::valuesOf(text));
}

mw::E<void> License::setStandardLicenseHeader(
    const std::optional<std::string>& header)
{
    data.standard_header = header;
    return binding->replace(vocab::STD_LICENSE_HEADER,
                            license_mapper::valuesOf(header));
}

mw::E<void> License::setStandardLicenseTemplate(
    const std::optional<std::string>& tmpl)
{
    data.standard_template = tmpl;
    data.template_is_html = false;
    return binding->replace(vocab::STD_LICENSE_TEMPLATE,
                            license_mapper::valuesOf(tmpl));
}

mw::E<void> License::setOsiApproved(bool approved)
{
    data.osi_approved = approved;
    std::vector<std::string> values;
    if(approved)
    {
        values.push_back("true");
    }
    return binding->replace(vocab::OSI_APPROVED, values);
}

mw::E<void> License::setComment(const std::optional<std::string>& comment)
{
    data.comment = comment;
    return binding->replace(vocab::COMMENT,
                            license_mapper::valuesOf(comment));
}

mw::E<void> License::setSeeAlso(const std::vector<std::string>& urls)
{
    data.see_also = urls;
    return binding->replace(vocab::SEE_ALSO, urls);
}

bool License::sameIdentity(const License& other) const
{
    return data.license_id == other.data.license_id;
}

bool License::semanticallyEquivalent(const License& other) const
{
    return license_compare::isLicenseTextEquivalent(data.license_text,
                                                    other.data.license_text);
}
