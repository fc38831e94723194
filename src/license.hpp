#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mw/error.hpp>

#include "license_fields.hpp"
#include "triple_store.hpp"
#include "vocabulary.hpp"

// Where the field writes of a license go. A detached license has a
// binding that writes nowhere; a bound license has one that writes
// through to a node in a triple store.
class LicenseBindingInterface
{
public:
    virtual ~LicenseBindingInterface() = default;

    // Remove all values of “property”, under every name it has had,
    // and store “values” under its canonical name.
    virtual mw::E<void> replace(const VersionedProperty& property,
                                const std::vector<std::string>& values) = 0;
    // Re-read “fields” from the backing storage.
    virtual mw::E<void> refresh(LicenseFields& fields) = 0;
    virtual bool bound() const = 0;
    // The graph node, or an empty string if not bound.
    virtual const std::string& node() const = 0;
};

class DetachedBinding : public LicenseBindingInterface
{
public:
    mw::E<void> replace(const VersionedProperty&,
                        const std::vector<std::string>&) override
    {
        return {};
    }
    mw::E<void> refresh(LicenseFields&) override
    {
        return {};
    }
    bool bound() const override { return false; }
    const std::string& node() const override { return empty_node; }

private:
    std::string empty_node;
};

class NodeBinding : public LicenseBindingInterface
{
public:
    // The store must outlive the binding.
    NodeBinding(TripleStoreInterface& store, const std::string& node);

    mw::E<void> replace(const VersionedProperty& property,
                        const std::vector<std::string>& values) override;
    mw::E<void> refresh(LicenseFields& fields) override;
    bool bound() const override { return true; }
    const std::string& node() const override { return node_iri; }

private:
    TripleStoreInterface& store;
    std::string node_iri;
};

// A license record. Setters on a bound license write through to the
// store immediately: the field's triples are deleted, then the new
// value is added under the canonical predicate. The in-memory value
// is updated first, so if the store write fails, memory and store
// disagree until reload().
class License
{
public:
    // A detached license.
    explicit License(LicenseFields fields = {});

    // Load the license at “node”. The text and the template are
    // assumed to be HTML.
    static mw::E<License> load(TripleStoreInterface& store,
                               const std::string& node);
    // Write “source” onto “node” and return the bound license.
    static mw::E<License> create(TripleStoreInterface& store,
                                 const std::string& node,
                                 const License& source);

    // A moved-from license is detached and keeps no field values.
    License(License&& other);
    License& operator=(License&& other);
    License(const License&) = delete;
    License& operator=(const License&) = delete;

    // A detached copy with the same field values.
    License clone() const;
    // Set every field from “other”.
    mw::E<void> copyFrom(const License& other);
    // Re-read a bound license from its store. Text and template are
    // only converted from HTML if they have not been set since load.
    mw::E<void> reload();

    bool bound() const { return binding->bound(); }
    const std::string& node() const { return binding->node(); }
    const LicenseFields& fields() const { return data; }

    const std::string& licenseId() const { return data.license_id; }
    const std::string& name() const { return data.name; }
    const std::string& licenseText() const { return data.license_text; }
    const std::optional<std::string>& standardLicenseHeader() const
    {
        return data.standard_header;
    }
    const std::optional<std::string>& standardLicenseTemplate() const
    {
        return data.standard_template;
    }
    bool osiApproved() const { return data.osi_approved; }
    const std::optional<std::string>& comment() const { return data.comment; }
    const std::vector<std::string>& seeAlso() const { return data.see_also; }
    bool textIsHtml() const { return data.text_is_html; }
    bool templateIsHtml() const { return data.template_is_html; }

    mw::E<void> setLicenseId(const std::string& id);
    mw::E<void> setName(const std::string& name);
    // An empty text removes the text.
    mw::E<void> setLicenseText(const std::string& text);
    mw::E<void> setStandardLicenseHeader(
        const std::optional<std::string>& header);
    mw::E<void> setStandardLicenseTemplate(
        const std::optional<std::string>& tmpl);
    mw::E<void> setOsiApproved(bool approved);
    mw::E<void> setComment(const std::optional<std::string>& comment);
    mw::E<void> setSeeAlso(const std::vector<std::string>& urls);

    // The license ID.
    std::string str() const { return data.license_id; }

    // Same license ID. Says nothing about the text.
    bool sameIdentity(const License& other) const;
    // Equivalent license text. Nothing else is compared.
    bool semanticallyEquivalent(const License& other) const;

private:
    License(LicenseFields fields,
            std::unique_ptr<LicenseBindingInterface> binding);

    LicenseFields data;
    std::unique_ptr<LicenseBindingInterface> binding;
};
