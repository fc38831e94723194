#include <gtest/gtest.h>
#include <mw/test_utils.hpp>

#include "license_json.hpp"

TEST(LicenseJson, ParsesFullLicense)
{
    nlohmann::json j = {{"licenseId", "MIT"},
                        {"name", "MIT License"},
                        {"licenseText", "Permission..."},
                        {"standardLicenseHeader", "Header"},
                        {"isOsiApproved", true},
                        {"comment", "note"},
                        {"seeAlso", "https://opensource.org/licenses/MIT"}};
    ASSIGN_OR_FAIL(auto fields, license_json::fromJson(j));
    EXPECT_EQ(fields.license_id, "MIT");
    EXPECT_EQ(fields.name, "MIT License");
    EXPECT_EQ(fields.license_text, "Permission...");
    EXPECT_EQ(fields.standard_header, "Header");
    EXPECT_FALSE(fields.standard_template.has_value());
    EXPECT_TRUE(fields.osi_approved);
    EXPECT_EQ(fields.comment, "note");
    ASSERT_EQ(fields.see_also.size(), 1);
    EXPECT_EQ(fields.see_also[0], "https://opensource.org/licenses/MIT");
    EXPECT_FALSE(fields.text_is_html);
    EXPECT_FALSE(fields.template_is_html);
}

TEST(LicenseJson, RequiresLicenseId)
{
    nlohmann::json j = {{"name", "No ID"}};
    auto r = license_json::fromJson(j);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(mw::errorMsg(r.error()), "Invalid license JSON: missing licenseId");
}

TEST(LicenseJson, RejectsWrongTypes)
{
    EXPECT_FALSE(license_json::fromJson(
        {{"licenseId", "MIT"}, {"isOsiApproved", "yes"}}).has_value());
    EXPECT_FALSE(license_json::fromJson(
        {{"licenseId", "MIT"}, {"name", 3}}).has_value());
    EXPECT_FALSE(license_json::fromJson(nlohmann::json::array()).has_value());
}

TEST(LicenseJson, ExportOmitsMissingOptionals)
{
    LicenseFields fields;
    fields.license_id = "MIT";
    fields.see_also = {"a", "b"};
    nlohmann::json j = license_json::toJson(fields);
    EXPECT_EQ(j["licenseId"], "MIT");
    EXPECT_EQ(j["isOsiApproved"], false);
    EXPECT_EQ(j["seeAlso"].size(), 2);
    EXPECT_FALSE(j.contains("standardLicenseHeader"));
    EXPECT_FALSE(j.contains("standardLicenseTemplate"));
    EXPECT_FALSE(j.contains("comment"));

    ASSIGN_OR_FAIL(auto parsed, license_json::fromJson(j));
    EXPECT_EQ(parsed.see_also, fields.see_also);
}

TEST(LicenseJson, AsList)
{
    nlohmann::json j = {{"one", "a"}, {"many", {"a", "b"}}, {"bad", 3}};
    EXPECT_EQ(license_json::asList(j, "one"), std::vector<std::string>{"a"});
    EXPECT_EQ(license_json::asList(j, "many"),
              (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(license_json::asList(j, "bad").empty());
    EXPECT_TRUE(license_json::asList(j, "missing").empty());
}
