#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "license.hpp"
#include "license_verifier.hpp"

using ::testing::HasSubstr;

TEST(LicenseVerifier, CompleteLicenseHasNoProblems)
{
    LicenseFields fields;
    fields.license_id = "MIT";
    fields.name = "MIT License";
    fields.license_text = "Permission is hereby granted.";
    EXPECT_TRUE(verifyLicense(License(fields)).empty());
}

TEST(LicenseVerifier, ReportsEachMissingField)
{
    LicenseFields fields;
    fields.name = "Nameless";
    auto problems = verifyLicense(License(fields));
    ASSERT_EQ(problems.size(), 2);
    EXPECT_THAT(problems[0], HasSubstr("license ID"));
    EXPECT_THAT(problems[1], HasSubstr("license text"));
}

TEST(LicenseVerifier, TextMessageNamesTheLicense)
{
    LicenseFields fields;
    fields.license_id = "GPL-2.0";
    auto problems = verifyLicense(License(fields));
    ASSERT_EQ(problems.size(), 2);
    EXPECT_EQ(problems[0], "Missing required license name");
    EXPECT_EQ(problems[1], "Missing required license text for GPL-2.0");
}

TEST(LicenseVerifier, OptionalFieldsDoNotMatter)
{
    LicenseFields fields;
    fields.license_id = "MIT";
    fields.name = "MIT License";
    fields.license_text = "text";
    fields.standard_header = std::nullopt;
    fields.standard_template = std::nullopt;
    fields.comment = std::nullopt;
    EXPECT_TRUE(verifyLicense(License(fields)).empty());
}
