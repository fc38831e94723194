#include <gtest/gtest.h>
#include <mw/test_utils.hpp>

#include "license_mapper.hpp"

TEST(LicenseMapper, ParsesOsiApproved)
{
    ASSIGN_OR_FAIL(bool t, license_mapper::parseOsiApproved("true"));
    EXPECT_TRUE(t);
    ASSIGN_OR_FAIL(bool one, license_mapper::parseOsiApproved("1"));
    EXPECT_TRUE(one);
    ASSIGN_OR_FAIL(bool f, license_mapper::parseOsiApproved("false"));
    EXPECT_FALSE(f);
    ASSIGN_OR_FAIL(bool zero, license_mapper::parseOsiApproved(" 0 "));
    EXPECT_FALSE(zero);
}

TEST(LicenseMapper, RejectsOtherOsiValues)
{
    for(const char* value : {"yes", "no", "TRUE", "False", "", "2", "t"})
    {
        auto r = license_mapper::parseOsiApproved(value);
        EXPECT_FALSE(r.has_value()) << value;
    }
}

TEST(LicenseMapper, ValuesOf)
{
    EXPECT_TRUE(license_mapper::valuesOf(std::string()).empty());
    EXPECT_TRUE(license_mapper::valuesOf(std::optional<std::string>()).empty());
    EXPECT_EQ(license_mapper::valuesOf(std::optional<std::string>("")),
              std::vector<std::string>{""});
    EXPECT_EQ(license_mapper::valuesOf(std::string("a")),
              std::vector<std::string>{"a"});
}
