#include "license_verifier.hpp"

#include <format>

#include "license.hpp"

std::vector<std::string> verifyLicense(const License& license)
{
    std::vector<std::string> problems;
    const std::string& id = license.licenseId();
    if(id.empty())
    {
        problems.push_back("Missing required license ID");
    }
    if(license.name().empty())
    {
        problems.push_back("Missing required license name");
    }
    if(license.licenseText().empty())
    {
        problems.push_back(
            std::format("Missing required license text for {}", id));
    }
    return problems;
}
