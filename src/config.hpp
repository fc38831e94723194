#pragma once
#include <string>

struct Config
{
    std::string db_path = "licenses.db";
    std::string log_level = "info";
    // Licenses are stored at node “license_namespace + license ID”.
    std::string license_namespace = "http://spdx.org/licenses/";

    static Config& get();
    void load(const std::string& path);

    std::string licenseNode(const std::string& license_id) const
    {
        return license_namespace + license_id;
    }
};
