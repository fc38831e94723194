#include "config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <ryml.hpp>
#include <ryml_std.hpp>

namespace
{

std::string readFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if(!f)
    {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void readKey(ryml::NodeRef root, const char* key, std::string& value)
{
    if(root.has_child(ryml::to_csubstr(key)))
    {
        root[ryml::to_csubstr(key)] >> value;
    }
}

} // namespace

Config& Config::get()
{
    static Config instance;
    return instance;
}

void Config::load(const std::string& path)
{
    std::string content = readFile(path);
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::NodeRef root = tree.rootref();

    readKey(root, "db_path", db_path);
    readKey(root, "log_level", log_level);
    readKey(root, "license_namespace", license_namespace);
}
