#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <mw/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "license.hpp"
#include "license_json.hpp"
#include "license_mapper.hpp"
#include "license_verifier.hpp"
#include "triple_store.hpp"

namespace
{

mw::E<void> importLicense(TripleStoreInterface& store, const std::string& path)
{
    std::ifstream f(path);
    if(!f)
    {
        return std::unexpected(mw::runtimeError("Cannot open " + path));
    }
    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if(j.is_discarded())
    {
        return std::unexpected(mw::runtimeError("Invalid JSON in " + path));
    }
    ASSIGN_OR_RETURN(auto fields, license_json::fromJson(j));
    std::string node = Config::get().licenseNode(fields.license_id);
    ASSIGN_OR_RETURN(auto license, License::create(store, node,
                                                   License(fields)));
    spdlog::info("Imported {} to {}", license.str(), node);
    return {};
}

mw::E<void> showLicense(TripleStoreInterface& store, const std::string& id)
{
    ASSIGN_OR_RETURN(auto license, License::load(
                         store, Config::get().licenseNode(id)));
    std::cout << license_json::toJson(license.fields()).dump(2) << std::endl;
    return {};
}

mw::E<bool> verify(TripleStoreInterface& store, const std::string& id)
{
    ASSIGN_OR_RETURN(auto license, License::load(
                         store, Config::get().licenseNode(id)));
    std::vector<std::string> problems = verifyLicense(license);
    for(const std::string& problem : problems)
    {
        std::cout << problem << std::endl;
    }
    return problems.empty();
}

mw::E<void> compare(TripleStoreInterface& store, const std::string& id1,
                    const std::string& id2)
{
    ASSIGN_OR_RETURN(auto a, License::load(store,
                                           Config::get().licenseNode(id1)));
    ASSIGN_OR_RETURN(auto b, License::load(store,
                                           Config::get().licenseNode(id2)));
    std::cout << (a.semanticallyEquivalent(b) ? "equivalent" : "different")
              << std::endl;
    return {};
}

mw::E<void> setOsi(TripleStoreInterface& store, const std::string& id,
                   const std::string& value)
{
    ASSIGN_OR_RETURN(bool approved, license_mapper::parseOsiApproved(value));
    ASSIGN_OR_RETURN(auto license, License::load(
                         store, Config::get().licenseNode(id)));
    DO_OR_RETURN(license.setOsiApproved(approved));
    spdlog::info("Set OSI approval of {} to {}", id, approved);
    return {};
}

int run(const std::string& command, const std::vector<std::string>& args)
{
    TripleStore store(Config::get().db_path);
    auto init = store.init();
    if(!init)
    {
        spdlog::error("Failed to open triple store: {}",
                      mw::errorMsg(init.error()));
        return 1;
    }

    mw::E<void> result;
    if(command == "import" && args.size() == 1)
    {
        result = importLicense(store, args[0]);
    }
    else if(command == "show" && args.size() == 1)
    {
        result = showLicense(store, args[0]);
    }
    else if(command == "verify" && args.size() == 1)
    {
        auto valid = verify(store, args[0]);
        if(!valid)
        {
            spdlog::error(mw::errorMsg(valid.error()));
            return 1;
        }
        return *valid ? 0 : 1;
    }
    else if(command == "compare" && args.size() == 2)
    {
        result = compare(store, args[0], args[1]);
    }
    else if(command == "set-osi" && args.size() == 2)
    {
        result = setOsi(store, args[0], args[1]);
    }
    else
    {
        spdlog::error("Invalid command or arguments: {}", command);
        return 1;
    }

    if(!result)
    {
        spdlog::error(mw::errorMsg(result.error()));
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options(
        "licgraph", "Store and inspect license records in a triple store.");
    cmd_options.add_options()
        ("c,config", "Config file", cxxopts::value<std::string>())
        ("h,help", "Print this message.")
        ("command", "import, show, verify, compare or set-osi",
         cxxopts::value<std::string>())
        ("args", "Command arguments",
         cxxopts::value<std::vector<std::string>>());
    cmd_options.parse_positional({"command", "args"});
    cmd_options.positional_help("COMMAND [ARGS...]");

    auto opts = cmd_options.parse(argc, argv);
    if(opts.count("help") || !opts.count("command"))
    {
        std::cout << cmd_options.help() << std::endl;
        return opts.count("help") ? 0 : 1;
    }

    if(opts.count("config"))
    {
        try
        {
            Config::get().load(opts["config"].as<std::string>());
        }
        catch(const std::runtime_error& e)
        {
            spdlog::error(e.what());
            return 1;
        }
    }
    spdlog::set_level(spdlog::level::from_str(Config::get().log_level));

    std::vector<std::string> args;
    if(opts.count("args"))
    {
        args = opts["args"].as<std::vector<std::string>>();
    }
    return run(opts["command"].as<std::string>(), args);
}
