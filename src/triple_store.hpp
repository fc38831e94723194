#pragma once

#include <memory>
#include <string>
#include <vector>

#include <mw/database.hpp>
#include <mw/error.hpp>

#include "rdf_types.hpp"

class TripleStoreInterface
{
public:
    virtual ~TripleStoreInterface() = default;
    virtual mw::E<void> init() = 0;

    // All triples matching (subject, predicate, *), in the order they
    // were added.
    virtual mw::E<std::vector<Triple>> findTriples(
        const std::string& subject, const std::string& predicate) = 0;
    // Remove all triples matching (subject, predicate, *).
    virtual mw::E<void> removeTriples(const std::string& subject,
                                      const std::string& predicate) = 0;
    virtual mw::E<void> addTriple(const Triple& triple) = 0;
};

// Triple store kept in a single SQLite table. “path” can be
// “:memory:”.
class TripleStore : public TripleStoreInterface
{
public:
    explicit TripleStore(const std::string& path);
    mw::E<void> init() override;

    mw::E<std::vector<Triple>> findTriples(
        const std::string& subject, const std::string& predicate) override;
    mw::E<void> removeTriples(const std::string& subject,
                              const std::string& predicate) override;
    mw::E<void> addTriple(const Triple& triple) override;

private:
    std::string db_path;
    std::unique_ptr<mw::SQLite> db;

    mw::E<void> migrate();
};
