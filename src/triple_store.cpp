#include "triple_store.hpp"

#include <cstdint>
#include <tuple>

#include <mw/error.hpp>
#include <spdlog/spdlog.h>

TripleStore::TripleStore(const std::string& path) : db_path(path) {}

mw::E<void> TripleStore::init()
{
    if(db_path == ":memory:")
    {
        ASSIGN_OR_RETURN(db, mw::SQLite::connectMemory());
    }
    else
    {
        ASSIGN_OR_RETURN(db, mw::SQLite::connectFile(db_path));
    }

    DO_OR_RETURN(db->execute("PRAGMA journal_mode=WAL;"));
    return migrate();
}

mw::E<void> TripleStore::migrate()
{
    auto version_res = db->evalToValue<int>("PRAGMA user_version;");
    if(!version_res)
    {
        return std::unexpected(version_res.error());
    }

    int version = *version_res;
    if(version == 0)
    {
        spdlog::info("Creating triple store schema v1...");
        // Objects are stored with their kind and datatype so that the
        // external string form can be rebuilt exactly.
        DO_OR_RETURN(db->execute(R"(CREATE TABLE IF NOT EXISTS triples (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                subject TEXT NOT NULL,
                predicate TEXT NOT NULL,
                object TEXT NOT NULL,
                is_literal INTEGER NOT NULL,
                datatype TEXT NOT NULL DEFAULT ''
            );)"));
        DO_OR_RETURN(db->execute(
            "CREATE INDEX IF NOT EXISTS idx_triples_sp "
            "ON triples (subject, predicate);"));
        DO_OR_RETURN(db->execute("PRAGMA user_version = 1;"));
    }
    return {};
}

using TripleTuple = std::tuple<std::string, std::string, std::string, int64_t,
                               std::string>;

static Triple rowToTriple(const TripleTuple& row)
{
    Triple t;
    t.subject = std::get<0>(row);
    t.predicate = std::get<1>(row);
    if(std::get<3>(row) != 0)
    {
        t.object = RdfTerm::literal(std::get<2>(row), std::get<4>(row));
    }
    else
    {
        t.object = RdfTerm::resource(std::get<2>(row));
    }
    return t;
}

mw::E<std::vector<Triple>> TripleStore::findTriples(
    const std::string& subject, const std::string& predicate)
{
    const char* sql = "SELECT subject, predicate, object, is_literal, datatype "
                      "FROM triples WHERE subject = ? AND predicate = ? "
                      "ORDER BY id;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(subject, predicate));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string, int64_t,
                  std::string>(std::move(stmt))));

    std::vector<Triple> result;
    result.reserve(rows.size());
    for(const auto& row : rows)
    {
        result.push_back(rowToTriple(row));
    }
    return result;
}

mw::E<void> TripleStore::removeTriples(const std::string& subject,
                                       const std::string& predicate)
{
    const char* sql = "DELETE FROM triples WHERE subject = ? AND predicate = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(subject, predicate));
    return db->execute(std::move(stmt));
}

mw::E<void> TripleStore::addTriple(const Triple& triple)
{
    const char* sql = "INSERT INTO triples (subject, predicate, object, "
                      "is_literal, datatype) VALUES (?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    int64_t is_literal = triple.object.kind == RdfTerm::LITERAL ? 1 : 0;
    DO_OR_RETURN(stmt.bind(triple.subject, triple.predicate,
                           triple.object.value, is_literal,
                           triple.object.datatype));
    return db->execute(std::move(stmt));
}
