#include "property_resolver.hpp"

#include <spdlog/spdlog.h>

namespace property_resolver
{

mw::E<std::vector<RdfTerm>> resolveAll(TripleStoreInterface& store,
                                       const std::string& node,
                                       const VersionedProperty& property)
{
    std::vector<RdfTerm> result;
    for(const std::string& predicate : property.predicates)
    {
        ASSIGN_OR_RETURN(auto triples, store.findTriples(node, predicate));
        if(triples.empty())
        {
            continue;
        }
        if(predicate != property.canonical())
        {
            spdlog::debug("Using legacy predicate {} on {}", predicate, node);
        }
        result.reserve(triples.size());
        for(Triple& t : triples)
        {
            result.push_back(std::move(t.object));
        }
        break;
    }
    return result;
}

mw::E<std::optional<RdfTerm>> resolve(TripleStoreInterface& store,
                                      const std::string& node,
                                      const VersionedProperty& property)
{
    ASSIGN_OR_RETURN(auto values, resolveAll(store, node, property));
    if(values.empty())
    {
        return std::nullopt;
    }
    if(values.size() > 1)
    {
        spdlog::debug("{} values of {} on {}, using the first one.",
                      values.size(), property.canonical(), node);
    }
    return std::move(values.front());
}

std::string extractText(std::string_view literal)
{
    if(literal.ends_with(XML_LITERAL_SUFFIX))
    {
        literal.remove_suffix(std::string_view(XML_LITERAL_SUFFIX).size());
    }
    return std::string(literal);
}

std::string extractText(const RdfTerm& term)
{
    return extractText(term.str());
}

} // namespace property_resolver
