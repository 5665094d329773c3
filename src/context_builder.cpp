#include "context_builder.hpp"
#include <sstream>

namespace graph_rag {

namespace {

// Every Relation except Other has a template here; Other renders its raw label.
std::string relation_clause(const Fact& fact) {
    const std::string& s = fact.source_name;
    const std::string& t = fact.target_name;

    switch (fact.relation) {
        case Relation::Founded:      return s + " founded " + t;
        case Relation::CoFounded:    return s + " co-founded " + t;
        case Relation::Leads:        return s + " leads " + t;
        case Relation::WorksAt:      return s + " works at " + t;
        case Relation::InvestedIn:   return s + " invested in " + t;
        case Relation::Acquired:     return s + " acquired " + t;
        case Relation::PartnersWith: return s + " partners with " + t;
        case Relation::Supplies:     return s + " supplies to " + t;
        case Relation::Other:        break;
    }
    return s + " " + fact.label + " " + t;
}

} // namespace

std::string ContextBuilder::format_fact(const Fact& fact) {
    std::string sentence = relation_clause(fact);
    const auto& attrs = fact.attributes;

    std::vector<std::string> parts;
    if (auto year = attrs.year_text()) parts.push_back("in " + *year);
    if (attrs.amount) parts.push_back("(" + *attrs.amount + ")");
    if (attrs.role && fact.relation == Relation::Leads) parts.push_back("as " + *attrs.role);
    if (attrs.product) parts.push_back("(" + *attrs.product + ")");

    for (const auto& part : parts) {
        sentence += " " + part;
    }
    return sentence;
}

std::string ContextBuilder::render(const std::vector<Fact>& facts, const std::vector<EntityMention>& entities) {
    if (facts.empty()) {
        return kNoContextSentinel;
    }

    std::ostringstream context;

    if (!entities.empty()) {
        context << "Information about: ";
        for (size_t i = 0; i < entities.size(); ++i) {
            if (i > 0) context << ", ";
            context << entities[i].name;
        }
        context << "\n\n";
    }

    context << "Known facts:";
    for (const auto& fact : facts) {
        context << "\n- " << format_fact(fact);
    }
    return context.str();
}

} // namespace graph_rag
