#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include "knowledge_graph.hpp"

namespace graph_rag {

struct EntityMention {
    std::string name;          // canonical display name, e.g. "Elon Musk"
    NodeKind kind = NodeKind::Organization;
    std::string matched_text;  // lowercase surface form that hit
};

struct EntityCatalog {
    std::vector<std::string> surface_forms;                        // lowercase full names and aliases
    std::unordered_map<std::string, std::string> aliases;          // surface form -> canonical name
    std::unordered_map<std::string, std::string> display_names;    // canonical name -> display name
    std::unordered_set<std::string> person_tokens;                 // known-person surname tokens

    static EntityCatalog defaults();
};

// Closed-vocabulary matcher. Longer surface forms are tried first so a full
// name is not fragmented by its aliases; each canonical name is emitted once.
class EntityRecognizer {
public:
    EntityRecognizer();
    explicit EntityRecognizer(EntityCatalog catalog);

    std::vector<EntityMention> detect(const std::string& text) const;

    // Relations hinted at by keywords in the question, in enum order.
    static std::vector<Relation> extract_relationship_intents(const std::string& text);

private:
    NodeKind classify(const std::string& canonical) const;
    std::string display_name(const std::string& canonical) const;

    EntityCatalog catalog_;
    std::vector<std::string> scan_order_;
};

} // namespace graph_rag
