#pragma once
#include <string>
#include <vector>
#include "knowledge_graph.hpp"
#include "entity_recognizer.hpp"

namespace graph_rag {

// Returned by ContextBuilder::render when there is nothing to ground on.
// The pipeline compares against it verbatim to skip generation.
inline const std::string kNoContextSentinel = "No relevant information found in the knowledge graph.";

class ContextBuilder {
public:
    // One sentence per fact: relation template, then year / amount / role (leads only) / product.
    static std::string format_fact(const Fact& fact);

    static std::string render(const std::vector<Fact>& facts, const std::vector<EntityMention>& entities);
};

} // namespace graph_rag
