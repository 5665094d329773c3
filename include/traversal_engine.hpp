#pragma once
#include <memory>
#include <string>
#include <vector>
#include "knowledge_graph.hpp"

namespace graph_rag {

struct TraversalResult {
    std::string start_node;
    std::vector<std::string> visited_nodes;  // visit order
    std::vector<Fact> facts;                 // deduplicated, first-seen order
};

// Keeps the first fact for each (source, target, relation label) key.
std::vector<Fact> dedupe_facts(const std::vector<Fact>& facts);

class TraversalEngine {
public:
    explicit TraversalEngine(std::shared_ptr<const KnowledgeGraph> graph) : graph_(std::move(graph)) {}

    // Breadth-first walk from start_id. A node at depth d always contributes its
    // facts; its neighbors (both directions) are queued only while d < max_depth.
    TraversalResult traverse(const std::string& start_id, int max_depth = 1) const;

    static std::string summarize(const TraversalResult& result);

private:
    std::shared_ptr<const KnowledgeGraph> graph_;
};

} // namespace graph_rag
