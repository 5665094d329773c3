#include "traversal_engine.hpp"
#include <deque>
#include <set>
#include <stdexcept>
#include <tuple>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace graph_rag {

std::vector<Fact> dedupe_facts(const std::vector<Fact>& facts) {
    std::vector<Fact> unique_facts;
    std::set<std::tuple<std::string, std::string, std::string>> seen;

    for (const auto& fact : facts) {
        if (seen.emplace(fact.source, fact.target, fact.label).second) {
            unique_facts.push_back(fact);
        }
    }
    return unique_facts;
}

TraversalResult TraversalEngine::traverse(const std::string& start_id, int max_depth) const {
    if (max_depth < 0) {
        throw std::invalid_argument("Traversal depth must be >= 0, got " + std::to_string(max_depth));
    }

    TraversalResult result;
    result.start_node = start_id;

    std::unordered_set<std::string> visited;
    std::vector<Fact> facts;
    std::deque<std::pair<std::string, int>> queue;
    queue.emplace_back(start_id, 0);

    while (!queue.empty()) {
        auto [current, depth] = queue.front();
        queue.pop_front();

        if (visited.count(current) || depth > max_depth) continue;

        visited.insert(current);
        result.visited_nodes.push_back(current);

        auto rels = graph_->relationships_of(current);
        facts.insert(facts.end(), rels.begin(), rels.end());

        if (depth < max_depth) {
            for (const auto& neighbor : graph_->successors(current)) {
                if (!visited.count(neighbor)) queue.emplace_back(neighbor, depth + 1);
            }
            for (const auto& neighbor : graph_->predecessors(current)) {
                if (!visited.count(neighbor)) queue.emplace_back(neighbor, depth + 1);
            }
        }
    }

    result.facts = dedupe_facts(facts);
    spdlog::debug("Traversal (depth {}, {} raw facts):\n{}", max_depth, facts.size(), summarize(result));
    return result;
}

std::string TraversalEngine::summarize(const TraversalResult& result) {
    std::string visited;
    for (size_t i = 0; i < result.visited_nodes.size(); ++i) {
        if (i > 0) visited += ", ";
        visited += result.visited_nodes[i];
    }
    return "Started from: " + (result.start_node.empty() ? std::string("unknown") : result.start_node) + "\n" +
           "Visited nodes: " + visited + "\n" +
           "Facts discovered: " + std::to_string(result.facts.size());
}

} // namespace graph_rag
