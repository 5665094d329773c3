#include <gtest/gtest.h>
#include "traversal_engine.hpp"
#include "seed_data.hpp"

#include <memory>

using namespace graph_rag;

namespace {

std::shared_ptr<const KnowledgeGraph> sample_graph() {
    return std::make_shared<const KnowledgeGraph>(KnowledgeGraph::build(default_seed_data()));
}

// a -> b -> c -> a plus b -> a: every node is reachable both ways.
std::shared_ptr<const KnowledgeGraph> cyclic_graph() {
    SeedData seeds;
    seeds.organizations = {{"a", "Alpha", ""}, {"b", "Beta", ""}, {"c", "Gamma", ""}};
    seeds.relationships = {
        {"a", "b", "supplies", {}},
        {"b", "a", "supplies", {}},
        {"b", "c", "partners_with", {}},
        {"c", "a", "acquired", {}},
    };
    return std::make_shared<const KnowledgeGraph>(KnowledgeGraph::build(seeds));
}

Fact make_fact(const std::string& s, const std::string& t, const std::string& label) {
    Fact f;
    f.source = s;
    f.target = t;
    f.label = label;
    f.relation = parse_relation(label);
    return f;
}

bool same_key(const Fact& a, const Fact& b) {
    return a.source == b.source && a.target == b.target && a.label == b.label;
}

} // namespace

// ─── Depth handling ────────────────────────────────────────────

TEST(TraversalEngineTest, DepthZeroReturnsOwnFactsOnly) {
    auto g = sample_graph();
    TraversalEngine engine(g);
    auto result = engine.traverse("c4", 0);

    EXPECT_EQ(result.start_node, "c4");
    EXPECT_EQ(result.visited_nodes, (std::vector<std::string>{"c4"}));

    auto direct = g->relationships_of("c4");
    ASSERT_EQ(result.facts.size(), direct.size());
    for (size_t i = 0; i < direct.size(); ++i) {
        EXPECT_TRUE(same_key(result.facts[i], direct[i]));
        EXPECT_EQ(result.facts[i].direction, direct[i].direction);
    }
}

TEST(TraversalEngineTest, DepthOneFromPerson) {
    TraversalEngine engine(sample_graph());
    auto result = engine.traverse("p1");

    EXPECT_EQ(result.visited_nodes, (std::vector<std::string>{"p1", "c1", "c2", "c8"}));
    ASSERT_EQ(result.facts.size(), 5u);
    EXPECT_EQ(result.facts[0].label, "founded");
    EXPECT_EQ(result.facts[0].target, "c1");
    EXPECT_EQ(result.facts[0].attributes.year.value_or(0), 2003);
    EXPECT_EQ(result.facts[1].target, "c2");
    EXPECT_EQ(result.facts[2].target, "c8");
    EXPECT_EQ(result.facts[3].label, "leads");
}

TEST(TraversalEngineTest, DepthOneWalksBothDirections) {
    TraversalEngine engine(sample_graph());
    auto result = engine.traverse("c4", 1);

    // successors first (c3), then predecessors (p3, c5)
    EXPECT_EQ(result.visited_nodes, (std::vector<std::string>{"c4", "c3", "p3", "c5"}));
    EXPECT_EQ(result.facts.size(), 9u);
}

TEST(TraversalEngineTest, DeeperTraversalReachesMore) {
    TraversalEngine engine(sample_graph());
    auto shallow = engine.traverse("p3", 1);
    auto deep = engine.traverse("p3", 3);
    EXPECT_GT(deep.visited_nodes.size(), shallow.visited_nodes.size());
    EXPECT_GT(deep.facts.size(), shallow.facts.size());
}

TEST(TraversalEngineTest, NegativeDepthRejected) {
    TraversalEngine engine(sample_graph());
    EXPECT_THROW(engine.traverse("p1", -1), std::invalid_argument);
}

TEST(TraversalEngineTest, UnknownStartYieldsNoFacts) {
    TraversalEngine engine(sample_graph());
    auto result = engine.traverse("missing", 2);
    EXPECT_TRUE(result.facts.empty());
}

// ─── Cycles ────────────────────────────────────────────────────

TEST(TraversalEngineTest, CyclesVisitEachNodeOnce) {
    TraversalEngine engine(cyclic_graph());
    auto result = engine.traverse("a", 10);

    ASSERT_EQ(result.visited_nodes.size(), 3u);
    EXPECT_EQ(result.visited_nodes[0], "a");
    EXPECT_EQ(result.facts.size(), 4u);
}

// ─── Deduplication ─────────────────────────────────────────────

TEST(TraversalEngineTest, DedupeKeepsFirstSeen) {
    auto first = make_fact("x", "y", "founded");
    first.attributes.year = 1999;
    auto dup = make_fact("x", "y", "founded");
    dup.attributes.year = 2001;

    auto facts = dedupe_facts({first, make_fact("x", "y", "leads"), dup, make_fact("y", "x", "founded")});
    ASSERT_EQ(facts.size(), 3u);
    EXPECT_EQ(facts[0].attributes.year.value_or(0), 1999);
    EXPECT_EQ(facts[1].label, "leads");
    EXPECT_EQ(facts[2].source, "y");
}

TEST(TraversalEngineTest, DedupeIsIdempotent) {
    TraversalEngine engine(sample_graph());
    auto once = engine.traverse("c3", 2).facts;
    auto twice = dedupe_facts(once);
    ASSERT_EQ(once.size(), twice.size());
    for (size_t i = 0; i < once.size(); ++i) {
        EXPECT_TRUE(same_key(once[i], twice[i]));
    }
}

TEST(TraversalEngineTest, Summary) {
    TraversalEngine engine(sample_graph());
    auto summary = TraversalEngine::summarize(engine.traverse("p1"));
    EXPECT_EQ(summary, "Started from: p1\nVisited nodes: p1, c1, c2, c8\nFacts discovered: 5");
}
