#include <gtest/gtest.h>
#include "seed_data.hpp"

#include <filesystem>
#include <fstream>

using namespace graph_rag;
namespace fs = std::filesystem;
using json = nlohmann::json;

TEST(SeedDataTest, DefaultDatasetIsConsistent) {
    auto seeds = default_seed_data();
    EXPECT_EQ(seeds.people.size(), 5u);
    EXPECT_EQ(seeds.organizations.size(), 8u);
    EXPECT_EQ(seeds.relationships.size(), 17u);
    EXPECT_NO_THROW(KnowledgeGraph::build(seeds));
}

TEST(SeedDataTest, ParsesJsonDocument) {
    json doc = {
        {"people", {{{"id", "p1"}, {"name", "Ada Lovelace"}, {"role", "Founder"}}}},
        {"organizations", {{{"id", "c1"}, {"name", "Engine Co"}, {"industry", "computing"}}}},
        {"relationships", {{{"source", "p1"}, {"target", "c1"}, {"relation", "founded"},
                            {"attributes", {{"year", 1843}}}}}}
    };

    auto seeds = seed_data_from_json(doc);
    ASSERT_EQ(seeds.people.size(), 1u);
    EXPECT_EQ(seeds.people[0].role, "Founder");
    ASSERT_EQ(seeds.relationships.size(), 1u);
    EXPECT_EQ(seeds.relationships[0].attributes.year.value_or(0), 1843);

    auto g = KnowledgeGraph::build(seeds);
    EXPECT_EQ(g.stats().total_edges, 1u);
}

TEST(SeedDataTest, MissingFieldsAreConstructionErrors) {
    json no_id = {{"people", {{{"name", "Nobody"}}}}};
    EXPECT_THROW(seed_data_from_json(no_id), GraphConstructionError);

    json no_relation = {
        {"people", {{{"id", "p1"}, {"name", "Ada"}}}},
        {"relationships", {{{"source", "p1"}, {"target", "p1"}}}}
    };
    EXPECT_THROW(seed_data_from_json(no_relation), GraphConstructionError);

    EXPECT_THROW(seed_data_from_json(json::array()), GraphConstructionError);
}

TEST(SeedDataTest, MissingFileIsConstructionError) {
    EXPECT_THROW(load_seed_file("/nonexistent/seeds.json"), GraphConstructionError);
}

TEST(SeedDataTest, LoadsSeedFileFromDisk) {
    fs::path path = fs::temp_directory_path() / "graph_rag_seed_test.json";
    {
        std::ofstream out(path);
        out << R"({
            "people": [{"id": "p1", "name": "Grace Hopper", "role": "Admiral"}],
            "organizations": [{"id": "c1", "name": "Navy", "industry": "defense"}],
            "relationships": [{"source": "p1", "target": "c1", "relation": "works_at", "attributes": {}}]
        })";
    }

    auto seeds = load_seed_file(path.string());
    auto g = KnowledgeGraph::build(seeds);
    EXPECT_EQ(g.stats().people, 1u);
    ASSERT_EQ(g.edges().size(), 1u);
    EXPECT_EQ(g.edges()[0].relation, Relation::WorksAt);

    fs::remove(path);
}

TEST(SeedDataTest, UnparsableFileIsConstructionError) {
    fs::path path = fs::temp_directory_path() / "graph_rag_seed_broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_seed_file(path.string()), GraphConstructionError);
    fs::remove(path);
}
