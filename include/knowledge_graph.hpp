#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace graph_rag {

enum class NodeKind { Person, Organization };

enum class Relation {
    Founded,
    CoFounded,
    Leads,
    WorksAt,
    InvestedIn,
    Acquired,
    PartnersWith,
    Supplies,
    Other
};

enum class FactDirection { Outgoing, Incoming };

std::string to_string(NodeKind kind);
std::string to_string(Relation relation);
std::string to_string(FactDirection direction);

// Unknown labels map to Relation::Other; the raw label is kept on the edge.
Relation parse_relation(const std::string& label);

// Thrown when seed data cannot form a valid graph. Fatal at startup.
class GraphConstructionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct NodeAttributes {
    std::optional<std::string> role;      // person
    std::optional<std::string> industry;  // organization
    std::map<std::string, std::string> extra;
};

struct EdgeAttributes {
    std::optional<int> year;
    std::optional<std::string> amount;
    std::optional<std::string> role;
    std::optional<std::string> product;
    std::optional<std::string> type;
    std::map<std::string, std::string> extra;

    // year as rendered: the integer year, else a non-integer year kept in extra.
    std::optional<std::string> year_text() const;

    nlohmann::json to_json() const;
    static EdgeAttributes from_json(const nlohmann::json& j);
};

struct Node {
    std::string id;
    std::string name;
    NodeKind kind = NodeKind::Organization;
    NodeAttributes attributes;
};

struct Edge {
    std::string source;
    std::string target;
    Relation relation = Relation::Other;
    std::string label;
    EdgeAttributes attributes;
};

struct Fact {
    std::string source;
    std::string source_name;
    std::string target;
    std::string target_name;
    Relation relation = Relation::Other;
    std::string label;
    EdgeAttributes attributes;
    FactDirection direction = FactDirection::Outgoing;

    nlohmann::json to_json() const;
};

// Seed records: the bootstrap contract for KnowledgeGraph::build.
struct PersonSeed {
    std::string id;
    std::string name;
    std::string role;
};

struct OrganizationSeed {
    std::string id;
    std::string name;
    std::string industry;
};

struct RelationshipSeed {
    std::string source;
    std::string target;
    std::string relation;
    EdgeAttributes attributes;
};

struct SeedData {
    std::vector<PersonSeed> people;
    std::vector<OrganizationSeed> organizations;
    std::vector<RelationshipSeed> relationships;
};

struct GraphStats {
    size_t total_nodes = 0;
    size_t total_edges = 0;
    size_t people = 0;
    size_t organizations = 0;
};

// Directed multigraph of people and organizations. Built once, then read-only,
// so a single const instance can be shared by concurrent pipeline runs.
class KnowledgeGraph {
public:
    static KnowledgeGraph build(const SeedData& seeds);

    const Node* get_node(const std::string& id) const;
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }

    // Case-insensitive mutual substring match: query in name, or name in query.
    std::vector<std::pair<std::string, const Node*>> find_nodes_by_name(const std::string& query) const;

    // Outgoing edges first, then incoming; one fact per edge, no deduplication.
    std::vector<Fact> relationships_of(const std::string& id) const;

    std::vector<std::string> successors(const std::string& id) const;
    std::vector<std::string> predecessors(const std::string& id) const;

    GraphStats stats() const;

private:
    void add_node(Node node);
    void add_edge(Edge edge);
    Fact make_fact(const Edge& edge, FactDirection direction) const;

    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, size_t> id_to_index_;
    std::unordered_map<std::string, std::vector<size_t>> out_edges_;
    std::unordered_map<std::string, std::vector<size_t>> in_edges_;
};

} // namespace graph_rag
