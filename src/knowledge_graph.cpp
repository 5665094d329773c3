#include "knowledge_graph.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace graph_rag {

using json = nlohmann::json;

namespace {

struct RelationLabel {
    Relation relation;
    const char* label;
};

const RelationLabel kRelationLabels[] = {
    {Relation::Founded, "founded"},
    {Relation::CoFounded, "co_founded"},
    {Relation::Leads, "leads"},
    {Relation::WorksAt, "works_at"},
    {Relation::InvestedIn, "invested_in"},
    {Relation::Acquired, "acquired"},
    {Relation::PartnersWith, "partners_with"},
    {Relation::Supplies, "supplies"},
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string json_scalar_to_string(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

[[noreturn]] void year_out_of_range(const json& v) {
    throw GraphConstructionError("Year attribute out of range: " + v.dump());
}

// Whole integers (number or all-digit string) become attrs.year. Anything else
// ("2003.0", "early 2000s", "2003abc") is kept verbatim in extra["year"].
void parse_year(const json& v, EdgeAttributes& attrs) {
    constexpr long long kMin = std::numeric_limits<int>::min();
    constexpr long long kMax = std::numeric_limits<int>::max();

    if (v.is_number_unsigned()) {
        if (v.get<unsigned long long>() > static_cast<unsigned long long>(kMax)) year_out_of_range(v);
        attrs.year = static_cast<int>(v.get<unsigned long long>());
        return;
    }
    if (v.is_number_integer()) {
        long long y = v.get<long long>();
        if (y < kMin || y > kMax) year_out_of_range(v);
        attrs.year = static_cast<int>(y);
        return;
    }
    if (v.is_string()) {
        const std::string text = v.get<std::string>();
        size_t pos = 0;
        try {
            int y = std::stoi(text, &pos);
            if (pos == text.size()) {
                attrs.year = y;
                return;
            }
        } catch (const std::invalid_argument&) {
            // not numeric, kept as text below
        } catch (const std::out_of_range&) {
            year_out_of_range(v);
        }
    }
    attrs.extra["year"] = json_scalar_to_string(v);
}

} // namespace

std::string to_string(NodeKind kind) {
    return kind == NodeKind::Person ? "person" : "organization";
}

std::string to_string(Relation relation) {
    for (const auto& entry : kRelationLabels) {
        if (entry.relation == relation) return entry.label;
    }
    return "other";
}

std::string to_string(FactDirection direction) {
    return direction == FactDirection::Outgoing ? "outgoing" : "incoming";
}

Relation parse_relation(const std::string& label) {
    for (const auto& entry : kRelationLabels) {
        if (label == entry.label) return entry.relation;
    }
    return Relation::Other;
}

json EdgeAttributes::to_json() const {
    json j = json::object();
    if (year) j["year"] = *year;
    if (amount) j["amount"] = *amount;
    if (role) j["role"] = *role;
    if (product) j["product"] = *product;
    if (type) j["type"] = *type;
    for (const auto& [key, value] : extra) j[key] = value;
    return j;
}

EdgeAttributes EdgeAttributes::from_json(const json& j) {
    EdgeAttributes attrs;
    if (!j.is_object()) return attrs;

    for (const auto& [key, value] : j.items()) {
        if (value.is_null()) continue;
        if (key == "year") {
            parse_year(value, attrs);
        } else if (key == "amount") {
            attrs.amount = json_scalar_to_string(value);
        } else if (key == "role") {
            attrs.role = json_scalar_to_string(value);
        } else if (key == "product") {
            attrs.product = json_scalar_to_string(value);
        } else if (key == "type") {
            attrs.type = json_scalar_to_string(value);
        } else {
            attrs.extra[key] = json_scalar_to_string(value);
        }
    }
    return attrs;
}

std::optional<std::string> EdgeAttributes::year_text() const {
    if (year) return std::to_string(*year);
    auto it = extra.find("year");
    if (it != extra.end()) return it->second;
    return std::nullopt;
}

json Fact::to_json() const {
    return json{
        {"direction", to_string(direction)},
        {"source", source},
        {"source_name", source_name},
        {"target", target},
        {"target_name", target_name},
        {"relation", label},
        {"attributes", attributes.to_json()}
    };
}

// --- CONSTRUCTION ---

KnowledgeGraph KnowledgeGraph::build(const SeedData& seeds) {
    KnowledgeGraph graph;

    for (const auto& person : seeds.people) {
        Node node;
        node.id = person.id;
        node.name = person.name;
        node.kind = NodeKind::Person;
        if (!person.role.empty()) node.attributes.role = person.role;
        graph.add_node(std::move(node));
    }

    for (const auto& org : seeds.organizations) {
        Node node;
        node.id = org.id;
        node.name = org.name;
        node.kind = NodeKind::Organization;
        if (!org.industry.empty()) node.attributes.industry = org.industry;
        graph.add_node(std::move(node));
    }

    for (const auto& rel : seeds.relationships) {
        Edge edge;
        edge.source = rel.source;
        edge.target = rel.target;
        edge.label = rel.relation;
        edge.relation = parse_relation(rel.relation);
        edge.attributes = rel.attributes;
        graph.add_edge(std::move(edge));
    }

    spdlog::info("Knowledge graph built: {} nodes, {} edges", graph.nodes_.size(), graph.edges_.size());
    return graph;
}

void KnowledgeGraph::add_node(Node node) {
    if (node.id.empty()) {
        throw GraphConstructionError("Node with empty id (name: '" + node.name + "')");
    }
    if (id_to_index_.count(node.id)) {
        throw GraphConstructionError("Duplicate node id: " + node.id);
    }
    id_to_index_[node.id] = nodes_.size();
    out_edges_[node.id];
    in_edges_[node.id];
    nodes_.push_back(std::move(node));
}

void KnowledgeGraph::add_edge(Edge edge) {
    if (!id_to_index_.count(edge.source)) {
        throw GraphConstructionError("Relationship '" + edge.label + "' references unknown source node: " + edge.source);
    }
    if (!id_to_index_.count(edge.target)) {
        throw GraphConstructionError("Relationship '" + edge.label + "' references unknown target node: " + edge.target);
    }
    if (edge.label.empty()) {
        throw GraphConstructionError("Relationship " + edge.source + " -> " + edge.target + " has no relation label");
    }

    size_t index = edges_.size();
    out_edges_[edge.source].push_back(index);
    in_edges_[edge.target].push_back(index);
    edges_.push_back(std::move(edge));
}

// --- QUERIES ---

const Node* KnowledgeGraph::get_node(const std::string& id) const {
    auto it = id_to_index_.find(id);
    if (it == id_to_index_.end()) return nullptr;
    return &nodes_[it->second];
}

std::vector<std::pair<std::string, const Node*>> KnowledgeGraph::find_nodes_by_name(const std::string& query) const {
    std::vector<std::pair<std::string, const Node*>> matches;
    std::string query_lower = to_lower(query);

    for (const auto& node : nodes_) {
        std::string name_lower = to_lower(node.name);
        if (name_lower.find(query_lower) != std::string::npos ||
            query_lower.find(name_lower) != std::string::npos) {
            matches.emplace_back(node.id, &node);
        }
    }
    return matches;
}

Fact KnowledgeGraph::make_fact(const Edge& edge, FactDirection direction) const {
    Fact fact;
    fact.source = edge.source;
    fact.source_name = nodes_[id_to_index_.at(edge.source)].name;
    fact.target = edge.target;
    fact.target_name = nodes_[id_to_index_.at(edge.target)].name;
    fact.relation = edge.relation;
    fact.label = edge.label;
    fact.attributes = edge.attributes;
    fact.direction = direction;
    return fact;
}

std::vector<Fact> KnowledgeGraph::relationships_of(const std::string& id) const {
    std::vector<Fact> facts;
    auto out_it = out_edges_.find(id);
    auto in_it = in_edges_.find(id);
    if (out_it == out_edges_.end() || in_it == in_edges_.end()) return facts;

    facts.reserve(out_it->second.size() + in_it->second.size());
    for (size_t index : out_it->second) {
        facts.push_back(make_fact(edges_[index], FactDirection::Outgoing));
    }
    for (size_t index : in_it->second) {
        facts.push_back(make_fact(edges_[index], FactDirection::Incoming));
    }
    return facts;
}

std::vector<std::string> KnowledgeGraph::successors(const std::string& id) const {
    std::vector<std::string> result;
    auto it = out_edges_.find(id);
    if (it == out_edges_.end()) return result;

    std::unordered_set<std::string> seen;
    for (size_t index : it->second) {
        const auto& target = edges_[index].target;
        if (seen.insert(target).second) result.push_back(target);
    }
    return result;
}

std::vector<std::string> KnowledgeGraph::predecessors(const std::string& id) const {
    std::vector<std::string> result;
    auto it = in_edges_.find(id);
    if (it == in_edges_.end()) return result;

    std::unordered_set<std::string> seen;
    for (size_t index : it->second) {
        const auto& source = edges_[index].source;
        if (seen.insert(source).second) result.push_back(source);
    }
    return result;
}

GraphStats KnowledgeGraph::stats() const {
    GraphStats s;
    s.total_nodes = nodes_.size();
    s.total_edges = edges_.size();
    for (const auto& node : nodes_) {
        if (node.kind == NodeKind::Person) s.people++;
        else s.organizations++;
    }
    return s;
}

} // namespace graph_rag
