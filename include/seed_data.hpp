#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "knowledge_graph.hpp"

namespace graph_rag {

// Built-in sample dataset: five tech CEOs, eight companies, seventeen relationships.
SeedData default_seed_data();

// Expects { "people": [...], "organizations": [...], "relationships": [...] }.
// Throws GraphConstructionError on unreadable or malformed input.
SeedData seed_data_from_json(const nlohmann::json& j);
SeedData load_seed_file(const std::string& path);

} // namespace graph_rag
