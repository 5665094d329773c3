#include "seed_data.hpp"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace graph_rag {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

EdgeAttributes year(int y) {
    EdgeAttributes a;
    a.year = y;
    return a;
}

EdgeAttributes role(const std::string& r) {
    EdgeAttributes a;
    a.role = r;
    return a;
}

EdgeAttributes type(const std::string& t) {
    EdgeAttributes a;
    a.type = t;
    return a;
}

std::string required_string(const json& j, const char* key, const char* record) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw GraphConstructionError(std::string("Seed ") + record + " record is missing string field '" + key + "': " + j.dump());
    }
    return j[key].get<std::string>();
}

} // namespace

SeedData default_seed_data() {
    SeedData seeds;

    seeds.people = {
        {"p1", "Elon Musk", "CEO"},
        {"p2", "Sam Altman", "CEO"},
        {"p3", "Satya Nadella", "CEO"},
        {"p4", "Jensen Huang", "CEO"},
        {"p5", "Demis Hassabis", "CEO"},
    };

    seeds.organizations = {
        {"c1", "Tesla", "automotive"},
        {"c2", "SpaceX", "aerospace"},
        {"c3", "OpenAI", "AI"},
        {"c4", "Microsoft", "technology"},
        {"c5", "NVIDIA", "semiconductors"},
        {"c6", "DeepMind", "AI"},
        {"c7", "Google", "technology"},
        {"c8", "Neuralink", "neurotechnology"},
    };

    EdgeAttributes investment;
    investment.amount = "$13B";
    investment.year = 2023;

    EdgeAttributes gpus;
    gpus.product = "GPUs";

    seeds.relationships = {
        // Elon Musk
        {"p1", "c1", "founded", year(2003)},
        {"p1", "c2", "founded", year(2002)},
        {"p1", "c8", "founded", year(2016)},
        {"p1", "c1", "leads", role("CEO")},
        {"p1", "c2", "leads", role("CEO")},

        // Sam Altman
        {"p2", "c3", "leads", role("CEO")},
        {"p2", "c3", "co_founded", year(2015)},

        // Satya Nadella
        {"p3", "c4", "leads", role("CEO")},

        // Jensen Huang
        {"p4", "c5", "founded", year(1993)},
        {"p4", "c5", "leads", role("CEO")},

        // Demis Hassabis
        {"p5", "c6", "founded", year(2010)},
        {"p5", "c6", "leads", role("CEO")},

        // Company to company
        {"c4", "c3", "invested_in", investment},
        {"c4", "c3", "partners_with", type("strategic")},
        {"c7", "c6", "acquired", year(2014)},
        {"c5", "c3", "supplies", gpus},
        {"c5", "c4", "partners_with", type("hardware")},
    };

    return seeds;
}

SeedData seed_data_from_json(const json& j) {
    if (!j.is_object()) {
        throw GraphConstructionError("Seed document must be a JSON object");
    }

    SeedData seeds;
    try {
        for (const auto& p : j.value("people", json::array())) {
            seeds.people.push_back({
                required_string(p, "id", "person"),
                required_string(p, "name", "person"),
                p.value("role", "")
            });
        }

        for (const auto& o : j.value("organizations", json::array())) {
            seeds.organizations.push_back({
                required_string(o, "id", "organization"),
                required_string(o, "name", "organization"),
                o.value("industry", "")
            });
        }

        for (const auto& r : j.value("relationships", json::array())) {
            seeds.relationships.push_back({
                required_string(r, "source", "relationship"),
                required_string(r, "target", "relationship"),
                required_string(r, "relation", "relationship"),
                EdgeAttributes::from_json(r.value("attributes", json::object()))
            });
        }
    } catch (const json::exception& e) {
        throw GraphConstructionError(std::string("Malformed seed data: ") + e.what());
    }
    return seeds;
}

SeedData load_seed_file(const std::string& path) {
    if (!fs::exists(path)) {
        throw GraphConstructionError("Seed file not found: " + path);
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw GraphConstructionError("Cannot open seed file: " + path);
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw GraphConstructionError("Failed to parse seed file " + path + ": " + e.what());
    }

    auto seeds = seed_data_from_json(j);
    spdlog::info("Loaded seed file {}: {} people, {} organizations, {} relationships",
                 path, seeds.people.size(), seeds.organizations.size(), seeds.relationships.size());
    return seeds;
}

} // namespace graph_rag
