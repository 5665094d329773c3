#include "entity_recognizer.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace graph_rag {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "elon musk" -> "Elon Musk"
std::string title_case(const std::string& s) {
    std::string out = s;
    bool start = true;
    for (auto& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(start ? std::toupper(uc) : std::tolower(uc));
            start = false;
        } else {
            start = true;
        }
    }
    return out;
}

struct IntentKeywords {
    Relation relation;
    std::vector<std::string> stems;
};

const std::vector<IntentKeywords>& intent_table() {
    static const std::vector<IntentKeywords> table = {
        {Relation::Founded, {"found", "start", "creat", "establish"}},
        {Relation::Leads, {"lead", "run", "ceo", "head", "manage"}},
        {Relation::WorksAt, {"work", "employ"}},
        {Relation::InvestedIn, {"invest", "fund", "money"}},
        {Relation::Acquired, {"acquir", "bought", "purchase"}},
        {Relation::PartnersWith, {"partner", "collaborat", "work with"}},
        {Relation::Supplies, {"supply", "provide", "sell"}},
    };
    return table;
}

} // namespace

EntityCatalog EntityCatalog::defaults() {
    EntityCatalog catalog;
    catalog.surface_forms = {
        // People
        "elon musk", "elon", "musk",
        "sam altman", "sam", "altman",
        "satya nadella", "satya", "nadella",
        "jensen huang", "jensen", "huang",
        "demis hassabis", "demis", "hassabis",
        // Companies
        "tesla",
        "spacex",
        "openai",
        "microsoft",
        "nvidia",
        "deepmind",
        "google",
        "neuralink",
    };

    catalog.aliases = {
        {"elon", "elon musk"}, {"musk", "elon musk"},
        {"sam", "sam altman"}, {"altman", "sam altman"},
        {"satya", "satya nadella"}, {"nadella", "satya nadella"},
        {"jensen", "jensen huang"}, {"huang", "jensen huang"},
        {"demis", "demis hassabis"}, {"hassabis", "demis hassabis"},
    };

    catalog.display_names = {
        {"spacex", "SpaceX"},
        {"openai", "OpenAI"},
        {"nvidia", "NVIDIA"},
        {"deepmind", "DeepMind"},
    };

    catalog.person_tokens = {"musk", "altman", "nadella", "huang", "hassabis"};
    return catalog;
}

EntityRecognizer::EntityRecognizer() : EntityRecognizer(EntityCatalog::defaults()) {}

EntityRecognizer::EntityRecognizer(EntityCatalog catalog) : catalog_(std::move(catalog)) {
    for (const auto& form : catalog_.surface_forms) {
        scan_order_.push_back(to_lower(form));
    }
    std::stable_sort(scan_order_.begin(), scan_order_.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

std::vector<EntityMention> EntityRecognizer::detect(const std::string& text) const {
    std::vector<EntityMention> detected;
    std::string text_lower = to_lower(text);
    std::unordered_set<std::string> seen_names;

    for (const auto& form : scan_order_) {
        if (form.empty() || text_lower.find(form) == std::string::npos) continue;

        auto alias_it = catalog_.aliases.find(form);
        std::string canonical = alias_it != catalog_.aliases.end() ? alias_it->second : form;

        if (!seen_names.insert(canonical).second) continue;

        detected.push_back({display_name(canonical), classify(canonical), form});
    }
    return detected;
}

NodeKind EntityRecognizer::classify(const std::string& canonical) const {
    std::istringstream tokens(canonical);
    std::string token;
    while (tokens >> token) {
        if (catalog_.person_tokens.count(token)) return NodeKind::Person;
    }
    return NodeKind::Organization;
}

std::string EntityRecognizer::display_name(const std::string& canonical) const {
    auto it = catalog_.display_names.find(canonical);
    if (it != catalog_.display_names.end()) return it->second;
    return title_case(canonical);
}

std::vector<Relation> EntityRecognizer::extract_relationship_intents(const std::string& text) {
    std::vector<Relation> intents;
    std::string text_lower = to_lower(text);

    for (const auto& entry : intent_table()) {
        bool hit = std::any_of(entry.stems.begin(), entry.stems.end(), [&](const std::string& stem) {
            return text_lower.find(stem) != std::string::npos;
        });
        if (hit) intents.push_back(entry.relation);
    }
    return intents;
}

} // namespace graph_rag
