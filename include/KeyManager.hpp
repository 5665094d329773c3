#pragma once
#include <vector>
#include <string>
#include <cstdlib>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace graph_rag {

// Credentials and model settings for the generation service.
// Sources: the first keys.json found on the search path, plus GROQ_API_KEY.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string model = "llama-3.1-8b-instant";
    std::string endpoint = "https://api.groq.com/openai/v1/chat/completions";
    double temperature = 0.0;

public:
    static constexpr const char* kEnvKey = "GROQ_API_KEY";

    KeyManager() {
        refresh_key_pool();
    }

    explicit KeyManager(const nlohmann::json& config) {
        std::unique_lock lock(pool_mutex);
        load_from_json(config);
    }

    void refresh_key_pool() {
        std::unique_lock lock(pool_mutex);
        key_pool.clear();

        std::vector<std::string> search_paths = {
            "keys.json",
            "../keys.json",
            "build/keys.json",
            "../../keys.json"
        };

        std::ifstream f;
        std::string found_path;
        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
            f.clear();
        }

        if (!found_path.empty()) {
            try {
                load_from_json(nlohmann::json::parse(f));
                spdlog::info("Loaded generation settings from {}", found_path);
            } catch (const std::exception& e) {
                spdlog::error("Failed to parse {}: {}", found_path, e.what());
            }
        }

        if (const char* env = std::getenv(kEnvKey); env && *env) {
            key_pool.push_back({env, true, 0});
        }

        if (key_pool.empty()) {
            spdlog::warn("{} not set and no keys.json found. LLM features disabled.", kEnvKey);
        } else {
            spdlog::info("Generation key pool ready: {} key(s), model {}", key_pool.size(), model);
        }
    }

    bool has_key() const {
        return get_active_key_count() > 0;
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    // Next active key starting at the current index; empty if none remain.
    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        for (size_t i = 0; i < key_pool.size(); ++i) {
            const auto& k = key_pool[(current_index + i) % key_pool.size()];
            if (k.is_active) return k.key;
        }
        return "";
    }

    std::string get_model() const {
        std::shared_lock lock(pool_mutex);
        return model;
    }

    std::string get_endpoint() const {
        std::shared_lock lock(pool_mutex);
        return endpoint;
    }

    double get_temperature() const {
        std::shared_lock lock(pool_mutex);
        return temperature;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("Key #{} deactivated after repeated rate limits", current_index % key_pool.size());
        }
        current_index = (current_index + 1) % key_pool.size();
    }

private:
    // Caller holds the unique lock.
    void load_from_json(const nlohmann::json& j) {
        if (j.contains("keys") && j["keys"].is_array()) {
            for (const auto& k : j["keys"]) {
                if (k.is_string() && !k.get<std::string>().empty()) {
                    key_pool.push_back({k.get<std::string>(), true, 0});
                }
            }
        }
        model = j.value("model", model);
        endpoint = j.value("endpoint", endpoint);
        temperature = j.value("temperature", temperature);
    }
};

} // namespace graph_rag
