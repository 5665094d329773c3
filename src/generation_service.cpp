#include "generation_service.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace graph_rag {

using json = nlohmann::json;

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

GroqGenerationService::GroqGenerationService(std::shared_ptr<KeyManager> key_manager)
    : key_manager_(std::move(key_manager)) {}

std::string GroqGenerationService::generate_text(const std::string& prompt, std::chrono::milliseconds timeout) {
    std::string key = key_manager_->get_current_key();
    if (key.empty()) {
        throw GenerationError("no active API key");
    }

    json payload = {
        {"model", key_manager_->get_model()},
        {"temperature", key_manager_->get_temperature()},
        {"messages", json::array({{{"role", "user"}, {"content", prompt}}})}
    };

    auto start = std::chrono::high_resolution_clock::now();
    cpr::Response r = cpr::Post(cpr::Url{key_manager_->get_endpoint()},
                                cpr::Body{payload.dump(-1, ' ', false, json::error_handler_t::replace)},
                                cpr::Header{{"Content-Type", "application/json"},
                                            {"Authorization", "Bearer " + key}},
                                cpr::Timeout{timeout});
    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();

    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        spdlog::error("Generation request timed out after {} ms", timeout.count());
        throw GenerationError("request timed out after " + std::to_string(timeout.count()) + " ms");
    }
    if (r.error) {
        spdlog::error("Generation transport error: {}", r.error.message);
        throw GenerationError("transport error: " + r.error.message);
    }
    if (r.status_code == 429) {
        spdlog::warn("Generation quota exceeded (429). Rotating key for the next request.");
        key_manager_->report_rate_limit();
        throw GenerationError("rate limited (HTTP 429)");
    }
    if (r.status_code != 200) {
        spdlog::error("Generation API error [{}]: {}", r.status_code, utf8_safe_substr(r.text, 500));
        throw GenerationError("HTTP " + std::to_string(r.status_code));
    }

    spdlog::info("LLM response received in {:.2f} ms", duration);
    return parse_completion(r.text);
}

std::string GroqGenerationService::parse_completion(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
            const auto& message = j["choices"][0].value("message", json::object());
            if (message.contains("content") && message["content"].is_string()) {
                return message["content"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        throw GenerationError(std::string("malformed response: ") + e.what());
    }
    throw GenerationError("malformed response: no choices[0].message.content");
}

} // namespace graph_rag
