#include <gtest/gtest.h>
#include "generation_service.hpp"

using namespace graph_rag;
using json = nlohmann::json;

// ─── Response parsing ──────────────────────────────────────────

TEST(GenerationServiceTest, ParsesChatCompletion) {
    std::string body = R"({"choices": [{"index": 0, "message": {"role": "assistant", "content": "Tesla, SpaceX and Neuralink."}}]})";
    EXPECT_EQ(GroqGenerationService::parse_completion(body), "Tesla, SpaceX and Neuralink.");
}

TEST(GenerationServiceTest, MalformedResponsesThrow) {
    EXPECT_THROW(GroqGenerationService::parse_completion("not json"), GenerationError);
    EXPECT_THROW(GroqGenerationService::parse_completion(R"({"choices": []})"), GenerationError);
    EXPECT_THROW(GroqGenerationService::parse_completion(R"({"choices": [{"message": {}}]})"), GenerationError);
    EXPECT_THROW(GroqGenerationService::parse_completion(R"({"error": {"message": "bad"}})"), GenerationError);
}

TEST(GenerationServiceTest, NoKeyFailsWithoutNetwork) {
    auto keys = std::make_shared<KeyManager>(json::object());
    GroqGenerationService service(keys);
    EXPECT_THROW(service.generate_text("prompt", std::chrono::milliseconds(100)), GenerationError);
}

TEST(GenerationServiceTest, Utf8SafeSubstr) {
    EXPECT_EQ(utf8_safe_substr("hello", 10), "hello");
    EXPECT_EQ(utf8_safe_substr("hello", 3), "hel");
    // "é" is two bytes; cutting through it drops the partial sequence
    EXPECT_EQ(utf8_safe_substr("caf\xC3\xA9", 4), "caf");
}

// ─── KeyManager ────────────────────────────────────────────────

TEST(KeyManagerTest, LoadsSettingsFromJson) {
    KeyManager keys(json{{"keys", {"k1", "", "k2"}}, {"model", "test-model"}, {"temperature", 0.5}});
    EXPECT_TRUE(keys.has_key());
    EXPECT_EQ(keys.get_active_key_count(), 2u);
    EXPECT_EQ(keys.get_current_key(), "k1");
    EXPECT_EQ(keys.get_model(), "test-model");
    EXPECT_DOUBLE_EQ(keys.get_temperature(), 0.5);
    EXPECT_EQ(keys.get_endpoint(), "https://api.groq.com/openai/v1/chat/completions");
}

TEST(KeyManagerTest, EmptyConfigHasNoKey) {
    KeyManager keys(json::object());
    EXPECT_FALSE(keys.has_key());
    EXPECT_EQ(keys.get_current_key(), "");
    EXPECT_EQ(keys.get_model(), "llama-3.1-8b-instant");
}

TEST(KeyManagerTest, RateLimitRotatesAndDeactivates) {
    KeyManager keys(json{{"keys", {"k1", "k2"}}});
    keys.report_rate_limit();
    EXPECT_EQ(keys.get_current_key(), "k2");
    keys.report_rate_limit();
    EXPECT_EQ(keys.get_current_key(), "k1");

    // k1 and k2 alternate; each deactivates on its third strike
    for (int i = 0; i < 4; ++i) keys.report_rate_limit();
    EXPECT_EQ(keys.get_active_key_count(), 0u);
    EXPECT_FALSE(keys.has_key());
}
