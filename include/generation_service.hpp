#pragma once
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include "KeyManager.hpp"

namespace graph_rag {

// Truncates without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Prompt in, answer out. Implementations throw GenerationError on any failure.
class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual std::string generate_text(const std::string& prompt, std::chrono::milliseconds timeout) = 0;
};

// OpenAI-compatible chat completions client (Groq by default).
class GroqGenerationService : public TextGenerator {
public:
    explicit GroqGenerationService(std::shared_ptr<KeyManager> key_manager);

    std::string generate_text(const std::string& prompt, std::chrono::milliseconds timeout) override;

    // Pulls choices[0].message.content out of a chat completions response body.
    static std::string parse_completion(const std::string& body);

private:
    std::shared_ptr<KeyManager> key_manager_;
};

} // namespace graph_rag
