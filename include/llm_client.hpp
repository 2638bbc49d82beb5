#pragma once

#include <string>
#include <cstdint>
#include "config.hpp"

namespace voxclean {

enum class LlmErrorKind {
    None,
    Transport,          // DNS, connect, TLS, reset
    Timeout,
    Authentication,     // 401 / 403
    RateLimited,        // 429
    Server,             // 5xx and other non-2xx
    MalformedResponse   // Bad JSON, missing fields, empty content
};

const char* llm_error_kind_name(LlmErrorKind kind);

// Transient failures worth surfacing differently in logs.
// The cleaner itself never retries.
bool is_retryable(LlmErrorKind kind);

struct CompletionRequest {
    std::string prompt;
    int max_tokens = 256;
    float temperature = 0.1f;
};

struct CompletionResult {
    std::string text;
    bool success = false;
    std::string error;
    LlmErrorKind error_kind = LlmErrorKind::None;
    int64_t duration_ms = 0;
};

// Text-completion collaborator used by the aggressive cleanup level.
// Implementations must be safe to call from several threads at once.
class LlmClient {
public:
    virtual ~LlmClient() = default;
    virtual CompletionResult complete(const CompletionRequest& request) = 0;
};

// OpenAI-compatible chat completions client (Groq by default)
class GroqClient : public LlmClient {
public:
    GroqClient(const std::string& api_key, const LlmSettings& settings = LlmSettings());

    CompletionResult complete(const CompletionRequest& request) override;

    // Parse a chat-completions response body (public for testing)
    static CompletionResult parse_response(long http_status, const std::string& body);

private:
    std::string api_key_;
    LlmSettings settings_;
};

} // namespace voxclean
