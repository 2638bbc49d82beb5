// Tests for GroqClient response handling and transport failures
// Compile: g++ -std=c++17 -I../include -o test_llm test_llm_client.cpp ../src/*.cpp -lcurl

#include "llm_client.hpp"
#include "text_cleaner.hpp"
#include <iostream>
#include <cassert>
#include <string>

using namespace voxclean;

void test_parse_success() {
    std::cout << "Testing successful response parsing..." << std::endl;

    const std::string body = R"({
        "id": "chatcmpl-123",
        "choices": [
            {"index": 0, "message": {"role": "assistant", "content": "  I think we should go.\n"}}
        ]
    })";

    CompletionResult result = GroqClient::parse_response(200, body);
    assert(result.success);
    assert(result.text == "I think we should go.");
    assert(result.error_kind == LlmErrorKind::None);

    std::cout << "  PASS" << std::endl;
}

void test_parse_http_errors() {
    std::cout << "Testing HTTP error classification..." << std::endl;

    CompletionResult auth = GroqClient::parse_response(
        401, R"({"error": {"message": "Invalid API Key", "type": "invalid_request_error"}})");
    assert(!auth.success);
    assert(auth.error_kind == LlmErrorKind::Authentication);
    assert(auth.error.find("Invalid API Key") != std::string::npos);
    assert(!is_retryable(auth.error_kind));

    CompletionResult forbidden = GroqClient::parse_response(403, "");
    assert(forbidden.error_kind == LlmErrorKind::Authentication);

    CompletionResult limited = GroqClient::parse_response(429, "{}");
    assert(!limited.success);
    assert(limited.error_kind == LlmErrorKind::RateLimited);
    assert(is_retryable(limited.error_kind));

    CompletionResult server = GroqClient::parse_response(503, "<html>Service Unavailable</html>");
    assert(!server.success);
    assert(server.error_kind == LlmErrorKind::Server);
    assert(server.error.find("503") != std::string::npos);
    assert(is_retryable(server.error_kind));

    std::cout << "  PASS" << std::endl;
}

void test_parse_malformed() {
    std::cout << "Testing malformed responses..." << std::endl;

    const char* bodies[] = {
        "not json at all",
        "{\"choices\": []}",
        "{\"choices\": [{\"message\": {}}]}",
        "{\"choices\": [{\"message\": {\"content\": 42}}]}",
        "{\"choices\": [{\"message\": {\"content\": \"   \"}}]}",
        "",
    };

    for (const char* body : bodies) {
        CompletionResult result = GroqClient::parse_response(200, body);
        assert(!result.success);
        assert(result.error_kind == LlmErrorKind::MalformedResponse);
        assert(!result.error.empty());
        assert(!is_retryable(result.error_kind));
    }

    std::cout << "  PASS" << std::endl;
}

void test_error_kind_names() {
    std::cout << "Testing error kind names..." << std::endl;

    assert(std::string(llm_error_kind_name(LlmErrorKind::Timeout)) == "timeout");
    assert(std::string(llm_error_kind_name(LlmErrorKind::MalformedResponse)) == "malformed-response");
    assert(is_retryable(LlmErrorKind::Transport));
    assert(!is_retryable(LlmErrorKind::None));

    std::cout << "  PASS" << std::endl;
}

void test_unreachable_endpoint() {
    std::cout << "Testing unreachable endpoint..." << std::endl;

    LlmSettings settings;
    settings.endpoint = "http://127.0.0.1:9/v1/chat/completions";
    settings.timeout_ms = 2000;

    GroqClient client("test-key", settings);
    CompletionRequest request;
    request.prompt = "Say hi";
    request.max_tokens = 16;

    CompletionResult result = client.complete(request);
    assert(!result.success);
    assert(result.error_kind == LlmErrorKind::Transport || result.error_kind == LlmErrorKind::Timeout);
    assert(!result.error.empty());

    // The cleaner swallows the failure and uses the rule pipeline
    CleanupConfig config;
    config.level = CleanupLevel::Aggressive;
    config.api_key = "test-key";
    config.llm = settings;

    TextCleaner cleaner(config);
    TextCleaner standard(CleanupLevel::Standard);
    assert(cleaner.has_llm());

    const std::string input = "Um, I I think, you know, this is fine";
    assert(cleaner.clean(input) == standard.clean(input));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== LLM Client Test Suite ===" << std::endl << std::endl;

    test_parse_success();
    test_parse_http_errors();
    test_parse_malformed();
    test_error_kind_names();
    test_unreachable_endpoint();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
