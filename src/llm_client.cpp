#include "llm_client.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>

namespace voxclean {

namespace {

using json = nlohmann::json;

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// curl_global_init is not thread-safe; run it once per process
void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string trim_copy(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

CompletionResult failure(LlmErrorKind kind, const std::string& error) {
    CompletionResult result;
    result.success = false;
    result.error_kind = kind;
    result.error = error;
    return result;
}

// Best effort: OpenAI-style error bodies carry {"error": {"message": ...}}
std::string error_message_from_body(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("error")) return "";

    const json& err = j["error"];
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
    }
    if (err.is_string()) return err.get<std::string>();
    return "";
}

} // namespace

const char* llm_error_kind_name(LlmErrorKind kind) {
    switch (kind) {
        case LlmErrorKind::None: return "none";
        case LlmErrorKind::Transport: return "transport";
        case LlmErrorKind::Timeout: return "timeout";
        case LlmErrorKind::Authentication: return "authentication";
        case LlmErrorKind::RateLimited: return "rate-limited";
        case LlmErrorKind::Server: return "server";
        case LlmErrorKind::MalformedResponse: return "malformed-response";
        default: return "unknown";
    }
}

bool is_retryable(LlmErrorKind kind) {
    switch (kind) {
        case LlmErrorKind::Transport:
        case LlmErrorKind::Timeout:
        case LlmErrorKind::RateLimited:
        case LlmErrorKind::Server:
            return true;
        default:
            return false;
    }
}

GroqClient::GroqClient(const std::string& api_key, const LlmSettings& settings)
    : api_key_(api_key), settings_(settings) {
    ensure_curl_initialized();
}

CompletionResult GroqClient::complete(const CompletionRequest& request) {
    auto start_time = std::chrono::steady_clock::now();

    json payload = {
        {"model", settings_.model},
        {"messages", json::array({
            {{"role", "user"}, {"content", request.prompt}}
        })},
        {"max_tokens", request.max_tokens},
        {"temperature", request.temperature},
    };
    // Prompts come from raw transcriptions; never let invalid UTF-8 throw
    std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return failure(LlmErrorKind::Transport, "curl_easy_init failed");
    }

    std::string auth = "Authorization: Bearer " + api_key_;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, auth.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, settings_.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, settings_.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    CompletionResult result;
    if (res == CURLE_OPERATION_TIMEDOUT) {
        result = failure(LlmErrorKind::Timeout, curl_easy_strerror(res));
    } else if (res != CURLE_OK) {
        result = failure(LlmErrorKind::Transport, curl_easy_strerror(res));
    } else {
        result = parse_response(http_code, response);
    }

    auto end_time = std::chrono::steady_clock::now();
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time).count();
    return result;
}

CompletionResult GroqClient::parse_response(long http_status, const std::string& body) {
    if (http_status == 401 || http_status == 403) {
        std::string message = error_message_from_body(body);
        return failure(LlmErrorKind::Authentication,
                       "HTTP " + std::to_string(http_status) +
                       (message.empty() ? "" : ": " + message));
    }
    if (http_status == 429) {
        return failure(LlmErrorKind::RateLimited, "HTTP 429");
    }
    if (http_status < 200 || http_status >= 300) {
        std::string message = error_message_from_body(body);
        return failure(LlmErrorKind::Server,
                       "HTTP " + std::to_string(http_status) +
                       (message.empty() ? "" : ": " + message));
    }

    try {
        json j = json::parse(body);
        const json& content = j.at("choices").at(0).at("message").at("content");
        if (!content.is_string()) {
            return failure(LlmErrorKind::MalformedResponse, "message content is not a string");
        }

        std::string text = trim_copy(content.get<std::string>());
        if (text.empty()) {
            return failure(LlmErrorKind::MalformedResponse, "empty completion");
        }

        CompletionResult result;
        result.text = text;
        result.success = true;
        return result;
    } catch (const json::exception& e) {
        return failure(LlmErrorKind::MalformedResponse, e.what());
    }
}

} // namespace voxclean
