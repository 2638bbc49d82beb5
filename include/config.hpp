#pragma once

#include <string>
#include <stdexcept>
#include <cstddef>

namespace voxclean {

// Cleanup aggressiveness levels
enum class CleanupLevel {
    Disabled,   // No cleanup, text passes through untouched
    Light,      // Interjections only (um, uh, ah)
    Standard,   // Fillers + repetitions + false starts
    Aggressive  // LLM rewrite, falls back to Standard
};

// Raised for setup mistakes (bad level literal, bad boolean value).
// Runtime cleanup never throws.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// LLM settings for the aggressive level
struct LlmSettings {
    std::string endpoint = "https://api.groq.com/openai/v1/chat/completions";
    std::string model = "llama-3.1-8b-instant";
    long timeout_ms = 10000;
    float temperature = 0.1f;
};

struct CleanupConfig {
    CleanupLevel level = CleanupLevel::Standard;
    bool preserve_intentional = true;  // Keep "very very", verb "like"

    // Credential for the aggressive level; empty means fall back to Standard
    std::string api_key;
    LlmSettings llm;

    // Max characters per LLM request (~500 chars = ~100-125 tokens)
    size_t chunk_size = 500;
};

// Parse "off" | "light" | "standard" | "aggressive" (case-insensitive).
// Throws ConfigError on anything else.
CleanupLevel cleanup_level_from_string(const std::string& value);

// Inverse of cleanup_level_from_string
const char* cleanup_level_name(CleanupLevel level);

// Parse 1/0, true/false, yes/no, on/off. Throws ConfigError otherwise.
bool parse_bool(const std::string& value);

// Build a config from VOXCLEAN_CLEANUP, VOXCLEAN_PRESERVE_INTENTIONAL,
// GROQ_API_KEY, VOXCLEAN_LLM_MODEL and VOXCLEAN_LLM_ENDPOINT.
// Unset variables keep their defaults.
CleanupConfig load_cleanup_config_from_env();

} // namespace voxclean
