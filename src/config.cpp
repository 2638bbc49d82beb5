#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace voxclean {

namespace {

std::string normalize_literal(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");

    std::string lower = value.substr(start, end - start + 1);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') return nullptr;
    return value;
}

} // namespace

CleanupLevel cleanup_level_from_string(const std::string& value) {
    std::string lower = normalize_literal(value);

    if (lower == "off") return CleanupLevel::Disabled;
    if (lower == "light") return CleanupLevel::Light;
    if (lower == "standard") return CleanupLevel::Standard;
    if (lower == "aggressive") return CleanupLevel::Aggressive;

    throw ConfigError("Unknown cleanup level: \"" + value +
                      "\" (expected off, light, standard or aggressive)");
}

const char* cleanup_level_name(CleanupLevel level) {
    switch (level) {
        case CleanupLevel::Disabled: return "off";
        case CleanupLevel::Light: return "light";
        case CleanupLevel::Standard: return "standard";
        case CleanupLevel::Aggressive: return "aggressive";
        default: return "standard";
    }
}

bool parse_bool(const std::string& value) {
    std::string lower = normalize_literal(value);

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;

    throw ConfigError("Invalid boolean value: \"" + value + "\"");
}

CleanupConfig load_cleanup_config_from_env() {
    CleanupConfig config;

    if (const char* level = env_or_null("VOXCLEAN_CLEANUP")) {
        config.level = cleanup_level_from_string(level);
    }
    if (const char* preserve = env_or_null("VOXCLEAN_PRESERVE_INTENTIONAL")) {
        config.preserve_intentional = parse_bool(preserve);
    }
    if (const char* key = env_or_null("GROQ_API_KEY")) {
        config.api_key = key;
    }
    if (const char* model = env_or_null("VOXCLEAN_LLM_MODEL")) {
        config.llm.model = model;
    }
    if (const char* endpoint = env_or_null("VOXCLEAN_LLM_ENDPOINT")) {
        config.llm.endpoint = endpoint;
    }

    if (config.level == CleanupLevel::Aggressive && config.api_key.empty()) {
        std::cerr << "Cleanup level 'aggressive' without GROQ_API_KEY, "
                  << "standard cleanup will be used" << std::endl;
    }

    return config;
}

} // namespace voxclean
