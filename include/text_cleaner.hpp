#pragma once

#include <memory>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>
#include "config.hpp"
#include "llm_client.hpp"

namespace voxclean {

// Removes speech disfluencies from transcribed text.
//
// Pipeline: Transcriber -> TextCleaner -> output
//
// All matchers are compiled in the constructor and never modified
// afterwards, so one instance can serve concurrent clean() calls.
class TextCleaner {
public:
    explicit TextCleaner(CleanupLevel level = CleanupLevel::Standard,
                         const std::string& api_key = "",
                         bool preserve_intentional = true);

    // Level given as "off", "light", "standard" or "aggressive".
    // Throws ConfigError for any other value.
    explicit TextCleaner(const std::string& level,
                         const std::string& api_key = "",
                         bool preserve_intentional = true);

    // Full configuration. If llm is null and config.api_key is set, a
    // GroqClient is created for the aggressive level.
    explicit TextCleaner(const CleanupConfig& config,
                         std::shared_ptr<LlmClient> llm = nullptr);

    // Main entry point - never throws, whatever the input
    std::string clean(const std::string& text) const;
    std::string clean(const char* text) const;  // nullptr is treated as ""

    // Per-level pipelines (public for testing)
    std::string clean_light(const std::string& text) const;
    std::string clean_standard(const std::string& text) const;
    std::string clean_aggressive(const std::string& text) const;

    // Individual stages (public for testing)
    std::string remove_false_starts(const std::string& text) const;
    std::string remove_fillers(const std::string& text) const;
    std::string remove_minimal_fillers(const std::string& text) const;
    std::string collapse_repetitions(const std::string& text) const;
    std::string clean_ellipses(const std::string& text) const;
    std::string normalize_whitespace(const std::string& text) const;

    // Sentence-boundary chunks of at most chunk_size characters
    std::vector<std::string> split_into_chunks(const std::string& text) const;

    CleanupLevel level() const { return level_; }
    bool preserve_intentional() const { return preserve_intentional_; }
    bool has_llm() const { return llm_ != nullptr; }

    static std::string build_prompt(const std::string& text);

private:
    struct FillerPattern {
        std::string word;
        std::regex pattern;
    };

    struct CompiledPatterns {
        std::vector<FillerPattern> minimal_fillers;   // longest first
        std::vector<FillerPattern> extended_fillers;  // longest first
        std::regex like_word;
        std::regex so_word;
        std::vector<std::string> like_continuations;
        std::vector<std::string> correction_markers;
        std::unordered_set<std::string> emphasis_words;
    };

    void compile_patterns();

    std::string remove_like_filler(const std::string& text) const;
    std::string remove_clause_start_so(const std::string& text) const;
    std::string remove_false_starts_after_ellipsis(const std::string& text,
                                                   const std::string& marker) const;
    std::string remove_repeated_clause(const std::string& text,
                                       const std::string& marker) const;
    std::string clean_chunk_with_llm(const std::string& chunk) const;
    std::string process_in_batches(const std::string& text) const;

    CleanupLevel level_;
    bool preserve_intentional_;
    size_t chunk_size_;
    float temperature_;
    std::shared_ptr<LlmClient> llm_;
    CompiledPatterns patterns_;
};

} // namespace voxclean
