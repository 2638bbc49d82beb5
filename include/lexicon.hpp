#pragma once

#include <string>
#include <vector>

namespace voxclean {

// Interjections removed at every cleanup level
inline const std::vector<std::string> FILLERS_MINIMAL = {
    "um", "uh", "ah", "er", "hmm", "mm", "mhm",
};

// Discourse markers added on top of FILLERS_MINIMAL for standard cleanup
inline const std::vector<std::string> FILLERS_DISCOURSE = {
    "like", "you know", "i mean", "so", "basically",
    "actually", "literally", "right", "okay", "well",
    "anyway", "you see", "kind of", "sort of",
};

// Phrases that signal a false start or self-correction
inline const std::vector<std::string> CORRECTION_MARKERS = {
    "sorry", "i mean", "no wait", "actually",
    "let me rephrase", "correction", "rather",
};

// Intensifiers whose doubling is treated as intentional emphasis
inline const std::vector<std::string> EMPHASIS_WORDS = {
    "very", "really", "so", "much", "too", "super",
};

// Words after "like" that mark verb/comparison usage ("like the", "like to")
inline const std::vector<std::string> LIKE_CONTINUATIONS = {
    "to", "the", "a", "my", "your", "this", "that", "it",
};

// FILLERS_MINIMAL followed by FILLERS_DISCOURSE
std::vector<std::string> extended_fillers();

// Copy of entries ordered longest first; equal lengths keep table order
std::vector<std::string> longest_first(const std::vector<std::string>& entries);

// Escape regex metacharacters so an entry matches literally
std::string escape_regex(const std::string& literal);

} // namespace voxclean
