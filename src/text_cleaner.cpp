#include "text_cleaner.hpp"
#include "lexicon.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <iostream>

namespace voxclean {

namespace {

// Removing one disfluency can expose another ("so so good" -> "so good"),
// so the light and standard pipelines rerun until the text settles
constexpr int MAX_PASSES = 5;

// Responses shorter than this fraction of the input are considered
// over-aggressive and discarded
constexpr double MIN_LLM_LENGTH_RATIO = 0.3;

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string to_lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), lower);
    return result;
}

// Case-insensitive compare of text[a, a+len) with text[b, b+len)
bool equal_icase(const std::string& text, size_t a, size_t b, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        if (lower(text[a + i]) != lower(text[b + i])) return false;
    }
    return true;
}

// Does text contain `phrase` (lowercase) at pos, ending on a word boundary?
bool phrase_at(const std::string& text, size_t pos, const std::string& phrase) {
    if (pos + phrase.size() > text.size()) return false;
    for (size_t i = 0; i < phrase.size(); ++i) {
        if (lower(text[pos + i]) != phrase[i]) return false;
    }
    size_t end = pos + phrase.size();
    return end == text.size() || !is_word_char(text[end]) || !is_word_char(text[end - 1]);
}

size_t skip_spaces(const std::string& text, size_t pos) {
    while (pos < text.size() && is_space(text[pos])) ++pos;
    return pos;
}

bool is_terminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// One optional comma plus the whitespace after it
size_t skip_trailing(const std::string& text, size_t pos) {
    if (pos < text.size() && text[pos] == ',') ++pos;
    return skip_spaces(text, pos);
}

// Drops each match of pattern that keep() rejects, together with its
// trailing comma and whitespace. Patterns only cover the word itself so
// the regex match length stays bounded however long the input is.
template <typename Keep>
std::string remove_matches(const std::string& text, const std::regex& pattern, Keep keep) {
    std::string result;
    size_t copied = 0;

    std::sregex_iterator it(text.begin(), text.end(), pattern);
    std::sregex_iterator end;
    for (; it != end; ++it) {
        size_t pos = static_cast<size_t>(it->position());
        size_t match_end = pos + static_cast<size_t>(it->length());
        if (pos < copied || keep(pos, match_end)) continue;

        result.append(text, copied, pos - copied);
        copied = skip_trailing(text, match_end);
    }

    result.append(text, copied, std::string::npos);
    return result;
}

std::string remove_matches(const std::string& text, const std::regex& pattern) {
    return remove_matches(text, pattern, [](size_t, size_t) { return false; });
}

} // namespace

TextCleaner::TextCleaner(CleanupLevel level, const std::string& api_key, bool preserve_intentional)
    : TextCleaner([&] {
          CleanupConfig config;
          config.level = level;
          config.api_key = api_key;
          config.preserve_intentional = preserve_intentional;
          return config;
      }()) {}

TextCleaner::TextCleaner(const std::string& level, const std::string& api_key, bool preserve_intentional)
    : TextCleaner(cleanup_level_from_string(level), api_key, preserve_intentional) {}

TextCleaner::TextCleaner(const CleanupConfig& config, std::shared_ptr<LlmClient> llm)
    : level_(config.level),
      preserve_intentional_(config.preserve_intentional),
      chunk_size_(config.chunk_size > 0 ? config.chunk_size : 500),
      temperature_(config.llm.temperature),
      llm_(std::move(llm)) {
    if (!llm_ && !config.api_key.empty()) {
        llm_ = std::make_shared<GroqClient>(config.api_key, config.llm);
    }
    compile_patterns();
}

void TextCleaner::compile_patterns() {
    const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

    // Standalone entry; the trailing comma and whitespace are consumed by hand
    auto filler_pattern = [&](const std::string& word) {
        return FillerPattern{word, std::regex(R"(\b)" + escape_regex(word) + R"(\b)", flags)};
    };

    for (const auto& word : longest_first(FILLERS_MINIMAL)) {
        patterns_.minimal_fillers.push_back(filler_pattern(word));
    }
    for (const auto& word : longest_first(extended_fillers())) {
        patterns_.extended_fillers.push_back(filler_pattern(word));
    }

    patterns_.like_word = std::regex(R"(\blike\b)", flags);
    patterns_.so_word = std::regex(R"(\bso\b)", flags);

    patterns_.like_continuations = LIKE_CONTINUATIONS;
    patterns_.correction_markers = CORRECTION_MARKERS;
    patterns_.emphasis_words.insert(EMPHASIS_WORDS.begin(), EMPHASIS_WORDS.end());
}

std::string TextCleaner::clean(const char* text) const {
    if (text == nullptr) return std::string();
    return clean(std::string(text));
}

std::string TextCleaner::clean(const std::string& text) const {
    if (level_ == CleanupLevel::Disabled || text.empty()) return text;

    try {
        switch (level_) {
            case CleanupLevel::Light: return clean_light(text);
            case CleanupLevel::Standard: return clean_standard(text);
            case CleanupLevel::Aggressive: return clean_aggressive(text);
            default: return text;
        }
    } catch (const std::exception& e) {
        std::cerr << "Text cleanup failed, returning raw text: " << e.what() << std::endl;
        return text;
    }
}

std::string TextCleaner::clean_light(const std::string& text) const {
    if (text.empty()) return text;

    std::string result = text;
    for (int pass = 0; pass < MAX_PASSES; ++pass) {
        std::string prev = result;
        result = normalize_whitespace(remove_minimal_fillers(result));
        if (result == prev) break;
    }
    return result;
}

std::string TextCleaner::clean_standard(const std::string& text) const {
    if (text.empty()) return text;

    std::string result = text;
    for (int pass = 0; pass < MAX_PASSES; ++pass) {
        std::string prev = result;

        // Order matters: false starts, fillers, repetitions, ellipses
        result = remove_false_starts(result);
        result = remove_fillers(result);
        result = collapse_repetitions(result);
        result = clean_ellipses(result);
        result = normalize_whitespace(result);

        if (result == prev) break;
    }
    return result;
}

std::string TextCleaner::clean_aggressive(const std::string& text) const {
    if (text.empty()) return text;

    if (!llm_) {
        return clean_standard(text);
    }

    if (text.size() > chunk_size_) {
        return process_in_batches(text);
    }
    return clean_chunk_with_llm(text);
}

std::string TextCleaner::build_prompt(const std::string& text) {
    return "Clean this speech transcription by removing disfluencies.\n"
           "\n"
           "Remove: filler words (um, uh, like, you know), false starts, repetitions, "
           "incomplete sentences before corrections.\n"
           "Preserve: core meaning, natural tone, intentional emphasis.\n"
           "\n"
           "Input: " + text + "\n"
           "\n"
           "Output only the cleaned text, nothing else:";
}

std::string TextCleaner::clean_chunk_with_llm(const std::string& chunk) const {
    CompletionRequest request;
    request.prompt = build_prompt(chunk);
    request.max_tokens = static_cast<int>(std::min<size_t>(chunk.size() * 2, INT_MAX));
    request.temperature = temperature_;

    CompletionResult result;
    try {
        result = llm_->complete(request);
    } catch (const std::exception& e) {
        std::cerr << "LLM cleanup failed, using rule-based: " << e.what() << std::endl;
        return clean_standard(chunk);
    }

    if (!result.success) {
        std::cerr << "LLM cleanup failed (" << llm_error_kind_name(result.error_kind)
                  << (is_retryable(result.error_kind) ? ", transient" : ", permanent")
                  << "), using rule-based: " << result.error << std::endl;
        return clean_standard(chunk);
    }

    if (static_cast<double>(result.text.size()) <
        static_cast<double>(chunk.size()) * MIN_LLM_LENGTH_RATIO) {
        std::cerr << "LLM removed too much text (" << result.text.size() << " of "
                  << chunk.size() << " chars), falling back to standard" << std::endl;
        return clean_standard(chunk);
    }

    return result.text;
}

std::string TextCleaner::process_in_batches(const std::string& text) const {
    std::vector<std::string> chunks = split_into_chunks(text);

    std::string joined;
    for (const auto& chunk : chunks) {
        std::string cleaned = clean_chunk_with_llm(chunk);
        if (cleaned.empty()) continue;
        if (!joined.empty()) joined += ' ';
        joined += cleaned;
    }
    return normalize_whitespace(joined);
}

std::vector<std::string> TextCleaner::split_into_chunks(const std::string& text) const {
    if (text.size() <= chunk_size_) return {text};

    // Sentences end at . ! or ? followed by whitespace
    std::vector<std::string> sentences;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (is_terminal(text[i]) && i + 1 < text.size() && is_space(text[i + 1])) {
            sentences.push_back(text.substr(start, i + 1 - start));
            start = skip_spaces(text, i + 1);
            i = start - 1;
        }
    }
    if (start < text.size()) sentences.push_back(text.substr(start));

    std::vector<std::string> chunks;
    std::string current;
    for (const auto& raw : sentences) {
        std::string sentence = normalize_whitespace(raw);
        if (sentence.empty()) continue;

        if (!current.empty() && current.size() + 1 + sentence.size() > chunk_size_) {
            chunks.push_back(current);
            current.clear();
        }

        if (current.empty()) {
            // An oversize sentence becomes a chunk of its own
            if (sentence.size() > chunk_size_) {
                chunks.push_back(sentence);
            } else {
                current = sentence;
            }
        } else {
            current += ' ';
            current += sentence;
        }
    }
    if (!current.empty()) chunks.push_back(current);

    if (chunks.empty()) chunks.push_back(text);
    return chunks;
}

std::string TextCleaner::remove_false_starts(const std::string& text) const {
    std::string result = text;
    for (const auto& marker : patterns_.correction_markers) {
        // "X... sorry, Y" -> "Y"
        result = remove_false_starts_after_ellipsis(result, marker);
        // "X, sorry, X" -> "X"
        result = remove_repeated_clause(result, marker);
    }
    return result;
}

std::string TextCleaner::remove_false_starts_after_ellipsis(const std::string& text,
                                                            const std::string& marker) const {
    std::string result;
    size_t copied = 0;
    size_t i = 0;

    while (i < text.size()) {
        if (text[i] != '.') {
            ++i;
            continue;
        }

        size_t run_start = i;
        size_t run_end = i;
        while (run_end < text.size() && text[run_end] == '.') ++run_end;
        i = run_end;
        if (run_end - run_start < 3) continue;

        size_t marker_pos = skip_spaces(text, run_end);
        if (!phrase_at(text, marker_pos, marker)) continue;

        size_t kept_start = marker_pos + marker.size();
        if (kept_start < text.size() && text[kept_start] == ',') ++kept_start;
        kept_start = skip_spaces(text, kept_start);

        // Abandoned clause runs back to the previous sentence end
        size_t clause_start = run_start;
        while (clause_start > copied && !is_terminal(text[clause_start - 1])) --clause_start;
        while (clause_start < run_start && is_space(text[clause_start])) ++clause_start;

        result.append(text, copied, clause_start - copied);
        if (!result.empty() && !is_space(result.back()) && kept_start < text.size()) {
            result += ' ';
        }
        copied = kept_start;
        i = kept_start;
    }

    result.append(text, copied, std::string::npos);
    return result;
}

std::string TextCleaner::remove_repeated_clause(const std::string& text,
                                                const std::string& marker) const {
    std::string result;
    size_t copied = 0;
    size_t segment_start = 0;  // first char after the previous comma

    for (size_t comma = 0; comma < text.size(); ++comma) {
        if (text[comma] != ',') continue;

        size_t lo = std::max(copied, segment_start);
        segment_start = comma + 1;

        size_t marker_pos = skip_spaces(text, comma + 1);
        if (!phrase_at(text, marker_pos, marker)) continue;

        size_t rest = marker_pos + marker.size();
        if (rest < text.size() && text[rest] == ',') ++rest;
        rest = skip_spaces(text, rest);

        // Leftmost clause start whose text repeats right after the marker
        for (size_t s = lo; s < comma; ++s) {
            if (is_space(text[s])) continue;
            if (s > 0 && is_word_char(text[s - 1]) && is_word_char(text[s])) continue;

            size_t len = comma - s;
            if (rest + len > text.size()) continue;
            if (!equal_icase(text, s, rest, len)) continue;

            size_t end = rest + len;
            if (end < text.size() && is_word_char(text[end]) && is_word_char(text[end - 1])) continue;

            // Keep the first occurrence, drop ", marker, <repeat>"
            result.append(text, copied, comma - copied);
            copied = end;
            comma = end - 1;
            segment_start = end;
            break;
        }
    }

    result.append(text, copied, std::string::npos);
    return result;
}

std::string TextCleaner::remove_minimal_fillers(const std::string& text) const {
    std::string result = text;
    for (const auto& filler : patterns_.minimal_fillers) {
        result = remove_matches(result, filler.pattern);
    }
    return result;
}

std::string TextCleaner::remove_fillers(const std::string& text) const {
    std::string result = text;

    for (const auto& filler : patterns_.extended_fillers) {
        if (filler.word == "like" && preserve_intentional_) {
            result = remove_like_filler(result);
        } else if (filler.word == "so") {
            // Only at the start of a clause; "I think so" keeps its "so"
            result = remove_clause_start_so(result);
        } else {
            result = remove_matches(result, filler.pattern);
        }
    }

    return result;
}

// "like" is kept as a verb after the pronoun "I" ("I like this") and
// before a continuation word ("like to", "like the"); everything else
// is treated as filler. This is a heuristic, not a parse.
std::string TextCleaner::remove_like_filler(const std::string& text) const {
    return remove_matches(text, patterns_.like_word, [&](size_t pos, size_t match_end) {
        bool after_pronoun = pos >= 2 && is_space(text[pos - 1]) &&
                             lower(text[pos - 2]) == 'i' &&
                             (pos == 2 || !is_word_char(text[pos - 3]));
        if (after_pronoun) return true;

        size_t next = skip_spaces(text, match_end);
        if (next == match_end) return false;
        for (const auto& word : patterns_.like_continuations) {
            if (phrase_at(text, next, word)) return true;
        }
        return false;
    });
}

// "So I think" and "..., so we" lose the "so"; "I think so" does not.
// The text before "so" is kept as is.
std::string TextCleaner::remove_clause_start_so(const std::string& text) const {
    std::string result;
    size_t copied = 0;

    std::sregex_iterator it(text.begin(), text.end(), patterns_.so_word);
    std::sregex_iterator end;
    for (; it != end; ++it) {
        size_t pos = static_cast<size_t>(it->position());
        if (pos < copied) continue;

        // Clause start: beginning of text, ". " or ","
        bool clause_start = pos == 0;
        if (!clause_start) {
            size_t b = pos;
            while (b > copied && is_space(text[b - 1])) --b;
            clause_start = b > copied &&
                           (text[b - 1] == ',' || (text[b - 1] == '.' && b < pos));
        }
        if (!clause_start) continue;

        size_t after = pos + static_cast<size_t>(it->length());
        if (after < text.size() && text[after] == ',') ++after;
        size_t next = skip_spaces(text, after);
        if (next == after || next == text.size() || !is_ascii_alpha(text[next])) continue;

        // "So so many" is emphasis
        if (preserve_intentional_ && phrase_at(text, next, "so")) continue;

        result.append(text, copied, pos - copied);
        copied = next;
    }

    result.append(text, copied, std::string::npos);
    return result;
}

std::string TextCleaner::collapse_repetitions(const std::string& text) const {
    struct Word {
        size_t pos;
        size_t len;
    };

    std::vector<Word> words;
    size_t pos = 0;
    while (pos < text.size()) {
        if (!is_word_char(text[pos])) {
            ++pos;
            continue;
        }
        size_t start = pos;
        while (pos < text.size() && is_word_char(text[pos])) ++pos;
        words.push_back({start, pos - start});
    }

    auto only_spaces_between = [&](const Word& a, const Word& b) {
        for (size_t i = a.pos + a.len; i < b.pos; ++i) {
            if (!is_space(text[i])) return false;
        }
        return b.pos > a.pos + a.len;
    };

    std::string result;
    size_t copied = 0;
    size_t i = 0;
    while (i < words.size()) {
        const Word& first = words[i];
        size_t j = i;
        while (j + 1 < words.size() && words[j + 1].len == first.len &&
               only_spaces_between(words[j], words[j + 1]) &&
               equal_icase(text, first.pos, words[j + 1].pos, first.len)) {
            ++j;
        }

        if (j > i) {
            bool emphasis = preserve_intentional_ &&
                            patterns_.emphasis_words.count(to_lower(text.substr(first.pos, first.len))) > 0;
            if (!emphasis) {
                // Keep the first occurrence, drop the stutter
                result.append(text, copied, first.pos + first.len - copied);
                copied = words[j].pos + words[j].len;
            }
        }
        i = j + 1;
    }

    result.append(text, copied, std::string::npos);
    return result;
}

std::string TextCleaner::clean_ellipses(const std::string& text) const {
    auto dot_run_end = [&](size_t pos) {
        while (pos < text.size() && text[pos] == '.') ++pos;
        return pos;
    };

    // Leading "..." and the whitespace around it
    size_t copied = 0;
    size_t first = skip_spaces(text, 0);
    size_t first_end = dot_run_end(first);
    if (first_end - first >= 2) copied = skip_spaces(text, first_end);

    // ". ..." -> ". "
    std::string result;
    for (size_t i = copied; i < text.size(); ++i) {
        if (text[i] != '.') continue;
        size_t dots = skip_spaces(text, i + 1);
        if (dots == i + 1) continue;
        size_t dots_end = dot_run_end(dots);
        if (dots_end - dots < 2) continue;

        result.append(text, copied, i - copied);
        result += ". ";
        copied = skip_spaces(text, dots_end);
        i = copied - 1;
    }

    result.append(text, copied, std::string::npos);
    return result;
}

std::string TextCleaner::normalize_whitespace(const std::string& text) const {
    if (text.empty()) return text;

    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (!is_space(c)) {
            result += c;
            ++i;
            continue;
        }

        size_t run_end = skip_spaces(text, i);

        // Drop whitespace before punctuation and at either end
        bool before_punct = run_end < text.size() &&
                            (text[run_end] == '.' || text[run_end] == ',' ||
                             text[run_end] == '!' || text[run_end] == '?');
        if (before_punct || result.empty() || run_end == text.size()) {
            i = run_end;
            continue;
        }

        // Collapse runs of plain spaces, keep tabs and newlines
        for (size_t k = i; k < run_end; ++k) {
            if (text[k] == ' ' && k > i && text[k - 1] == ' ') continue;
            result += text[k];
        }
        i = run_end;
    }

    return result;
}

} // namespace voxclean
