#include "lexicon.hpp"
#include <algorithm>
#include <cstring>

namespace voxclean {

std::vector<std::string> extended_fillers() {
    std::vector<std::string> fillers = FILLERS_MINIMAL;
    fillers.insert(fillers.end(), FILLERS_DISCOURSE.begin(), FILLERS_DISCOURSE.end());
    return fillers;
}

std::vector<std::string> longest_first(const std::vector<std::string>& entries) {
    std::vector<std::string> sorted = entries;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const std::string& a, const std::string& b) {
                         return a.size() > b.size();
                     });
    return sorted;
}

std::string escape_regex(const std::string& literal) {
    static const char* special = R"(\^$.|?*+()[]{})";

    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        if (c != '\0' && std::strchr(special, c) != nullptr) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

} // namespace voxclean
