#include "transcript/repetition_filter.hpp"

#include "transcript/text_sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <vector>

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

float repetition_similarity(const std::string& newText, const std::string& previousText) {
    const std::vector<std::string> newWords = split_words(lowercase(newText));
    const std::vector<std::string> prevWords = split_words(lowercase(previousText));
    if (newWords.empty() || prevWords.empty()) return 0.0f;

    const size_t window = std::min(prevWords.size(), kRepetitionWindowWords);
    const std::unordered_set<std::string> prevEnd(prevWords.end() - window, prevWords.end());

    size_t matches = 0;
    for (const std::string& w : newWords) {
        if (prevEnd.count(w)) ++matches;
    }
    return (float)matches / (float)newWords.size();
}

bool is_repetition(const std::string& newText, const std::string& previousText, float threshold) {
    if (newText.empty() || previousText.empty()) return false;

    // Too short to judge
    if (count_words(newText) < kRepetitionMinWords) return false;

    return repetition_similarity(newText, previousText) > threshold;
}
