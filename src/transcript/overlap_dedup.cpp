#include "transcript/overlap_dedup.hpp"

#include "transcript/text_sanitizer.hpp"

#include <algorithm>

size_t overlap_length(const std::vector<std::string>& newWords, const std::vector<std::string>& previousWords,
                      size_t overlapLimit) {
    const size_t maxCheck = std::min({newWords.size(), previousWords.size(), overlapLimit});

    // Largest match wins
    for (size_t i = maxCheck; i > 0; --i) {
        if (std::equal(previousWords.end() - i, previousWords.end(), newWords.begin())) return i;
    }
    return 0;
}

std::string remove_overlap(const std::string& newText, const std::vector<std::string>& previousWords,
                           size_t overlapLimit) {
    const std::vector<std::string> newWords = split_words(newText);
    return join_words(newWords, overlap_length(newWords, previousWords, overlapLimit));
}
