#ifndef REPETITION_FILTER_HPP
#define REPETITION_FILTER_HPP

#include <cstddef>
#include <string>

constexpr float kDefaultRepetitionThreshold = 0.7f;
constexpr size_t kRepetitionWindowWords = 10;
constexpr size_t kRepetitionMinWords = 3;

// Bag-of-words containment check against the tail of the previous segment.
// Catches the model looping on the same short phrase; order is ignored.
bool is_repetition(const std::string& newText, const std::string& previousText,
                   float threshold = kDefaultRepetitionThreshold);

// Fraction of newText's words (case-insensitive) found in the last
// kRepetitionWindowWords words of previousText
float repetition_similarity(const std::string& newText, const std::string& previousText);

#endif
