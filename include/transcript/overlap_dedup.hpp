#ifndef OVERLAP_DEDUP_HPP
#define OVERLAP_DEDUP_HPP

#include <cstddef>
#include <string>
#include <vector>

// Drops the longest run of leading words in newText (at most overlapLimit)
// that exactly repeats the trailing words of previousWords. Matching is
// case-sensitive on whitespace-split tokens. Returns "" when every word
// was overlap.
std::string remove_overlap(const std::string& newText, const std::vector<std::string>& previousWords,
                           size_t overlapLimit);

// Number of leading words remove_overlap would drop
size_t overlap_length(const std::vector<std::string>& newWords, const std::vector<std::string>& previousWords,
                      size_t overlapLimit);

#endif
