#ifndef TEXT_SANITIZER_HPP
#define TEXT_SANITIZER_HPP

#include <cstddef>
#include <string>
#include <vector>

// Collapses whitespace runs to one space and trims both ends. Idempotent.
std::string normalize_whitespace(const std::string& text);

// Removes "[BLANK_AUDIO]", "(wind blowing)" style annotations
std::string strip_annotations(const std::string& text);

std::vector<std::string> split_words(const std::string& text);
std::string join_words(const std::vector<std::string>& words, size_t first = 0);

size_t count_words(const std::string& text);

#endif
