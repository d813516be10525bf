#include "transcript/text_sanitizer.hpp"

#include <cctype>
#include <sstream>

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string normalize_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool pendingSpace = false;
    for (char c : text) {
        if (is_space(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) out += ' ';
        pendingSpace = false;
        out += c;
    }
    return out;
}

std::string strip_annotations(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '[' || text[i] == '(') {
            const char close = (text[i] == '[') ? ']' : ')';
            const size_t end = text.find(close, i + 1);
            if (end != std::string::npos) {
                i = end + 1;
                continue;
            }
        }
        clean += text[i++];
    }
    return clean;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string w;
    while (in >> w) words.push_back(w);
    return words;
}

std::string join_words(const std::vector<std::string>& words, size_t first) {
    std::string out;
    for (size_t i = first; i < words.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += words[i];
    }
    return out;
}

size_t count_words(const std::string& text) {
    return split_words(text).size();
}
