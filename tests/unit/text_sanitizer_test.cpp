#include <cassert>
#include <string>
#include <vector>
#include "transcript/text_sanitizer.hpp"

int main() {
    assert(normalize_whitespace("  hello   there\t\nhow  ") == "hello there how");
    assert(normalize_whitespace("") == "");
    assert(normalize_whitespace(" \t\r\n ") == "");
    assert(normalize_whitespace("one") == "one");

    const std::vector<std::string> samples = {
        "", " ", "a", "  a  b  ", "\tTab\tseparated\t", "line\nbreaks\r\nhere", "already clean text",
        "  Mixed   CASE and  punctuation , here .  "};
    for (const auto& s : samples) {
        const std::string once = normalize_whitespace(s);
        assert(normalize_whitespace(once) == once);
        assert(once.find("  ") == std::string::npos);
        assert(once.empty() || (once.front() != ' ' && once.back() != ' '));
    }

    assert(normalize_whitespace(strip_annotations(" [BLANK_AUDIO] ")) == "");
    assert(normalize_whitespace(strip_annotations("so (wind blowing) anyway [Music] yes")) == "so anyway yes");
    // Unclosed brackets are speech, not annotations
    assert(strip_annotations("a [b") == "a [b");

    const auto words = split_words("  the quick\tbrown  fox ");
    assert(words.size() == 4);
    assert(words[0] == "the" && words[3] == "fox");
    assert(join_words(words) == "the quick brown fox");
    assert(join_words(words, 2) == "brown fox");
    assert(join_words(words, 4) == "");
    assert(count_words("") == 0);
    assert(count_words("a b  c") == 3);
    return 0;
}
