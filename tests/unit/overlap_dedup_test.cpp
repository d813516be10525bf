#include <cassert>
#include <string>
#include <vector>
#include "transcript/overlap_dedup.hpp"

int main() {
    const std::vector<std::string> prev = {"the", "quick", "brown", "fox", "jumped", "over"};
    assert(remove_overlap("jumped over the lazy dog", prev, 5) == "the lazy dog");

    assert(remove_overlap("brand new content", {"unrelated", "words", "here"}, 5) == "brand new content");

    // Nothing to compare against
    assert(remove_overlap("brand new content", {}, 5) == "brand new content");
    assert(remove_overlap("", prev, 5) == "");

    // Everything overlapped: nothing new to show
    assert(remove_overlap("fox jumped over", prev, 5) == "");

    // Longest match wins: "b a b" matches as three words, not as the single trailing "b"
    const std::vector<std::string> abab = {"a", "b", "a", "b"};
    assert(remove_overlap("b a b c", abab, 5) == "c");

    // The lookback limit caps how far back a match may reach
    assert(remove_overlap("quick brown fox jumped over next", prev, 3) == "quick brown fox jumped over next");
    assert(remove_overlap("fox jumped over next", prev, 3) == "next");

    // Case-sensitive tokens
    assert(remove_overlap("Jumped Over it", prev, 5) == "Jumped Over it");

    assert(overlap_length({"over", "the"}, prev, 5) == 1);
    assert(overlap_length({"over", "the"}, prev, 0) == 0);
    return 0;
}
