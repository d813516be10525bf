#include <cassert>
#include <string>
#include <vector>
#include "transcript/repetition_filter.hpp"

int main() {
    const std::vector<std::string> texts = {"", "x", "the quick fox", "a b c d e f g h i j k l"};
    for (const auto& x : texts) {
        for (float t : {0.0f, 0.5f, 0.7f, 1.0f}) {
            assert(!is_repetition(x, "", t));
            assert(!is_repetition("", x, t));
        }
    }

    assert(is_repetition("the quick fox", "the quick fox jumped", 0.7f));
    assert(!is_repetition("completely different sentence here", "the quick fox jumped", 0.7f));

    // Case-insensitive, order-insensitive
    assert(is_repetition("FOX Quick THE", "the quick fox jumped"));

    // Fewer than three words is never judged
    assert(!is_repetition("the quick", "the quick fox"));

    // Only the last ten words of the previous text count
    const std::string prev = "alpha beta gamma one two three four five six seven eight nine ten";
    assert(!is_repetition("alpha beta gamma", prev));
    assert(is_repetition("eight nine ten", prev));

    // Strictly greater than the threshold: 2 of 3 words is 0.667
    assert(!is_repetition("the quick brown", "the quick fox", 0.7f));
    assert(is_repetition("the quick brown", "the quick fox", 0.6f));

    const float sim = repetition_similarity("are you doing today", "there how are you");
    assert(sim > 0.49f && sim < 0.51f);
    return 0;
}
