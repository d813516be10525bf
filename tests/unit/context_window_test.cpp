#include <cassert>
#include <stdexcept>
#include <string>
#include "transcript/context_window.hpp"

int main() {
    ContextWindow window(4);
    assert(window.empty());

    for (int i = 1; i <= 25; ++i) {
        window.push("segment " + std::to_string(i));
        assert(window.size() <= window.capacity());
    }
    assert(window.size() == 4);

    // Oldest evicted first
    assert(window.entries().front() == "segment 22");
    assert(window.entries().back() == "segment 25");
    assert(window.joined() == "segment 22 segment 23 segment 24 segment 25");

    ContextWindow single(1);
    single.push("a");
    single.push("b");
    assert(single.size() == 1 && single.entries().front() == "b");

    bool threw = false;
    try {
        ContextWindow bad(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    return 0;
}
