#include <cassert>
#include <csignal>
#include "cli/interrupt_guard.hpp"

static volatile std::sig_atomic_t outerHits = 0;

static void outer_handler(int) { outerHits = outerHits + 1; }

int main() {
    std::signal(SIGINT, outer_handler);
    std::signal(SIGTERM, outer_handler);

    {
        InterruptGuard guard;
        assert(!guard.requested());

        // Repeated interrupts only keep the flag raised
        std::raise(SIGINT);
        std::raise(SIGINT);
        assert(guard.requested());
        assert(guard.flag().load());
        assert(outerHits == 0);
    }

    // Previous handlers are back once the guard is gone
    std::raise(SIGINT);
    assert(outerHits == 1);
    assert(std::signal(SIGINT, outer_handler) == outer_handler);
    assert(std::signal(SIGTERM, outer_handler) == outer_handler);

    {
        InterruptGuard guard;
        assert(!guard.requested());

        std::raise(SIGTERM);
        assert(guard.requested());
        assert(outerHits == 1);
    }

    {
        InterruptGuard guard;
        assert(!guard.requested());
        guard.request();
        guard.request();
        assert(guard.requested());
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    return 0;
}
