#include "cli/interrupt_guard.hpp"

#include <csignal>

static_assert(std::atomic<bool>::is_always_lock_free, "signal flag must be lock-free");

std::atomic<bool> InterruptGuard::requested_{false};

void InterruptGuard::onSignal(int) {
    requested_.store(true);
}

// Constructor
InterruptGuard::InterruptGuard() {
    requested_.store(false);
    previousInt_ = std::signal(SIGINT, &InterruptGuard::onSignal);
    previousTerm_ = std::signal(SIGTERM, &InterruptGuard::onSignal);
}

// Destructor
InterruptGuard::~InterruptGuard() {
    std::signal(SIGINT, previousInt_ == SIG_ERR ? SIG_DFL : previousInt_);
    std::signal(SIGTERM, previousTerm_ == SIG_ERR ? SIG_DFL : previousTerm_);
}
