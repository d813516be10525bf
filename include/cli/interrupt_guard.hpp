#ifndef INTERRUPT_GUARD_HPP
#define INTERRUPT_GUARD_HPP

#include <atomic>

// SIGINT/SIGTERM only raise a flag while the guard is alive; repeated
// signals are harmless. Previous handlers come back on destruction.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    const std::atomic<bool>& flag() const { return requested_; }
    bool requested() const { return requested_.load(); }

    // Same effect as receiving a signal
    void request() { requested_.store(true); }

private:
    using Handler = void (*)(int);

    static std::atomic<bool> requested_;
    static void onSignal(int);

    Handler previousInt_ = nullptr;
    Handler previousTerm_ = nullptr;
};

#endif
