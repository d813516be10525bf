#ifndef CONTEXT_WINDOW_HPP
#define CONTEXT_WINDOW_HPP

#include <cstddef>
#include <deque>
#include <string>

// Last N accepted segments, oldest evicted first. Not fed back into the
// transcriber; joined() is the hook for prompt conditioning.
class ContextWindow {
public:
    explicit ContextWindow(size_t capacity);

    void push(std::string text);
    void clear() { entries_.clear(); }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }

    const std::deque<std::string>& entries() const { return entries_; }

    std::string joined() const;

private:
    size_t capacity_;
    std::deque<std::string> entries_;
};

#endif
