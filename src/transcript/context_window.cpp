#include "transcript/context_window.hpp"

#include <stdexcept>
#include <utility>

// Constructor
ContextWindow::ContextWindow(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("context window capacity must be at least 1");
}

void ContextWindow::push(std::string text) {
    entries_.push_back(std::move(text));
    while (entries_.size() > capacity_) entries_.pop_front();
}

std::string ContextWindow::joined() const {
    std::string out;
    for (const std::string& e : entries_) {
        if (!out.empty()) out += ' ';
        out += e;
    }
    return out;
}
