#ifndef SESSION_STATE_HPP
#define SESSION_STATE_HPP

#include "transcript/context_window.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Owned by one TranscriptionSession; changes only when a segment is accepted
struct SessionState {
    explicit SessionState(size_t maxContextChunks) : contextBuffer(maxContextChunks) {}

    std::string lastAcceptedText;              // pre-dedup, for repetition checks
    std::vector<std::string> lastAcceptedWords; // pre-dedup, for overlap checks
    ContextWindow contextBuffer;

    int segmentNum = 0;
    int acceptedSegments = 0;
    long totalWords = 0;
    double totalAudioSeconds = 0.0;

    bool firstOutput = true;
};

#endif
