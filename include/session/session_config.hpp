#ifndef SESSION_CONFIG_HPP
#define SESSION_CONFIG_HPP

#include "audio/energy_gate.hpp"

#include <ostream>
#include <string>

// Fixed before the loop starts, read-only afterwards
struct SessionConfig {
    std::string modelVariant = "base"; // tiny or base
    std::string modelPath;             // empty until resolved

    int chunkSeconds = 7;
    int overlapSeconds = 2;
    float gain = 30.0f;
    float minAudioEnergy = 0.0002f;
    GatePolicy gatePolicy = GatePolicy::AnyOf;

    int minWords = 1;
    float repetitionThreshold = 0.7f;
    int overlapWords = 5;
    int maxContextChunks = 4;

    // Stage each iteration's audio here as WAV; empty keeps everything in memory
    std::string workDir;

    // Throws std::invalid_argument naming the first bad field
    void validate() const;
};

void print_summary(const SessionConfig& config, std::ostream& out);

#endif
