#ifndef CHUNK_RECORDER_HPP
#define CHUNK_RECORDER_HPP

#include "audio/audio_chunk.hpp"

#include <vector>

class ChunkRecorder {
public:
    struct Config {
        int sampleRate = kWhisperSampleRate;

        int chunkMs = 7000;
        int overlapMs = 2000;
    };

    explicit ChunkRecorder(Config config);

    double freshSeconds() const;

    AudioChunk assemble(const std::vector<float>& fresh);

    bool hasTail() const { return !tail_.empty(); }
    const std::vector<float>& tail() const { return tail_; }

    void reset();

private:
    Config config_;

    int overlapSamples_ = 0;

    std::vector<float> tail_;

    void keepTail(const std::vector<float>& chunk);
};

#endif
