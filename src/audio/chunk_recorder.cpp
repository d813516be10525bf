#include "audio/chunk_recorder.hpp"

#include <algorithm>

// Constructor
ChunkRecorder::ChunkRecorder(Config config) : config_(config) {
    overlapSamples_ = (int)(((long long)config_.overlapMs * config_.sampleRate) / 1000);
    tail_.reserve(overlapSamples_);
}

// Drops the overlap tail; the next chunk is recorded at full length.
// Called when a capture fails or comes back empty. A normal transcription
// gap between captures keeps the tail, so the chunk after it is spliced.
void ChunkRecorder::reset() {
    tail_.clear();
}

// Seconds of new audio the next chunk needs from the source
double ChunkRecorder::freshSeconds() const {
    const int ms = tail_.empty() ? config_.chunkMs : config_.chunkMs - config_.overlapMs;
    return ms / 1000.0;
}

AudioChunk ChunkRecorder::assemble(const std::vector<float>& fresh) {
    AudioChunk chunk;
    chunk.sampleRate = config_.sampleRate;
    chunk.channels = 1;
    chunk.samples.reserve(tail_.size() + fresh.size());
    chunk.samples.insert(chunk.samples.end(), tail_.begin(), tail_.end());
    chunk.samples.insert(chunk.samples.end(), fresh.begin(), fresh.end());

    keepTail(chunk.samples);
    return chunk;
}

void ChunkRecorder::keepTail(const std::vector<float>& chunk) {
    tail_.clear();
    if (overlapSamples_ <= 0) return;

    const size_t keep = std::min(chunk.size(), (size_t)overlapSamples_);
    tail_.insert(tail_.end(), chunk.end() - keep, chunk.end());
}
