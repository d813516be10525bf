#ifndef AUDIO_CHUNK_HPP
#define AUDIO_CHUNK_HPP

#include <vector>

constexpr int kWhisperSampleRate = 16000;

// Interleaved float samples in [-1, 1]
struct AudioChunk {
    std::vector<float> samples;
    int sampleRate = kWhisperSampleRate;
    int channels = 1;

    bool empty() const { return samples.empty(); }
    int frames() const { return channels > 0 ? (int)samples.size() / channels : 0; }
    double seconds() const { return sampleRate > 0 ? (double)frames() / sampleRate : 0.0; }
};

AudioChunk mix_to_mono(const AudioChunk& chunk);
AudioChunk resample(const AudioChunk& chunk, int targetRate);

// Mono 16 kHz, the layout every transcriber expects
AudioChunk to_whisper_format(const AudioChunk& chunk);

// Multiplies by gain and clamps to [-1, 1]
void apply_gain(std::vector<float>& samples, float gain);

#endif
