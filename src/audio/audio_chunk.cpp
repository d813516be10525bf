#include "audio/audio_chunk.hpp"

#include <algorithm>
#include <cmath>

AudioChunk mix_to_mono(const AudioChunk& chunk) {
    if (chunk.channels <= 1) return chunk;

    AudioChunk out;
    out.sampleRate = chunk.sampleRate;
    out.channels = 1;

    const int frames = chunk.frames();
    out.samples.resize(frames);
    for (int i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < chunk.channels; ++c) sum += chunk.samples[(size_t)i * chunk.channels + c];
        out.samples[i] = sum / (float)chunk.channels;
    }
    return out;
}

AudioChunk resample(const AudioChunk& chunk, int targetRate) {
    if (chunk.sampleRate == targetRate || chunk.empty()) {
        AudioChunk out = chunk;
        out.sampleRate = targetRate;
        return out;
    }

    const AudioChunk mono = mix_to_mono(chunk);
    const double ratio = (double)mono.sampleRate / targetRate;
    const size_t inFrames = mono.samples.size();
    const size_t outFrames = (size_t)std::floor(inFrames / ratio);

    AudioChunk out;
    out.sampleRate = targetRate;
    out.channels = 1;
    out.samples.resize(outFrames);

    for (size_t i = 0; i < outFrames; ++i) {
        const double pos = i * ratio;
        const size_t i0 = (size_t)pos;
        const size_t i1 = std::min(i0 + 1, inFrames - 1);
        const float frac = (float)(pos - (double)i0);
        out.samples[i] = mono.samples[i0] + (mono.samples[i1] - mono.samples[i0]) * frac;
    }
    return out;
}

AudioChunk to_whisper_format(const AudioChunk& chunk) {
    return resample(mix_to_mono(chunk), kWhisperSampleRate);
}

void apply_gain(std::vector<float>& samples, float gain) {
    for (float& s : samples) s = std::clamp(s * gain, -1.0f, 1.0f);
}
