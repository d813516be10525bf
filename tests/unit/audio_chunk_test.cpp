#include <cassert>
#include <cmath>
#include <vector>
#include "audio/audio_chunk.hpp"
#include "audio/chunk_recorder.hpp"

static bool near(float a, float b) { return std::fabs(a - b) < 1e-5f; }

int main() {
    // Stereo mixdown averages the channels
    AudioChunk stereo;
    stereo.sampleRate = 48000;
    stereo.channels = 2;
    stereo.samples = {0.2f, 0.4f, -1.0f, 1.0f, 0.5f, 0.5f};
    const AudioChunk mono = mix_to_mono(stereo);
    assert(mono.channels == 1 && mono.samples.size() == 3);
    assert(near(mono.samples[0], 0.3f) && near(mono.samples[1], 0.0f) && near(mono.samples[2], 0.5f));

    // 48 kHz stereo -> 16 kHz mono keeps the duration
    AudioChunk second;
    second.sampleRate = 48000;
    second.channels = 2;
    second.samples.assign(48000 * 2, 0.25f);
    const AudioChunk w = to_whisper_format(second);
    assert(w.sampleRate == kWhisperSampleRate && w.channels == 1);
    assert(w.samples.size() == 16000);
    assert(near((float)w.seconds(), 1.0f));
    assert(near(w.samples[100], 0.25f));

    // Already in format: untouched
    AudioChunk ready;
    ready.samples = {0.1f, 0.2f};
    assert(to_whisper_format(ready).samples == ready.samples);

    // Gain then clip to [-1, 1]
    std::vector<float> s = {0.01f, -0.02f, 0.5f, -0.9f};
    apply_gain(s, 30.0f);
    assert(near(s[0], 0.3f) && near(s[1], -0.6f) && s[2] == 1.0f && s[3] == -1.0f);

    // Overlapping chunk assembly: 3 s chunks with 1 s overlap at 10 Hz for readability
    ChunkRecorder::Config rc;
    rc.sampleRate = 10;
    rc.chunkMs = 3000;
    rc.overlapMs = 1000;
    ChunkRecorder recorder(rc);
    assert(recorder.freshSeconds() == 3.0);

    std::vector<float> first(30);
    for (int i = 0; i < 30; ++i) first[i] = (float)i;
    AudioChunk c1 = recorder.assemble(first);
    assert(c1.samples.size() == 30);
    assert(recorder.hasTail() && recorder.tail().size() == 10 && recorder.tail().front() == 20.0f);
    assert(recorder.freshSeconds() == 2.0);

    std::vector<float> next(20, -1.0f);
    AudioChunk c2 = recorder.assemble(next);
    assert(c2.samples.size() == 30);
    assert(c2.samples[0] == 20.0f && c2.samples[9] == 29.0f && c2.samples[10] == -1.0f);
    assert(near((float)c2.seconds(), 3.0f));

    recorder.reset();
    assert(!recorder.hasTail() && recorder.freshSeconds() == 3.0);

    // No overlap configured: never holds a tail
    rc.overlapMs = 0;
    ChunkRecorder plain(rc);
    plain.assemble(first);
    assert(!plain.hasTail() && plain.freshSeconds() == 3.0);
    return 0;
}
