#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP
// Scripted stand-ins for the microphone and the speech model.

#include "audio/audio_source.hpp"
#include "stt/transcriber.hpp"

#include <cmath>
#include <deque>
#include <functional>
#include <string>
#include <vector>

class ScriptedAudioSource : public AudioSource {
public:
    struct Item {
        enum Kind { Audio, Empty, CaptureFail, DeviceLost } kind = Audio;
        float amplitude = 0.1f; // 0 gives digital silence
        int sampleRate = 16000;
        int channels = 1;
    };

    void speech(float amplitude = 0.1f, int sampleRate = 16000, int channels = 1) {
        Item it;
        it.amplitude = amplitude;
        it.sampleRate = sampleRate;
        it.channels = channels;
        items_.push_back(it);
    }
    void silence() { speech(0.0f); }
    void push(Item::Kind kind) {
        Item it;
        it.kind = kind;
        items_.push_back(it);
    }

    AudioChunk capture(double seconds) override {
        requested.push_back(seconds);
        Item it = items_.front();
        items_.pop_front();

        if (it.kind == Item::CaptureFail) throw CaptureError("device busy");
        if (it.kind == Item::DeviceLost) throw DeviceLostError("device unplugged");

        AudioChunk chunk;
        chunk.sampleRate = it.sampleRate;
        chunk.channels = it.channels;
        if (it.kind == Item::Empty) return chunk;

        const int frames = (int)std::lround(seconds * it.sampleRate);
        chunk.samples.resize((size_t)frames * it.channels);
        for (int i = 0; i < frames; ++i) {
            const float v = it.amplitude * (float)std::sin(2.0 * 3.14159265358979 * 440.0 * i / it.sampleRate);
            for (int c = 0; c < it.channels; ++c) chunk.samples[(size_t)i * it.channels + c] = v;
        }
        return chunk;
    }

    bool exhausted() const override { return items_.empty(); }
    std::string describe() const override { return "scripted"; }

    std::vector<double> requested;

private:
    std::deque<Item> items_;
};

class ScriptedTranscriber : public Transcriber {
public:
    void say(const std::string& text) { replies_.push_back({text, false}); }
    void fail(const std::string& why) { replies_.push_back({why, true}); }

    std::string transcribe(const std::vector<float>& pcm16kMono) override {
        ++calls;
        lastInput = pcm16kMono;
        if (onTranscribe) onTranscribe();

        Reply r = replies_.front();
        replies_.pop_front();
        if (r.fails) throw TranscriptionError(r.text);
        return r.text;
    }

    std::string describe() const override { return "scripted"; }

    int calls = 0;
    std::vector<float> lastInput;
    std::function<void()> onTranscribe;

private:
    struct Reply {
        std::string text;
        bool fails;
    };
    std::deque<Reply> replies_;
};

#endif
