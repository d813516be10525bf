#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/transcriber.hpp"

#include <chrono>
#include <string>
#include <vector>

struct whisper_context;

class WhisperSTT : public Transcriber {
public:
    struct Config {
        std::string modelPath;
        std::string language = "en";

        int threads = 4;
        int beamSize = 5;

        bool useGpu = false;

        float noSpeechThreshold = 0.6f;

        int timeoutMs = 0; // 0 disables the per-call deadline
    };

    explicit WhisperSTT(Config config);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::string transcribe(const std::vector<float>& pcm16kMono) override;
    std::string describe() const override;

private:
    Config config_;
    whisper_context* context_ = nullptr;

    std::chrono::steady_clock::time_point deadline_;

    static bool pastDeadline(void* self);
};

#endif
