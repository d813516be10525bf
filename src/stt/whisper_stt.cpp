#include "stt/whisper_stt.hpp"
#include "transcript/text_sanitizer.hpp"

#include <whisper.h>
#include <filesystem>
#include <stdexcept>
#include <utility>

// Constructor
WhisperSTT::WhisperSTT(Config config) : config_(std::move(config)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.useGpu;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + config_.modelPath);
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

bool WhisperSTT::pastDeadline(void* self) {
    const auto* stt = static_cast<const WhisperSTT*>(self);
    return std::chrono::steady_clock::now() >= stt->deadline_;
}

// Converts pcm16kMono into text (std::string)
std::string WhisperSTT::transcribe(const std::vector<float>& pcm16kMono) {
    if (pcm16kMono.empty()) return {};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = false;

    params.beam_search.beam_size = config_.beamSize;
    params.temperature = 0.0f;

    // Each chunk stands alone; a previous-text prompt feeds hallucination loops
    params.no_context = true;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_special = false;
    params.print_timestamps = false;

    params.no_speech_thold = config_.noSpeechThreshold;

    if (config_.timeoutMs > 0) {
        deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeoutMs);
        params.abort_callback = &WhisperSTT::pastDeadline;
        params.abort_callback_user_data = this;
    }

    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (rc != 0) {
        if (config_.timeoutMs > 0 && pastDeadline(this)) {
            throw TranscriptionError("whisper_full timed out after " + std::to_string(config_.timeoutMs) + " ms");
        }
        throw TranscriptionError("whisper_full failed (" + std::to_string(rc) + ")");
    }

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(context_, i);
        if (text) out += text;
    }
    return strip_annotations(out);
}

std::string WhisperSTT::describe() const {
    return "whisper.cpp " + std::filesystem::path(config_.modelPath).filename().string() +
           (config_.useGpu ? " (GPU)" : " (CPU, " + std::to_string(config_.threads) + " threads)");
}
