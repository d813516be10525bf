#ifndef TRANSCRIPTION_SESSION_HPP
#define TRANSCRIPTION_SESSION_HPP

#include "audio/audio_source.hpp"
#include "audio/chunk_recorder.hpp"
#include "audio/wav_file.hpp"
#include "session/session_config.hpp"
#include "session/session_state.hpp"
#include "session/session_stats.hpp"
#include "stt/transcriber.hpp"

#include <atomic>
#include <chrono>
#include <ostream>
#include <string>

// record -> gate -> gain -> transcribe -> sanitize -> filter -> dedupe -> display
class TranscriptionSession {
public:
    enum class Outcome {
        Displayed,
        Cancelled,
        NoAudio,
        CaptureFailed,
        Silent,
        TranscriptionFailed,
        TooFewWords,
        Repetition,
        FullyOverlapped
    };

    // out receives the transcript, log the per-iteration diagnostics
    TranscriptionSession(SessionConfig config, AudioSource& source, Transcriber& transcriber,
                         const std::atomic<bool>& stopRequested, std::ostream& out, std::ostream& log);

    // Loops until a stop is requested or the source runs dry.
    // DeviceLostError propagates; stats() stays valid afterwards.
    SessionStats run();

    // One iteration
    Outcome step();

    const SessionState& state() const { return state_; }
    SessionStats stats() const;

private:
    SessionConfig config_;
    AudioSource& source_;
    Transcriber& transcriber_;
    const std::atomic<bool>& stopRequested_;
    std::ostream& out_;
    std::ostream& log_;

    SessionState state_;
    ChunkRecorder recorder_;

    std::chrono::steady_clock::time_point started_;

    WorkingFile stage(const AudioChunk& chunk, const char* prefix);
    void display(const std::string& text);
};

const char* outcome_name(TranscriptionSession::Outcome outcome);

#endif
