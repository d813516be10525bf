#include "session/transcription_session.hpp"

#include "audio/energy_gate.hpp"
#include "transcript/overlap_dedup.hpp"
#include "transcript/repetition_filter.hpp"
#include "transcript/text_sanitizer.hpp"

#include <stdexcept>
#include <utility>

static ChunkRecorder::Config recorder_config(const SessionConfig& config) {
    ChunkRecorder::Config rc;
    rc.sampleRate = kWhisperSampleRate;
    rc.chunkMs = config.chunkSeconds * 1000;
    rc.overlapMs = config.overlapSeconds * 1000;
    return rc;
}

static SessionConfig checked(SessionConfig config) {
    config.validate();
    return config;
}

// Constructor
TranscriptionSession::TranscriptionSession(SessionConfig config, AudioSource& source, Transcriber& transcriber,
                                           const std::atomic<bool>& stopRequested, std::ostream& out,
                                           std::ostream& log)
    : config_(checked(std::move(config))),
      source_(source),
      transcriber_(transcriber),
      stopRequested_(stopRequested),
      out_(out),
      log_(log),
      state_((size_t)config_.maxContextChunks),
      recorder_(recorder_config(config_)),
      started_(std::chrono::steady_clock::now()) {}

SessionStats TranscriptionSession::run() {
    started_ = std::chrono::steady_clock::now();

    while (!stopRequested_.load() && !source_.exhausted()) {
        const Outcome outcome = step();
        if (outcome != Outcome::Displayed) {
            log_ << "[Session] [DEBUG] segment " << state_.segmentNum << ": " << outcome_name(outcome) << "\n";
        }
    }
    return stats();
}

TranscriptionSession::Outcome TranscriptionSession::step() {
    ++state_.segmentNum;

    AudioChunk raw;
    try {
        raw = source_.capture(recorder_.freshSeconds());
    } catch (const DeviceLostError&) {
        throw;
    } catch (const CaptureError& e) {
        log_ << "[Session] [WARN] capture failed: " << e.what() << "\n";
        recorder_.reset();
        return Outcome::CaptureFailed;
    }

    if (stopRequested_.load()) return Outcome::Cancelled;
    if (raw.empty()) {
        recorder_.reset();
        return Outcome::NoAudio;
    }

    // Both working files are removed on every return path below
    WorkingFile rawFile = stage(raw, "seg");

    AudioChunk chunk = recorder_.assemble(to_whisper_format(raw).samples);

    // Gate runs before gain so amplified noise never reaches the transcriber
    if (!has_sufficient_audio(chunk.samples, config_.minAudioEnergy, config_.gatePolicy)) return Outcome::Silent;

    apply_gain(chunk.samples, config_.gain);
    WorkingFile procFile = stage(chunk, "proc");

    std::string text;
    try {
        text = transcriber_.transcribe(chunk.samples);
    } catch (const TranscriptionError& e) {
        log_ << "[Session] [WARN] transcription failed: " << e.what() << "\n";
        return Outcome::TranscriptionFailed;
    }

    text = normalize_whitespace(text);

    const std::vector<std::string> words = split_words(text);
    if (words.size() < (size_t)config_.minWords) return Outcome::TooFewWords;

    if (is_repetition(text, state_.lastAcceptedText, config_.repetitionThreshold)) return Outcome::Repetition;

    const std::string fresh = remove_overlap(text, state_.lastAcceptedWords, (size_t)config_.overlapWords);
    if (fresh.empty()) return Outcome::FullyOverlapped;

    display(fresh);

    state_.lastAcceptedText = text;
    state_.lastAcceptedWords = words;
    state_.contextBuffer.push(text);
    ++state_.acceptedSegments;
    state_.totalWords += (long)count_words(fresh);
    state_.totalAudioSeconds += chunk.seconds();

    return Outcome::Displayed;
}

SessionStats TranscriptionSession::stats() const {
    SessionStats s;
    s.segments = state_.segmentNum;
    s.acceptedSegments = state_.acceptedSegments;
    s.totalWords = state_.totalWords;
    s.totalAudioSeconds = state_.totalAudioSeconds;
    s.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    return s;
}

// Writes the chunk under workDir when staging is enabled
WorkingFile TranscriptionSession::stage(const AudioChunk& chunk, const char* prefix) {
    if (config_.workDir.empty()) return WorkingFile();

    WorkingFile file(config_.workDir + "/" + prefix + "_" + std::to_string(state_.segmentNum) + ".wav", log_);
    try {
        write_wav(file.path(), chunk);
    } catch (const std::runtime_error& e) {
        log_ << "[Session] [WARN] " << e.what() << "\n";
    }
    return file;
}

// Single growing line: no leading space on the first piece, one before every later piece
void TranscriptionSession::display(const std::string& text) {
    if (!state_.firstOutput) out_ << ' ';
    out_ << text << std::flush;
    state_.firstOutput = false;
}

const char* outcome_name(TranscriptionSession::Outcome outcome) {
    switch (outcome) {
        case TranscriptionSession::Outcome::Displayed: return "displayed";
        case TranscriptionSession::Outcome::Cancelled: return "cancelled";
        case TranscriptionSession::Outcome::NoAudio: return "no audio";
        case TranscriptionSession::Outcome::CaptureFailed: return "capture failed";
        case TranscriptionSession::Outcome::Silent: return "below energy threshold";
        case TranscriptionSession::Outcome::TranscriptionFailed: return "transcription failed";
        case TranscriptionSession::Outcome::TooFewWords: return "too few words";
        case TranscriptionSession::Outcome::Repetition: return "repetition";
        case TranscriptionSession::Outcome::FullyOverlapped: return "nothing new after overlap";
    }
    return "unknown";
}
