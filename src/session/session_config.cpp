#include "session/session_config.hpp"

#include <stdexcept>
#include <string>

void SessionConfig::validate() const {
    if (modelVariant.empty()) throw std::invalid_argument("model variant is empty");
    if (chunkSeconds <= 0) throw std::invalid_argument("chunk duration must be positive");
    if (overlapSeconds < 0 || overlapSeconds >= chunkSeconds) {
        throw std::invalid_argument("overlap must be in [0, chunk duration): " + std::to_string(overlapSeconds) + "s");
    }
    if (gain <= 0.0f) throw std::invalid_argument("gain must be positive");
    if (minAudioEnergy < 0.0f) throw std::invalid_argument("energy threshold must not be negative");
    if (minWords < 1) throw std::invalid_argument("minimum word count must be at least 1");
    if (repetitionThreshold < 0.0f || repetitionThreshold > 1.0f) {
        throw std::invalid_argument("repetition threshold must be in [0, 1]");
    }
    if (overlapWords < 0) throw std::invalid_argument("overlap lookback must not be negative");
    if (maxContextChunks < 1) throw std::invalid_argument("context window must hold at least 1 chunk");
}

void print_summary(const SessionConfig& config, std::ostream& out) {
    const std::string rule(70, '=');

    out << "\n" << rule << "\n"
        << "  CONFIGURATION SUMMARY\n"
        << rule << "\n\n"
        << "MODEL:\n"
        << "  Whisper Model Variant: " << config.modelVariant << "\n"
        << "  Model Path: " << (config.modelPath.empty() ? "Auto-detect" : config.modelPath) << "\n\n"
        << "AUDIO PROCESSING:\n"
        << "  Chunk Duration: " << config.chunkSeconds << "s\n"
        << "  Overlap Duration: " << config.overlapSeconds << "s\n"
        << "  Microphone Gain: " << config.gain << "x\n"
        << "  Min Audio Energy: " << config.minAudioEnergy
        << " (gate: " << gate_policy_name(config.gatePolicy) << ")\n\n"
        << "TRANSCRIPT FILTERS:\n"
        << "  Min Words: " << config.minWords << "\n"
        << "  Repetition Threshold: " << config.repetitionThreshold << "\n"
        << "  Overlap Lookback: " << config.overlapWords << " words\n"
        << "  Context Window: " << config.maxContextChunks << " chunks\n"
        << rule << "\n\n";
}
