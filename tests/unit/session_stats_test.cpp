#include <cassert>
#include <sstream>
#include <string>
#include "session/session_stats.hpp"

int main() {
    SessionStats stats;
    assert(stats.speedFactor() == 0.0);

    stats.totalAudioSeconds = 50.0;
    assert(stats.speedFactor() == 0.0);

    stats.elapsedSeconds = 10.0;
    stats.segments = 9;
    stats.acceptedSegments = 7;
    stats.totalWords = 42;
    assert(stats.speedFactor() == 5.0);
    assert(format_speed_factor(stats.speedFactor()) == "5.00x");
    assert(format_speed_factor(0.3333) == "0.33x");

    std::ostringstream out;
    print_stats(stats, "whisper.cpp (ggml-base.en.bin, CPU)", out);
    const std::string report = out.str();
    assert(report.find("PERFORMANCE STATISTICS") != std::string::npos);
    assert(report.find("Backend: whisper.cpp (ggml-base.en.bin, CPU)") != std::string::npos);
    assert(report.find("Total Audio Processed: 50.0s") != std::string::npos);
    assert(report.find("Segments: 7 shown / 9 recorded") != std::string::npos);
    assert(report.find("Total Words Transcribed: 42") != std::string::npos);
    assert(report.find("Speed Factor: 5.00x real-time") != std::string::npos);

    // Nothing transcribed: no speed line
    std::ostringstream idle;
    print_stats(SessionStats{}, "test", idle);
    assert(idle.str().find("Speed Factor") == std::string::npos);
    assert(idle.str().find("Transcription stopped") != std::string::npos);
    return 0;
}
