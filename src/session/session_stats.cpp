#include "session/session_stats.hpp"

#include <iomanip>
#include <sstream>

double SessionStats::speedFactor() const {
    if (elapsedSeconds <= 0.0) return 0.0;
    return totalAudioSeconds / elapsedSeconds;
}

std::string format_speed_factor(double factor) {
    std::ostringstream s;
    s << std::fixed << std::setprecision(2) << factor << "x";
    return s.str();
}

void print_stats(const SessionStats& stats, const std::string& backend, std::ostream& out) {
    const std::string rule(70, '=');

    out << "\n\n" << rule << "\n"
        << "  PERFORMANCE STATISTICS\n"
        << rule << "\n\n"
        << std::fixed << std::setprecision(1)
        << "Backend: " << backend << "\n"
        << "Total Runtime: " << stats.elapsedSeconds << "s\n"
        << "Total Audio Processed: " << stats.totalAudioSeconds << "s\n"
        << "Segments: " << stats.acceptedSegments << " shown / " << stats.segments << " recorded\n"
        << "Total Words Transcribed: " << stats.totalWords << "\n";
    if (stats.totalAudioSeconds > 0.0) {
        out << "Speed Factor: " << format_speed_factor(stats.speedFactor()) << " real-time\n";
    }
    out << std::defaultfloat << "\n"
        << rule << "\n"
        << "Transcription stopped\n"
        << rule << "\n";
}
