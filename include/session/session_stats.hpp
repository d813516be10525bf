#ifndef SESSION_STATS_HPP
#define SESSION_STATS_HPP

#include <ostream>
#include <string>

struct SessionStats {
    int segments = 0;
    int acceptedSegments = 0;
    long totalWords = 0;
    double totalAudioSeconds = 0.0;
    double elapsedSeconds = 0.0;

    // Audio seconds per wall-clock second; 0 when no time has passed
    double speedFactor() const;
};

// "5.00x"
std::string format_speed_factor(double factor);

void print_stats(const SessionStats& stats, const std::string& backend, std::ostream& out);

#endif
