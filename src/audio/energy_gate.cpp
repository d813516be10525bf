#include "audio/energy_gate.hpp"

#include <algorithm>
#include <cmath>

EnergyLevels measure_energy(const std::vector<float>& samples) {
    EnergyLevels levels;
    if (samples.empty()) return levels;

    double acc = 0.0;
    float peak = 0.0f;
    for (float s : samples) {
        acc += (double)s * (double)s;
        peak = std::max(peak, std::fabs(s));
    }
    levels.rms = (float)std::sqrt(acc / (double)samples.size());
    levels.peak = peak;
    return levels;
}

// Decides whether a chunk likely holds speech, measured before any gain
bool has_sufficient_audio(const std::vector<float>& samples, float threshold, GatePolicy policy) {
    const EnergyLevels levels = measure_energy(samples);

    if (policy == GatePolicy::AllOf) {
        return levels.rms > threshold && levels.peak > threshold * 10.0f;
    }
    return levels.rms > threshold || levels.peak > threshold * 3.0f;
}

const char* gate_policy_name(GatePolicy policy) {
    return policy == GatePolicy::AllOf ? "all" : "any";
}
