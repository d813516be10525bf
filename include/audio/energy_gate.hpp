#ifndef ENERGY_GATE_HPP
#define ENERGY_GATE_HPP

#include <vector>

// AnyOf: rms > t || peak > 3t
// AllOf: rms > t && peak > 10t
enum class GatePolicy {
    AnyOf,
    AllOf
};

struct EnergyLevels {
    float rms = 0.0f;
    float peak = 0.0f;
};

EnergyLevels measure_energy(const std::vector<float>& samples);

bool has_sufficient_audio(const std::vector<float>& samples, float threshold,
                          GatePolicy policy = GatePolicy::AnyOf);

const char* gate_policy_name(GatePolicy policy);

#endif
