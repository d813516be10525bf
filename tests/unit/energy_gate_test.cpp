#include <cassert>
#include <cmath>
#include <vector>
#include "audio/energy_gate.hpp"

int main() {
    const std::vector<float> zeros(16000, 0.0f);
    for (float t : {0.0f, 0.00001f, 0.0002f, 0.5f}) {
        assert(!has_sufficient_audio(zeros, t, GatePolicy::AnyOf));
        assert(!has_sufficient_audio(zeros, t, GatePolicy::AllOf));
    }
    assert(!has_sufficient_audio({}, 0.0002f));

    // One full-scale click: rms = 1/sqrt(16000) ~ 0.0079
    std::vector<float> click(16000, 0.0f);
    click[8000] = 1.0f;
    const EnergyLevels levels = measure_energy(click);
    assert(std::fabs(levels.rms - 1.0f / std::sqrt(16000.0f)) < 1e-5f);
    assert(levels.peak == 1.0f);

    assert(has_sufficient_audio(click, 0.01f, GatePolicy::AnyOf));  // peak > 3t
    assert(!has_sufficient_audio(click, 0.01f, GatePolicy::AllOf)); // rms below t

    // Steady tone well above threshold passes both policies
    std::vector<float> tone(16000);
    for (size_t i = 0; i < tone.size(); ++i) tone[i] = 0.05f * (float)std::sin(0.0628 * i);
    assert(has_sufficient_audio(tone, 0.0002f, GatePolicy::AnyOf));
    assert(has_sufficient_audio(tone, 0.0002f, GatePolicy::AllOf));

    // Borderline: rms just above t but peak under 10t is AnyOf-only
    std::vector<float> flat(1000, 0.002f);
    assert(has_sufficient_audio(flat, 0.001f, GatePolicy::AnyOf));
    assert(!has_sufficient_audio(flat, 0.001f, GatePolicy::AllOf));

    // Negative samples count by magnitude
    std::vector<float> neg(100, 0.0f);
    neg[3] = -0.9f;
    assert(measure_energy(neg).peak > 0.89f);
    return 0;
}
