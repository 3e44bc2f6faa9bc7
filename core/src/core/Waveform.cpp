#include "core/Waveform.h"

#include <algorithm>
#include <cmath>

namespace sounddeck {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

double WrapPhase(const double phase01)
{
    double local = phase01 - std::floor(phase01);
    if (local >= 1.0) {
        local = 0.0;
    }
    return local;
}

}  // namespace

float WaveformSample(const Waveform waveform, const double phase01)
{
    const double t = WrapPhase(phase01);

    switch (waveform) {
        case Waveform::kSquare:
            return t < 0.5 ? 1.0F : -1.0F;
        case Waveform::kSawtooth:
            return static_cast<float>(2.0 * t - 1.0);
        case Waveform::kTriangle:
            // Starts at 0 rising, peaks at t=0.25, troughs at t=0.75.
            if (t < 0.25) {
                return static_cast<float>(4.0 * t);
            }
            if (t < 0.75) {
                return static_cast<float>(2.0 - 4.0 * t);
            }
            return static_cast<float>(4.0 * t - 4.0);
        case Waveform::kSine:
            return static_cast<float>(std::sin(kTwoPi * t));
    }

    return 0.0F;
}

std::string WaveformName(const Waveform waveform)
{
    switch (waveform) {
        case Waveform::kSquare:
            return "Square";
        case Waveform::kSawtooth:
            return "Sawtooth";
        case Waveform::kTriangle:
            return "Triangle";
        case Waveform::kSine:
            return "Sine";
    }

    return {};
}

Waveform WaveformFromIndex(const int index)
{
    const int clamped = std::clamp(
        index, 0, static_cast<int>(kAllWaveforms.size()) - 1);
    return kAllWaveforms[static_cast<std::size_t>(clamped)];
}

}  // namespace sounddeck
