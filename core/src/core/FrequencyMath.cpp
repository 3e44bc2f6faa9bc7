#include "core/FrequencyMath.h"

#include <cmath>

namespace sounddeck {

float DetuneFrequency(const float base_hz, const float cents)
{
    return base_hz * std::pow(2.0F, cents / kCentsPerOctave);
}

float OctaveUpFrequency(const float base_hz)
{
    return base_hz * 2.0F;
}

float LayerAmplitude(const float base_amplitude, const float percent)
{
    return base_amplitude * (percent / 100.0F);
}

}  // namespace sounddeck
