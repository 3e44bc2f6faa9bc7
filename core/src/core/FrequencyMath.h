#pragma once

namespace sounddeck {

inline constexpr float kCentsPerOctave = 1200.0F;

// Returns `base_hz * 2^(cents / 1200)`. Positive cents raise the pitch,
// negative cents lower it.
[[nodiscard]] float DetuneFrequency(float base_hz, float cents);

// Frequency one octave above `base_hz` (exactly twice the input).
[[nodiscard]] float OctaveUpFrequency(float base_hz);

// Amplitude of a layered oscillator expressed as a percentage of the
// base oscillator amplitude. `percent` is expected in [0,100].
[[nodiscard]] float LayerAmplitude(float base_amplitude, float percent);

}  // namespace sounddeck
