#pragma once

#include <array>
#include <string>

namespace sounddeck {

// Oscillator shapes offered by the synth screen. The underlying values
// are stable and double as combo box indices.
enum class Waveform {
    kSine = 0,
    kSquare,
    kSawtooth,
    kTriangle,
};

inline constexpr std::array<Waveform, 4> kAllWaveforms = {
    Waveform::kSine, Waveform::kSquare, Waveform::kSawtooth,
    Waveform::kTriangle};

// Evaluates one period of `waveform` at the normalised phase
// `phase01`. Values outside [0,1) wrap. Output is in [-1,1].
[[nodiscard]] float WaveformSample(Waveform waveform, double phase01);

// Human readable label ("Sine", "Square", ...).
[[nodiscard]] std::string WaveformName(Waveform waveform);

// Maps an index to a waveform, clamping out-of-range values to the
// nearest valid shape.
[[nodiscard]] Waveform WaveformFromIndex(int index);

}  // namespace sounddeck
