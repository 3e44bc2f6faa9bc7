#pragma once

#include <vector>

namespace sounddeck {

inline constexpr int kOverviewSamplesPerWindow = 512;

// Reduces a mono signal to one RMS value per `samplesPerWindow`
// samples, as drawn in the multi-track lanes. A trailing partial window
// still produces a value. Empty input or a non-positive window yields an
// empty result.
[[nodiscard]] std::vector<float> ComputeRmsOverview(
    const float* mono, int numSamples,
    int samplesPerWindow = kOverviewSamplesPerWindow);

// Largest value of an overview, or 0 for an empty one. Used to
// normalise drawing.
[[nodiscard]] float OverviewPeak(const std::vector<float>& overview);

}  // namespace sounddeck
