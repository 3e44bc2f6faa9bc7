#pragma once

namespace sounddeck {

// Narrows the stereo image of a block in place using a mid/side split.
// `amount` is the limiting amount in [0,1]: 0 leaves the pair untouched,
// 1 collapses it to mono. The UI exposes the complement as "stereo
// width" (width = 1 - amount).
void ApplyStereoFieldLimit(float* left, float* right, int numSamples,
                           float amount) noexcept;

}  // namespace sounddeck
