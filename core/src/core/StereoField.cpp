#include "core/StereoField.h"

#include <algorithm>

namespace sounddeck {

void ApplyStereoFieldLimit(float* const left, float* const right,
                           const int numSamples, const float amount) noexcept
{
    if (left == nullptr || right == nullptr || numSamples <= 0) {
        return;
    }

    const float width = 1.0F - std::clamp(amount, 0.0F, 1.0F);
    if (width >= 1.0F) {
        return;
    }

    for (int i = 0; i < numSamples; ++i) {
        const float mid = 0.5F * (left[i] + right[i]);
        const float side = 0.5F * (left[i] - right[i]) * width;
        left[i] = mid + side;
        right[i] = mid - side;
    }
}

}  // namespace sounddeck
