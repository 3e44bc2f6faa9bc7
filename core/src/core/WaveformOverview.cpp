#include "core/WaveformOverview.h"

#include <algorithm>
#include <cmath>

namespace sounddeck {

std::vector<float> ComputeRmsOverview(const float* const mono,
                                      const int numSamples,
                                      const int samplesPerWindow)
{
    std::vector<float> result;
    if (mono == nullptr || numSamples <= 0 || samplesPerWindow <= 0) {
        return result;
    }

    result.reserve(static_cast<std::size_t>(
        (numSamples + samplesPerWindow - 1) / samplesPerWindow));

    for (int start = 0; start < numSamples; start += samplesPerWindow) {
        const int end = std::min(numSamples, start + samplesPerWindow);
        double sum = 0.0;
        for (int i = start; i < end; ++i) {
            const double s = static_cast<double>(mono[i]);
            sum += s * s;
        }
        result.push_back(static_cast<float>(
            std::sqrt(sum / static_cast<double>(end - start))));
    }

    return result;
}

float OverviewPeak(const std::vector<float>& overview)
{
    if (overview.empty()) {
        return 0.0F;
    }
    return *std::max_element(overview.begin(), overview.end());
}

}  // namespace sounddeck
