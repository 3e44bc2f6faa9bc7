#include "core/NoiseGenerator.h"

#include <algorithm>

namespace sounddeck {

std::string NoiseColourName(const NoiseColour colour)
{
    switch (colour) {
        case NoiseColour::kWhite:
            return "White";
        case NoiseColour::kBrown:
            return "Brown";
        case NoiseColour::kPink:
            return "Pink";
    }

    return {};
}

NoiseGenerator::NoiseGenerator(const NoiseColour colour,
                               const std::uint32_t seed)
    : colour_(colour)
{
    Reseed(seed);
}

void NoiseGenerator::Reseed(const std::uint32_t seed) noexcept
{
    state_ = seed != 0U ? seed : 1U;
    pink_.fill(0.0F);
    brown_ = 0.0F;
}

float NoiseGenerator::NextWhite() noexcept
{
    // xorshift32
    std::uint32_t state = state_;
    state ^= state << 13U;
    state ^= state >> 17U;
    state ^= state << 5U;
    state_ = state;
    return static_cast<float>(static_cast<std::int32_t>(state)) /
           2147483647.0F;
}

float NoiseGenerator::NextSample() noexcept
{
    const float white = NextWhite();

    float out = white;
    switch (colour_) {
        case NoiseColour::kPink: {
            pink_[0] = 0.99886F * pink_[0] + white * 0.0555179F;
            pink_[1] = 0.99332F * pink_[1] + white * 0.0750759F;
            pink_[2] = 0.96900F * pink_[2] + white * 0.1538520F;
            pink_[3] = 0.86650F * pink_[3] + white * 0.3104856F;
            pink_[4] = 0.55000F * pink_[4] + white * 0.5329522F;
            pink_[5] = -0.7616F * pink_[5] - white * 0.0168980F;
            const float sum = pink_[0] + pink_[1] + pink_[2] + pink_[3] +
                              pink_[4] + pink_[5] + pink_[6] +
                              white * 0.5362F;
            pink_[6] = white * 0.115926F;
            // Roughly unity gain relative to the white source.
            out = sum * 0.11F;
            break;
        }
        case NoiseColour::kBrown: {
            brown_ = (brown_ + 0.02F * white) / 1.02F;
            out = brown_ * 3.5F;
            break;
        }
        case NoiseColour::kWhite:
            break;
    }

    return std::clamp(out, -1.0F, 1.0F);
}

void NoiseGenerator::Render(float* const dst, const int numSamples) noexcept
{
    if (dst == nullptr) {
        return;
    }
    for (int i = 0; i < numSamples; ++i) {
        dst[i] = NextSample();
    }
}

}  // namespace sounddeck
