#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace sounddeck {

// Noise colours offered by the ambient noise screen, in display order.
enum class NoiseColour {
    kPink = 0,
    kWhite,
    kBrown,
};

inline constexpr int kNumNoiseColours = 3;

inline constexpr std::array<NoiseColour, kNumNoiseColours> kAllNoiseColours = {
    NoiseColour::kPink, NoiseColour::kWhite, NoiseColour::kBrown};

[[nodiscard]] std::string NoiseColourName(NoiseColour colour);

// Single-channel noise source. White noise comes from a xorshift32
// generator; pink noise filters it with Paul Kellet's refined
// seven-pole approximation and brown noise with a leaky integrator.
//
// Instances are not thread-safe and are meant to be owned by the audio
// thread. Output is always in [-1,1].
class NoiseGenerator {
public:
    explicit NoiseGenerator(NoiseColour colour, std::uint32_t seed = 1U);

    [[nodiscard]] NoiseColour colour() const noexcept { return colour_; }

    // Restarts the generator from `seed`. A zero seed is remapped to 1
    // because xorshift treats an all-zero state as a fixed point.
    void Reseed(std::uint32_t seed) noexcept;

    [[nodiscard]] float NextSample() noexcept;

    // Fills `dst` with `numSamples` consecutive samples.
    void Render(float* dst, int numSamples) noexcept;

private:
    [[nodiscard]] float NextWhite() noexcept;

    NoiseColour colour_;
    std::uint32_t state_{1U};

    // Pink filter poles.
    std::array<float, 7> pink_{};

    // Brown integrator state.
    float brown_{0.0F};
};

}  // namespace sounddeck
