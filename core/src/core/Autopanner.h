#pragma once

#include <array>
#include <optional>

#include "core/NoiseGenerator.h"

namespace sounddeck {

// Slow sinusoidal pan motion for the three noise sources. Each tick
// advances a shared phase accumulator by `rate * kPhaseIncrement` and
// derives one pan per source as `sin(phase + offset) * depth`; the
// per-source offsets keep the three motions out of step.
//
// The accumulator only exists while enabled: Disable() discards it and
// a later Enable() restarts from phase 0.
class Autopanner {
public:
    using Pans = std::array<float, kNumNoiseColours>;

    static constexpr float kPhaseIncrement = 0.01F;
    static constexpr double kTickIntervalSeconds = 0.016;

    // Phase offsets in radians, indexed like kAllNoiseColours.
    static constexpr std::array<float, kNumNoiseColours> kPhaseOffsets = {
        0.0F, 2.0F, 4.0F};

    Autopanner() = default;

    void Enable(float depth = 1.0F) noexcept;
    void Disable() noexcept;

    [[nodiscard]] bool is_enabled() const noexcept { return phase_.has_value(); }

    void set_rate(float rate) noexcept { rate_ = rate; }
    [[nodiscard]] float rate() const noexcept { return rate_; }

    [[nodiscard]] float depth() const noexcept { return depth_; }

    // Current accumulator value, or 0 while disabled.
    [[nodiscard]] float phase() const noexcept { return phase_.value_or(0.0F); }

    [[nodiscard]] int tick_count() const noexcept { return tickCount_; }

    // Advances by one tick and returns the new pans. While disabled
    // nothing advances and std::nullopt is returned.
    std::optional<Pans> Tick() noexcept;

private:
    std::optional<float> phase_;
    float rate_{1.0F};
    float depth_{1.0F};
    int tickCount_{0};
};

}  // namespace sounddeck
