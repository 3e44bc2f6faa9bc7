#include "core/Autopanner.h"

#include <cmath>

namespace sounddeck {

void Autopanner::Enable(const float depth) noexcept
{
    phase_ = 0.0F;
    depth_ = depth;
    tickCount_ = 0;
}

void Autopanner::Disable() noexcept
{
    phase_.reset();
    tickCount_ = 0;
}

std::optional<Autopanner::Pans> Autopanner::Tick() noexcept
{
    if (!phase_.has_value()) {
        return std::nullopt;
    }

    *phase_ += kPhaseIncrement * rate_;
    ++tickCount_;

    Pans pans{};
    for (std::size_t i = 0; i < pans.size(); ++i) {
        pans[i] = std::sin(*phase_ + kPhaseOffsets[i]) * depth_;
    }
    return pans;
}

}  // namespace sounddeck
