#include "core/PlaybackClock.h"

#include <algorithm>

namespace sounddeck {

bool PlaybackClock::Start(const double nowSeconds) noexcept
{
    if (running_) {
        return false;
    }
    startReference_ = nowSeconds - pausedOffset_;
    running_ = true;
    return true;
}

bool PlaybackClock::Pause(const double nowSeconds) noexcept
{
    if (!running_) {
        return false;
    }
    pausedOffset_ = std::max(0.0, nowSeconds - startReference_);
    running_ = false;
    return true;
}

void PlaybackClock::Reset() noexcept
{
    running_ = false;
    startReference_ = 0.0;
    pausedOffset_ = 0.0;
}

double PlaybackClock::elapsed(const double nowSeconds) const noexcept
{
    if (!running_) {
        return pausedOffset_;
    }
    return std::max(0.0, nowSeconds - startReference_);
}

double PlaybackClock::Progress(const double nowSeconds,
                               const double durationSeconds) const noexcept
{
    if (durationSeconds <= 0.0) {
        return 0.0;
    }
    return std::clamp(elapsed(nowSeconds) / durationSeconds, 0.0, 1.0);
}

}  // namespace sounddeck
