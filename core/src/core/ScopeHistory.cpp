#include "core/ScopeHistory.h"

#include <algorithm>

namespace sounddeck {

ScopeHistory::ScopeHistory(const int capacity) noexcept
    : capacity_(capacity > 0 ? capacity : 0),
      buffer_(static_cast<std::size_t>(capacity_), 0.0F)
{
}

void ScopeHistory::setSampleRate(const double sampleRate) noexcept
{
    sampleRate_.store(sampleRate > 0.0 ? sampleRate : 44100.0,
                      std::memory_order_relaxed);
}

void ScopeHistory::reset() noexcept
{
    writeIndex_.store(0, std::memory_order_relaxed);
    std::fill(buffer_.begin(), buffer_.end(), 0.0F);
}

void ScopeHistory::write(const float* const mono,
                         const int numSamples) noexcept
{
    if (mono == nullptr || numSamples <= 0 || capacity_ <= 0) {
        return;
    }

    int index = writeIndex_.load(std::memory_order_relaxed);
    for (int i = 0; i < numSamples; ++i) {
        buffer_[static_cast<std::size_t>(index % capacity_)] = mono[i];
        ++index;
        // Keep the counter bounded while remembering that the buffer
        // has wrapped at least once.
        if (index >= capacity_ * 2) {
            index -= capacity_;
        }
    }
    writeIndex_.store(index, std::memory_order_release);
}

int ScopeHistory::available() const noexcept
{
    return std::min(capacity_, writeIndex_.load(std::memory_order_acquire));
}

void ScopeHistory::snapshot(float* const dst, const int numPoints,
                            const double windowSeconds) const noexcept
{
    if (dst == nullptr || numPoints <= 0) {
        return;
    }

    const int writeIdx = writeIndex_.load(std::memory_order_acquire);
    const int availableSamples = std::min(capacity_, writeIdx);
    if (availableSamples <= 0) {
        std::fill(dst, dst + numPoints, 0.0F);
        return;
    }

    const double window = windowSeconds > 0.0 ? windowSeconds : 0.05;
    const double sr = sampleRate_.load(std::memory_order_relaxed);
    const int windowSamples = std::clamp(
        static_cast<int>(window * sr), 1, availableSamples);

    const int start = writeIdx - windowSamples;
    const double step = numPoints > 1
                            ? static_cast<double>(windowSamples - 1) /
                                  static_cast<double>(numPoints - 1)
                            : 0.0;

    for (int i = 0; i < numPoints; ++i) {
        const int offset = static_cast<int>(step * static_cast<double>(i));
        const int index = ((start + offset) % capacity_ + capacity_) % capacity_;
        dst[i] = buffer_[static_cast<std::size_t>(index)];
    }
}

}  // namespace sounddeck
