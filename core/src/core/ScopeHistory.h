#pragma once

#include <atomic>
#include <vector>

namespace sounddeck {

// Circular mono history feeding the synth oscilloscope.
//
// Single writer (audio thread), any number of readers (UI thread). The
// writer never blocks; readers copy a window ending at the latest write
// index. A reader racing the writer may see a few samples from the
// next block, which is acceptable for display purposes.
class ScopeHistory {
public:
    explicit ScopeHistory(int capacity) noexcept;

    ScopeHistory(const ScopeHistory&) = delete;
    ScopeHistory& operator=(const ScopeHistory&) = delete;

    [[nodiscard]] int capacity() const noexcept { return capacity_; }

    void setSampleRate(double sampleRate) noexcept;

    // Clears the history to silence. Call from the audio thread when the
    // device (re)starts.
    void reset() noexcept;

    void write(const float* mono, int numSamples) noexcept;

    // Number of samples written since the last reset, saturated at
    // capacity().
    [[nodiscard]] int available() const noexcept;

    // Copies `numPoints` evenly spaced samples covering the most recent
    // `windowSeconds` into `dst`. Zeros when nothing was written yet.
    void snapshot(float* dst, int numPoints, double windowSeconds) const noexcept;

private:
    const int capacity_;
    std::atomic<int> writeIndex_{0};
    std::atomic<double> sampleRate_{44100.0};
    std::vector<float> buffer_;
};

}  // namespace sounddeck
