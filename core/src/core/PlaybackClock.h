#pragma once

namespace sounddeck {

// Wall-clock bookkeeping for multi-track playback. Start() records a
// reference instant shifted back by the offset reached at the last
// Pause(), so elapsed() keeps counting from where playback stopped.
//
// All times are in seconds on a caller-supplied monotonic clock.
class PlaybackClock {
public:
    PlaybackClock() = default;

    // Returns false (and changes nothing) when already running.
    bool Start(double nowSeconds) noexcept;

    // Returns false (and changes nothing) when not running.
    bool Pause(double nowSeconds) noexcept;

    // Back to offset zero, not running.
    void Reset() noexcept;

    [[nodiscard]] bool is_running() const noexcept { return running_; }

    // Offset recorded at the last pause; the next Start() resumes from
    // here.
    [[nodiscard]] double paused_offset() const noexcept { return pausedOffset_; }

    // Seconds of playback so far. While paused this is the paused
    // offset.
    [[nodiscard]] double elapsed(double nowSeconds) const noexcept;

    // elapsed / duration clamped to [0,1]; 0 when duration <= 0.
    [[nodiscard]] double Progress(double nowSeconds,
                                  double durationSeconds) const noexcept;

private:
    bool running_{false};
    double startReference_{0.0};
    double pausedOffset_{0.0};
};

}  // namespace sounddeck
