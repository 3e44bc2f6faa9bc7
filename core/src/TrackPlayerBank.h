#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include "core/AudioGraphs.h"

class AudioEngine;

// Track graph: one file player per track, each followed by its own
// fader, summed into the output.
//
// Files are decoded up front into interleaved stereo float buffers. The
// player list is only modified from the UI thread while holding
// `playersLock_`; the audio callback try-locks it and outputs nothing
// for the block when the UI thread is busy rebuilding the list.
class TrackPlayerBank : public sounddeck::TrackGraph {
public:
    // Fixed level of each player before its fader.
    static constexpr float kPlayerVolume = 0.2F;

    explicit TrackPlayerBank(const AudioEngine& engine);
    ~TrackPlayerBank() override = default;

    // sounddeck::TrackGraph
    void RemoveAllTracks() override;
    bool AddTrack(const std::string& path, std::string* error) override;
    [[nodiscard]] int track_count() const override;
    void SetTrackGain(int index, float gain) override;
    [[nodiscard]] float track_gain(int index) const override;
    [[nodiscard]] double track_duration(int index) const override;
    [[nodiscard]] std::vector<float> track_overview(int index) const override;
    [[nodiscard]] double sample_rate() const override;
    [[nodiscard]] std::int64_t current_sample_time() const override;
    void PlayTrack(int index, double fromSeconds,
                   std::int64_t atSampleTime) override;
    void PauseTrack(int index) override;
    void StopTrack(int index) override;
    bool Start(std::string* error) override;

    // Audio thread.
    void prepare(double sampleRate, int maximumBlockSize);
    void render(float* left, float* right, int numSamples,
                std::int64_t blockStartSample) noexcept;

private:
    struct DecodedTrack {
        std::vector<float> interleavedData;  // [L,R,L,R,...]
        int numFrames{0};
        double sourceSampleRate{0.0};
        std::vector<float> overview;
    };

    enum class PlayState : int {
        kStopped = 0,
        kScheduled,
        kPlaying,
        kPaused,
    };

    struct Player {
        std::shared_ptr<const DecodedTrack> track;

        std::atomic<float> gain{0.0F};
        std::atomic<int> state{static_cast<int>(PlayState::kStopped)};

        // Written before `state` is set to kScheduled.
        std::atomic<std::int64_t> startAtSample{0};
        std::atomic<double> startFrame{0.0};

        // Read position in source frames; audio thread only.
        double readFrame{0.0};
    };

    [[nodiscard]] Player* findPlayer(int index) const noexcept;

    // Adds one player's output for the block. A player reaching the end
    // of its file stops itself.
    static void renderPlayer(Player& player, float* left, float* right,
                             int numSamples, std::int64_t blockStartSample,
                             double deviceSampleRate) noexcept;

    const AudioEngine& engine_;

    juce::AudioFormatManager formatManager_;

    juce::SpinLock playersLock_;
    std::vector<std::unique_ptr<Player>> players_;

    std::atomic<bool> active_{false};
    double deviceSampleRate_{44100.0};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TrackPlayerBank)
};
