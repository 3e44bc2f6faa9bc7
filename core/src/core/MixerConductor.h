#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "core/AudioGraphs.h"
#include "core/PlaybackClock.h"
#include "core/TickScheduler.h"
#include "core/TrackManifest.h"

namespace sounddeck {

// A loaded manifest entry.
struct Track {
    std::string name;
    std::string path;
};

// State behind the multi-track screen.
//
// Playback starts every player at one shared engine sample time a short
// lead ahead of "now" so the stems begin together. Progress is derived
// from a wall clock (elapsed / duration of the first track) and polled
// every 50 ms through the tick scheduler while playing.
//
// Transport rules: starting while already playing and pausing while not
// playing are ignored; stopping rewinds to the beginning.
class MixerConductor {
public:
    using Clock = std::function<double()>;

    static constexpr double kStartLeadSeconds = 0.1;
    static constexpr double kProgressIntervalSeconds = 0.05;
    static constexpr float kDefaultTrackGain = 0.5F;
    static constexpr float kUnmutedGain = 0.2F;

    // `clock` returns monotonic seconds. The tick scheduler must outlive
    // the conductor.
    MixerConductor(TrackGraph& graph, TickScheduler& scheduler, Clock clock,
                   TrackManifest manifest, std::string assetsDirectory);
    ~MixerConductor();

    MixerConductor(const MixerConductor&) = delete;
    MixerConductor& operator=(const MixerConductor&) = delete;

    // Stops playback, drops every track and loads the manifest in order,
    // then starts the graph. Any failure returns false with a message;
    // a load failure leaves is_loaded() false.
    bool LoadTracks(std::string* error);

    // Loads on first appearance only. Later appearances resume progress
    // polling when playback is still running.
    bool OnAppear(std::string* error);

    // Screen dismissal: stops progress polling.
    void OnDisappear();

    // Return false when the request was ignored.
    bool StartSynchronizedPlayback();
    bool Pause();
    bool TogglePlayback();
    void Stop();

    [[nodiscard]] bool is_playing() const noexcept { return playing_; }
    [[nodiscard]] bool is_loaded() const noexcept { return loaded_; }
    [[nodiscard]] bool is_polling_progress() const;

    [[nodiscard]] const std::vector<Track>& tracks() const noexcept { return tracks_; }
    [[nodiscard]] int track_count() const noexcept
    {
        return static_cast<int>(tracks_.size());
    }

    [[nodiscard]] float volume(int track) const;
    void SetVolume(int track, float volume);

    // Gain above zero -> 0, otherwise -> kUnmutedGain.
    void ToggleMute(int track);

    [[nodiscard]] std::vector<float> overview(int track) const;

    // Duration of the first track in seconds, 0 without tracks.
    [[nodiscard]] double duration() const;

    void UpdateProgress();
    [[nodiscard]] double progress() const noexcept { return progress_; }

    [[nodiscard]] double paused_offset() const noexcept
    {
        return playback_.paused_offset();
    }

    // Engine sample time used by the most recent synchronized start.
    [[nodiscard]] std::int64_t last_start_sample_time() const noexcept
    {
        return lastStartSampleTime_;
    }

private:
    [[nodiscard]] bool IsValidTrack(int track) const noexcept;
    void StartProgressPolling();
    void StopProgressPolling();

    TrackGraph& graph_;
    TickScheduler& scheduler_;
    Clock clock_;
    TrackManifest manifest_;
    std::string assetsDirectory_;

    std::vector<Track> tracks_;
    bool playing_{false};
    bool loaded_{false};
    double progress_{0.0};

    PlaybackClock playback_;
    std::int64_t lastStartSampleTime_{0};
    TickScheduler::TaskId progressTask_{TickScheduler::kInvalidTaskId};
};

}  // namespace sounddeck
