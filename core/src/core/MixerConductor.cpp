#include "core/MixerConductor.h"

#include <cmath>
#include <filesystem>

namespace sounddeck {

MixerConductor::MixerConductor(TrackGraph& graph, TickScheduler& scheduler,
                               Clock clock, TrackManifest manifest,
                               std::string assetsDirectory)
    : graph_(graph),
      scheduler_(scheduler),
      clock_(std::move(clock)),
      manifest_(std::move(manifest)),
      assetsDirectory_(std::move(assetsDirectory))
{
}

MixerConductor::~MixerConductor()
{
    StopProgressPolling();
}

bool MixerConductor::LoadTracks(std::string* const error)
{
    Stop();
    tracks_.clear();
    graph_.RemoveAllTracks();
    loaded_ = false;

    for (const auto& entry : manifest_) {
        const std::string path =
            (std::filesystem::path(assetsDirectory_) / entry.filename)
                .string();

        std::string loadError;
        if (!graph_.AddTrack(path, &loadError)) {
            if (error != nullptr) {
                *error = entry.filename + ": " + loadError;
            }
            return false;
        }

        tracks_.push_back(Track{entry.name, path});
        graph_.SetTrackGain(track_count() - 1, kDefaultTrackGain);
    }

    loaded_ = true;

    if (!graph_.Start(error)) {
        return false;
    }

    if (error != nullptr) {
        error->clear();
    }
    return true;
}

bool MixerConductor::OnAppear(std::string* const error)
{
    if (loaded_) {
        if (playing_ && !is_polling_progress()) {
            StartProgressPolling();
        }
        return true;
    }
    return LoadTracks(error);
}

void MixerConductor::OnDisappear()
{
    StopProgressPolling();
}

bool MixerConductor::StartSynchronizedPlayback()
{
    if (!loaded_ || playing_) {
        return false;
    }

    const auto lead = static_cast<std::int64_t>(
        std::llround(kStartLeadSeconds * graph_.sample_rate()));
    const std::int64_t startAt = graph_.current_sample_time() + lead;
    // The wall clock keeps running after the files end; never resume
    // past the end of the first track.
    double from = playback_.paused_offset();
    const double total = duration();
    if (total > 0.0 && from > total) {
        from = total;
    }

    for (int i = 0; i < track_count(); ++i) {
        graph_.PlayTrack(i, from, startAt);
    }

    playback_.Start(clock_());
    lastStartSampleTime_ = startAt;
    playing_ = true;
    StartProgressPolling();
    return true;
}

bool MixerConductor::Pause()
{
    if (!playing_) {
        return false;
    }

    playback_.Pause(clock_());
    for (int i = 0; i < track_count(); ++i) {
        graph_.PauseTrack(i);
    }

    playing_ = false;
    StopProgressPolling();
    return true;
}

bool MixerConductor::TogglePlayback()
{
    return playing_ ? Pause() : StartSynchronizedPlayback();
}

void MixerConductor::Stop()
{
    for (int i = 0; i < track_count(); ++i) {
        graph_.StopTrack(i);
    }

    playback_.Reset();
    progress_ = 0.0;
    playing_ = false;
    StopProgressPolling();
}

bool MixerConductor::is_polling_progress() const
{
    return progressTask_ != TickScheduler::kInvalidTaskId &&
           scheduler_.is_registered(progressTask_);
}

bool MixerConductor::IsValidTrack(const int track) const noexcept
{
    return track >= 0 && track < track_count();
}

float MixerConductor::volume(const int track) const
{
    return IsValidTrack(track) ? graph_.track_gain(track) : 0.0F;
}

void MixerConductor::SetVolume(const int track, const float volume)
{
    if (IsValidTrack(track)) {
        graph_.SetTrackGain(track, volume);
    }
}

void MixerConductor::ToggleMute(const int track)
{
    if (!IsValidTrack(track)) {
        return;
    }
    const float gain = graph_.track_gain(track);
    graph_.SetTrackGain(track, gain > 0.0F ? 0.0F : kUnmutedGain);
}

std::vector<float> MixerConductor::overview(const int track) const
{
    if (!IsValidTrack(track)) {
        return {};
    }
    return graph_.track_overview(track);
}

double MixerConductor::duration() const
{
    if (tracks_.empty()) {
        return 0.0;
    }
    return graph_.track_duration(0);
}

void MixerConductor::UpdateProgress()
{
    if (!playing_) {
        return;
    }
    const double total = duration();
    if (total <= 0.0) {
        return;
    }
    progress_ = playback_.Progress(clock_(), total);
}

void MixerConductor::StartProgressPolling()
{
    StopProgressPolling();
    progressTask_ = scheduler_.Register(kProgressIntervalSeconds,
                                        [this] { UpdateProgress(); });
}

void MixerConductor::StopProgressPolling()
{
    if (progressTask_ != TickScheduler::kInvalidTaskId) {
        scheduler_.Unregister(progressTask_);
        progressTask_ = TickScheduler::kInvalidTaskId;
    }
}

}  // namespace sounddeck
