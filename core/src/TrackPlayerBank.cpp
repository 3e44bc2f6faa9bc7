#include "TrackPlayerBank.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "AudioEngine.h"
#include "core/WaveformOverview.h"

TrackPlayerBank::TrackPlayerBank(const AudioEngine& engine) : engine_(engine)
{
    // WAV/AIFF/FLAC/Ogg, depending on the JUCE configuration.
    formatManager_.registerBasicFormats();
}

TrackPlayerBank::Player* TrackPlayerBank::findPlayer(
    const int index) const noexcept
{
    if (index < 0 || index >= static_cast<int>(players_.size())) {
        return nullptr;
    }
    return players_[static_cast<std::size_t>(index)].get();
}

void TrackPlayerBank::RemoveAllTracks()
{
    const juce::SpinLock::ScopedLockType lock(playersLock_);
    players_.clear();
}

bool TrackPlayerBank::AddTrack(const std::string& path,
                               std::string* const error)
{
    juce::File file{juce::String(path)};
    juce::Logger::writeToLog("[sounddeck] Loading " + file.getFileName() +
                             "...");

    auto fail = [&error, &file](const std::string& message) {
        juce::Logger::writeToLog("[sounddeck] Failed to load " +
                                 file.getFileName() + ": " +
                                 juce::String(message));
        if (error != nullptr) {
            *error = message;
        }
        return false;
    };

    if (!file.existsAsFile()) {
        return fail("File does not exist");
    }

    std::unique_ptr<juce::AudioFormatReader> reader(
        formatManager_.createReaderFor(file));
    if (reader == nullptr) {
        return fail("Unsupported audio format");
    }

    const juce::int64 numSamples64 = reader->lengthInSamples;
    if (numSamples64 <= 0) {
        return fail("Empty audio file");
    }

    const int numFrames = static_cast<int>(std::min<juce::int64>(
        numSamples64, std::numeric_limits<int>::max() / 2));

    const int channels = static_cast<int>(reader->numChannels);
    const double sourceRate = reader->sampleRate;
    if (sourceRate <= 0.0) {
        return fail("Invalid sample rate");
    }

    juce::AudioBuffer<float> tempBuffer(std::max(2, channels), numFrames);
    tempBuffer.clear();

    if (!reader->read(&tempBuffer, 0, numFrames, 0, true, true)) {
        return fail("Failed to read audio data");
    }

    // Always stereo: mono files are duplicated on both channels and
    // multi-channel files use the first two channels only.
    const float* ch0 = tempBuffer.getReadPointer(0);
    const float* ch1 = channels > 1 ? tempBuffer.getReadPointer(1) : nullptr;

    auto decoded = std::make_shared<DecodedTrack>();
    decoded->interleavedData.resize(static_cast<std::size_t>(numFrames) * 2U,
                                    0.0F);
    decoded->numFrames = numFrames;
    decoded->sourceSampleRate = sourceRate;

    std::vector<float> mono(static_cast<std::size_t>(numFrames), 0.0F);
    for (int i = 0; i < numFrames; ++i) {
        const float l = ch0[i];
        const float r = ch1 != nullptr ? ch1[i] : l;
        const std::size_t base = static_cast<std::size_t>(i) * 2U;
        decoded->interleavedData[base + 0] = l;
        decoded->interleavedData[base + 1] = r;
        mono[static_cast<std::size_t>(i)] = 0.5F * (l + r);
    }

    decoded->overview = sounddeck::ComputeRmsOverview(mono.data(), numFrames);

    auto player = std::make_unique<Player>();
    player->track = std::move(decoded);

    {
        const juce::SpinLock::ScopedLockType lock(playersLock_);
        players_.push_back(std::move(player));
    }

    juce::Logger::writeToLog(
        "[sounddeck] Loaded " + file.getFileName() + " frames=" +
        juce::String(numFrames) + " sampleRate=" + juce::String(sourceRate));

    if (error != nullptr) {
        error->clear();
    }
    return true;
}

int TrackPlayerBank::track_count() const
{
    return static_cast<int>(players_.size());
}

void TrackPlayerBank::SetTrackGain(const int index, const float gain)
{
    if (auto* player = findPlayer(index)) {
        player->gain.store(gain, std::memory_order_relaxed);
    }
}

float TrackPlayerBank::track_gain(const int index) const
{
    if (const auto* player = findPlayer(index)) {
        return player->gain.load(std::memory_order_relaxed);
    }
    return 0.0F;
}

double TrackPlayerBank::track_duration(const int index) const
{
    const auto* player = findPlayer(index);
    if (player == nullptr || player->track == nullptr ||
        player->track->sourceSampleRate <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(player->track->numFrames) /
           player->track->sourceSampleRate;
}

std::vector<float> TrackPlayerBank::track_overview(const int index) const
{
    const auto* player = findPlayer(index);
    if (player == nullptr || player->track == nullptr) {
        return {};
    }
    return player->track->overview;
}

double TrackPlayerBank::sample_rate() const
{
    return engine_.sampleRate();
}

std::int64_t TrackPlayerBank::current_sample_time() const
{
    return engine_.currentSampleTime();
}

void TrackPlayerBank::PlayTrack(const int index, const double fromSeconds,
                                const std::int64_t atSampleTime)
{
    auto* player = findPlayer(index);
    if (player == nullptr || player->track == nullptr) {
        return;
    }

    const double frame =
        std::max(0.0, fromSeconds) * player->track->sourceSampleRate;
    if (frame >= static_cast<double>(player->track->numFrames - 1)) {
        // Nothing left to play from this offset.
        player->state.store(static_cast<int>(PlayState::kStopped),
                            std::memory_order_release);
        return;
    }

    player->startFrame.store(frame, std::memory_order_relaxed);
    player->startAtSample.store(atSampleTime, std::memory_order_relaxed);
    player->state.store(static_cast<int>(PlayState::kScheduled),
                        std::memory_order_release);
}

void TrackPlayerBank::PauseTrack(const int index)
{
    if (auto* player = findPlayer(index)) {
        player->state.store(static_cast<int>(PlayState::kPaused),
                            std::memory_order_release);
    }
}

void TrackPlayerBank::StopTrack(const int index)
{
    if (auto* player = findPlayer(index)) {
        player->state.store(static_cast<int>(PlayState::kStopped),
                            std::memory_order_release);
    }
}

bool TrackPlayerBank::Start(std::string* const error)
{
    if (!engine_.checkDeviceReady(error)) {
        juce::Logger::writeToLog("[sounddeck] Track graph not started: " +
                                 juce::String(error != nullptr ? *error : ""));
        return false;
    }

    if (!active_.exchange(true, std::memory_order_relaxed)) {
        juce::Logger::writeToLog("[sounddeck] Track graph started with " +
                                 juce::String(track_count()) + " tracks.");
    }
    if (error != nullptr) {
        error->clear();
    }
    return true;
}

void TrackPlayerBank::prepare(const double sampleRate,
                              const int maximumBlockSize)
{
    juce::ignoreUnused(maximumBlockSize);
    deviceSampleRate_ = sampleRate > 0.0 ? sampleRate : 44100.0;
}

void TrackPlayerBank::render(float* const left, float* const right,
                             const int numSamples,
                             const std::int64_t blockStartSample) noexcept
{
    if (!active_.load(std::memory_order_relaxed) || numSamples <= 0) {
        return;
    }

    const juce::SpinLock::ScopedTryLockType lock(playersLock_);
    if (!lock.isLocked()) {
        return;
    }

    for (auto& player : players_) {
        renderPlayer(*player, left, right, numSamples, blockStartSample,
                     deviceSampleRate_);
    }
}

void TrackPlayerBank::renderPlayer(Player& player, float* const left,
                                   float* const right, const int numSamples,
                                   const std::int64_t blockStartSample,
                                   const double deviceSampleRate) noexcept
{
    const DecodedTrack* track = player.track.get();
    if (track == nullptr || track->numFrames <= 1) {
        return;
    }

    int state = player.state.load(std::memory_order_acquire);
    int firstSample = 0;

    if (state == static_cast<int>(PlayState::kScheduled)) {
        const std::int64_t startAt =
            player.startAtSample.load(std::memory_order_relaxed);
        const std::int64_t offset = startAt - blockStartSample;
        if (offset >= numSamples) {
            return;
        }

        // The UI thread may have replaced the request in the meantime;
        // only take over a schedule that is still current.
        int expected = static_cast<int>(PlayState::kScheduled);
        if (!player.state.compare_exchange_strong(
                expected, static_cast<int>(PlayState::kPlaying),
                std::memory_order_acq_rel)) {
            return;
        }

        player.readFrame = player.startFrame.load(std::memory_order_relaxed);
        firstSample = static_cast<int>(std::max<std::int64_t>(0, offset));
        state = static_cast<int>(PlayState::kPlaying);
    }

    if (state != static_cast<int>(PlayState::kPlaying)) {
        return;
    }

    const float gain =
        player.gain.load(std::memory_order_relaxed) * kPlayerVolume;
    const double step = track->sourceSampleRate / deviceSampleRate;
    const float* data = track->interleavedData.data();
    const auto lastFrame = static_cast<double>(track->numFrames - 1);

    double pos = player.readFrame;
    for (int i = firstSample; i < numSamples; ++i) {
        // Compare before the integer cast so an out-of-range position
        // stops the player instead of overflowing.
        if (pos >= lastFrame) {
            int expected = static_cast<int>(PlayState::kPlaying);
            player.state.compare_exchange_strong(
                expected, static_cast<int>(PlayState::kStopped),
                std::memory_order_acq_rel);
            break;
        }

        const int i0 = static_cast<int>(pos);

        const auto frac = static_cast<float>(pos - static_cast<double>(i0));
        const std::size_t base = static_cast<std::size_t>(i0) * 2U;
        const float l = data[base] + frac * (data[base + 2] - data[base]);
        const float r =
            data[base + 1] + frac * (data[base + 3] - data[base + 1]);

        left[i] += l * gain;
        right[i] += r * gain;

        pos += step;
    }

    player.readFrame = pos;
}
