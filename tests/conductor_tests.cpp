#include <array>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "core/AudioGraphs.h"
#include "core/FrequencyMath.h"
#include "core/MixerConductor.h"
#include "core/NoiseConductor.h"
#include "core/SynthConductor.h"
#include "core/TickScheduler.h"
#include "core/TrackManifest.h"

// Tests for the screen conductors, driven against recording graphs
// instead of a live audio device.

using sounddeck::MixerConductor;
using sounddeck::NoiseColour;
using sounddeck::NoiseConductor;
using sounddeck::SynthConductor;
using sounddeck::SynthLayer;
using sounddeck::TickScheduler;
using sounddeck::Waveform;

namespace {

bool near(const double a, const double b, const double eps = 1.0e-5)
{
    return std::fabs(a - b) <= eps;
}

class FakeOscillator : public sounddeck::OscillatorNode {
public:
    void SetAmplitude(const float amplitude) override { amplitude_ = amplitude; }
    float amplitude() const override { return amplitude_; }
    void Start() override { running_ = true; }
    void Stop() override { running_ = false; }
    void SetFrequency(const float hz) override { frequency_ = hz; }
    float frequency() const override { return frequency_; }
    void SetWaveform(const Waveform waveform) override { waveform_ = waveform; }

    float amplitude_{-1.0F};
    float frequency_{0.0F};
    Waveform waveform_{Waveform::kTriangle};
    bool running_{false};
};

class FakeSynthGraph : public sounddeck::SynthGraph {
public:
    sounddeck::OscillatorNode& oscillator(const SynthLayer layer) override
    {
        return oscillators_[static_cast<std::size_t>(layer)];
    }

    FakeOscillator& fake(const SynthLayer layer)
    {
        return oscillators_[static_cast<std::size_t>(layer)];
    }

    void SetMixerVolume(const float volume) override { mixerVolume_ = volume; }
    void SetMasterGain(const float gain) override
    {
        masterGain_ = gain;
        ++masterSetCount_;
    }
    void RampMasterGain(const float target, const double seconds) override
    {
        rampTarget_ = target;
        rampSeconds_ = seconds;
        ++rampCount_;
    }
    void SetReverb(const float balance, const float feedback,
                   const float cutoffHz) override
    {
        reverbBalance_ = balance;
        reverbFeedback_ = feedback;
        reverbCutoff_ = cutoffHz;
    }
    bool Start(std::string* error) override
    {
        ++startCount_;
        if (!startResult_ && error != nullptr) {
            *error = "audio device unavailable: test";
        }
        return startResult_;
    }

    std::array<FakeOscillator, sounddeck::kNumSynthLayers> oscillators_;
    float mixerVolume_{0.0F};
    float masterGain_{-1.0F};
    int masterSetCount_{0};
    float rampTarget_{-1.0F};
    double rampSeconds_{0.0};
    int rampCount_{0};
    float reverbBalance_{0.0F};
    float reverbFeedback_{0.0F};
    float reverbCutoff_{0.0F};
    bool startResult_{true};
    int startCount_{0};
};

class FakeSource : public sounddeck::AmplitudeNode {
public:
    void SetAmplitude(const float amplitude) override { amplitude_ = amplitude; }
    float amplitude() const override { return amplitude_; }
    void Start() override { ++startCount_; }
    void Stop() override { ++stopCount_; }

    float amplitude_{-1.0F};
    int startCount_{0};
    int stopCount_{0};
};

class FakePanner : public sounddeck::PanNode {
public:
    void SetPan(const float pan) override
    {
        pan_ = pan;
        ++setCount_;
    }
    float pan() const override { return pan_; }

    float pan_{-2.0F};
    int setCount_{0};
};

class FakeNoiseGraph : public sounddeck::NoiseGraph {
public:
    sounddeck::AmplitudeNode& source(const NoiseColour colour) override
    {
        return sources_[static_cast<std::size_t>(colour)];
    }
    sounddeck::PanNode& panner(const NoiseColour colour) override
    {
        return panners_[static_cast<std::size_t>(colour)];
    }
    void SetStereoFieldAmount(const float amount) override
    {
        stereoAmount_ = amount;
    }
    void SetReverbMix(const float dryWet) override { reverbMix_ = dryWet; }
    bool Start(std::string* error) override
    {
        ++startCount_;
        if (!startResult_ && error != nullptr) {
            *error = "audio device unavailable: test";
        }
        return startResult_;
    }
    void Stop() override { ++stopCount_; }

    std::array<FakeSource, sounddeck::kNumNoiseColours> sources_;
    std::array<FakePanner, sounddeck::kNumNoiseColours> panners_;
    float stereoAmount_{-1.0F};
    float reverbMix_{-1.0F};
    bool startResult_{true};
    int startCount_{0};
    int stopCount_{0};
};

struct FakePlay {
    int index;
    double fromSeconds;
    std::int64_t atSampleTime;
};

class FakeTrackGraph : public sounddeck::TrackGraph {
public:
    void RemoveAllTracks() override
    {
        paths_.clear();
        gains_.clear();
        ++removeAllCount_;
    }
    bool AddTrack(const std::string& path, std::string* error) override
    {
        if (!failOn_.empty() && path.find(failOn_) != std::string::npos) {
            if (error != nullptr) {
                *error = "File does not exist";
            }
            return false;
        }
        paths_.push_back(path);
        gains_.push_back(1.0F);
        return true;
    }
    int track_count() const override { return static_cast<int>(paths_.size()); }
    void SetTrackGain(const int index, const float gain) override
    {
        gains_[static_cast<std::size_t>(index)] = gain;
    }
    float track_gain(const int index) const override
    {
        return gains_[static_cast<std::size_t>(index)];
    }
    double track_duration(const int index) const override
    {
        return index == 0 ? 10.0 : 12.0;
    }
    std::vector<float> track_overview(const int index) const override
    {
        return {0.1F * static_cast<float>(index + 1), 0.5F};
    }
    double sample_rate() const override { return sampleRate_; }
    std::int64_t current_sample_time() const override { return sampleTime_; }
    void PlayTrack(const int index, const double fromSeconds,
                   const std::int64_t atSampleTime) override
    {
        plays_.push_back(FakePlay{index, fromSeconds, atSampleTime});
    }
    void PauseTrack(int /*index*/) override { ++pauseCount_; }
    void StopTrack(int /*index*/) override { ++stopCount_; }
    bool Start(std::string* error) override
    {
        ++startCount_;
        if (!startResult_ && error != nullptr) {
            *error = "audio device unavailable: test";
        }
        return startResult_;
    }

    std::vector<std::string> paths_;
    std::vector<float> gains_;
    std::vector<FakePlay> plays_;
    std::string failOn_;
    double sampleRate_{48000.0};
    std::int64_t sampleTime_{0};
    bool startResult_{true};
    int removeAllCount_{0};
    int pauseCount_{0};
    int stopCount_{0};
    int startCount_{0};
};

void testSynthDefaults()
{
    FakeSynthGraph graph;
    SynthConductor synth(graph);

    assert(near(graph.mixerVolume_, 0.75));
    assert(near(graph.reverbBalance_, 0.4));
    assert(near(graph.reverbFeedback_, 0.7));
    assert(near(graph.reverbCutoff_, 3000.0));

    assert(near(graph.fake(SynthLayer::kBase).amplitude_, 0.3));
    assert(graph.fake(SynthLayer::kOctaveUp).amplitude_ == 0.0F);
    assert(graph.fake(SynthLayer::kDetuned).amplitude_ == 0.0F);

    // Muted on launch without a fade.
    assert(synth.is_muted());
    assert(graph.masterGain_ == 0.0F);
    assert(graph.rampCount_ == 0);

    assert(graph.fake(SynthLayer::kBase).frequency_ == 100.0F);
    assert(graph.fake(SynthLayer::kOctaveUp).frequency_ == 200.0F);
    assert(near(graph.fake(SynthLayer::kDetuned).frequency_,
                100.0 * std::pow(2.0, 7.0 / 1200.0), 1.0e-3));

    for (const auto& osc : graph.oscillators_) {
        assert(osc.waveform_ == Waveform::kSine);
        assert(!osc.running_);
    }
}

void testSynthControls()
{
    FakeSynthGraph graph;
    SynthConductor synth(graph);

    synth.set_frequency(440.0F);
    assert(synth.frequency() == 440.0F);
    assert(synth.octave_up_frequency() == 880.0F);
    assert(near(synth.detuned_frequency(),
                sounddeck::DetuneFrequency(440.0F, 7.0F)));
    assert(synth.detuned_frequency() > 440.0F);

    synth.set_octave_up_multiplier(50.0F);
    assert(near(graph.fake(SynthLayer::kOctaveUp).amplitude_, 0.15));
    synth.set_detuned_multiplier(100.0F);
    assert(near(graph.fake(SynthLayer::kDetuned).amplitude_, 0.3));
    synth.set_detuned_multiplier(0.0F);
    assert(graph.fake(SynthLayer::kDetuned).amplitude_ == 0.0F);
    assert(near(graph.fake(SynthLayer::kBase).amplitude_, 0.3));

    // Mute changes fade over 0.2 s.
    synth.ToggleMute();
    assert(!synth.is_muted());
    assert(graph.rampCount_ == 1);
    assert(graph.rampTarget_ == 1.0F);
    assert(near(graph.rampSeconds_, 0.2));
    synth.ToggleMute();
    assert(synth.is_muted());
    assert(graph.rampTarget_ == 0.0F);
    assert(graph.rampCount_ == 2);

    synth.set_waveform(Waveform::kSquare);
    for (const auto& osc : graph.oscillators_) {
        assert(osc.waveform_ == Waveform::kSquare);
    }

    synth.Start();
    assert(synth.oscillators_running());
    for (const auto& osc : graph.oscillators_) {
        assert(osc.running_);
    }
    synth.Stop();
    assert(!synth.oscillators_running());
    for (const auto& osc : graph.oscillators_) {
        assert(!osc.running_);
    }

    std::string error;
    assert(synth.SetupAudio(&error));
    graph.startResult_ = false;
    assert(!synth.SetupAudio(&error));
    assert(!error.empty());
    assert(graph.startCount_ == 2);
}

void testNoiseDefaults()
{
    FakeNoiseGraph graph;
    TickScheduler scheduler;
    NoiseConductor noise(graph, scheduler);

    assert(!noise.is_playing());
    assert(!noise.is_autopan());
    assert(near(graph.reverbMix_, 0.1));
    assert(graph.stereoAmount_ == 1.0F);
    assert(noise.stereo_width() == 0.0F);
    assert(noise.autopan_rate() == 1.0F);

    for (std::size_t i = 0; i < sounddeck::kNumNoiseColours; ++i) {
        assert(graph.sources_[i].amplitude_ == 0.0F);
        assert(graph.panners_[i].pan_ == 0.0F);
    }

    noise.set_volume(NoiseColour::kPink, 0.7F);
    assert(near(graph.sources_[0].amplitude_, 0.7));
    assert(near(noise.volume(NoiseColour::kPink), 0.7));

    noise.set_pan(NoiseColour::kWhite, -0.5F);
    assert(graph.panners_[1].pan_ == -0.5F);
    assert(noise.pan(NoiseColour::kWhite) == -0.5F);

    noise.set_stereo_width(0.25F);
    assert(near(graph.stereoAmount_, 0.75));
    assert(near(noise.stereo_width(), 0.25));

    noise.set_reverb_mix(0.6F);
    assert(near(graph.reverbMix_, 0.6));
}

void testNoisePlayback()
{
    FakeNoiseGraph graph;
    TickScheduler scheduler;
    NoiseConductor noise(graph, scheduler);

    std::string error;
    assert(noise.SetPlaying(true, &error));
    assert(noise.is_playing());
    assert(graph.startCount_ == 1);
    for (const auto& source : graph.sources_) {
        assert(source.startCount_ == 1);
    }

    assert(noise.SetPlaying(false, &error));
    assert(!noise.is_playing());
    assert(graph.stopCount_ == 1);

    // A failed start leaves the screen stopped.
    graph.startResult_ = false;
    assert(!noise.TogglePlaying(&error));
    assert(!noise.is_playing());
    assert(!error.empty());
}

void testNoiseAutopan()
{
    FakeNoiseGraph graph;
    TickScheduler scheduler;
    scheduler.Advance(0.0);
    NoiseConductor noise(graph, scheduler);
    noise.set_pan(NoiseColour::kBrown, 0.3F);

    noise.set_autopan(true);
    assert(noise.is_autopan());
    assert(scheduler.task_count() == 1);

    // Ticks are due every 16 ms.
    scheduler.Advance(0.010);
    assert(noise.autopanner().tick_count() == 0);
    scheduler.Advance(0.020);
    scheduler.Advance(0.040);
    scheduler.Advance(0.060);
    assert(noise.autopanner().tick_count() == 3);
    assert(near(noise.autopanner().phase(), 0.03));
    assert(near(noise.pan(NoiseColour::kPink), std::sin(0.03)));
    assert(near(noise.pan(NoiseColour::kWhite), std::sin(2.03)));
    assert(near(noise.pan(NoiseColour::kBrown), std::sin(4.03)));
    assert(near(graph.panners_[2].pan_, std::sin(4.03)));

    // Disabling stops the motion and leaves the last pans in place.
    noise.set_autopan(false);
    assert(scheduler.task_count() == 0);
    const float lastPan = noise.pan(NoiseColour::kPink);
    scheduler.Advance(1.0);
    assert(noise.pan(NoiseColour::kPink) == lastPan);

    // Re-enabling restarts at phase 0 with the current rate.
    noise.set_autopan_rate(2.0F);
    noise.ToggleAutopan();
    assert(noise.autopanner().phase() == 0.0F);
    scheduler.Advance(1.02);
    assert(near(noise.autopanner().phase(), 0.02));

    // Stopping playback turns autopan off.
    std::string error;
    assert(noise.SetPlaying(true, &error));
    assert(noise.SetPlaying(false, &error));
    assert(!noise.is_autopan());
    assert(scheduler.task_count() == 0);

    // Destruction removes a still-registered autopan task.
    {
        NoiseConductor other(graph, scheduler);
        other.set_autopan(true);
        assert(scheduler.task_count() == 1);
    }
    assert(scheduler.task_count() == 0);
}

void testMixerLoading()
{
    FakeTrackGraph graph;
    TickScheduler scheduler;
    double now = 0.0;
    MixerConductor mixer(graph, scheduler, [&now] { return now; },
                         sounddeck::DefaultTrackManifest(), "/assets");

    assert(!mixer.is_loaded());
    assert(!mixer.StartSynchronizedPlayback());
    assert(mixer.duration() == 0.0);

    std::string error;
    assert(mixer.OnAppear(&error));
    assert(mixer.is_loaded());
    assert(mixer.track_count() == 4);
    assert(graph.startCount_ == 1);
    assert(graph.paths_[0] == "/assets/syn_34.wav");
    assert(graph.paths_[1] == "/assets/Audio 10_07.wav");
    assert(mixer.tracks()[3].name == "Bass");
    for (int i = 0; i < mixer.track_count(); ++i) {
        assert(mixer.volume(i) == 0.5F);
    }
    assert(mixer.duration() == 10.0);
    assert(mixer.overview(1).size() == 2U);
    assert(mixer.overview(9).empty());

    // Later appearances keep the loaded tracks.
    assert(mixer.OnAppear(&error));
    assert(graph.removeAllCount_ == 1);

    // Mute toggles between silence and a fixed level.
    mixer.SetVolume(1, 0.8F);
    assert(near(mixer.volume(1), 0.8));
    mixer.ToggleMute(1);
    assert(mixer.volume(1) == 0.0F);
    mixer.ToggleMute(1);
    assert(mixer.volume(1) == 0.2F);
    mixer.ToggleMute(-1);
    mixer.SetVolume(7, 1.0F);
    assert(mixer.volume(-1) == 0.0F);
}

void testMixerLoadFailure()
{
    FakeTrackGraph graph;
    graph.failOn_ = "Audio 11_06";
    TickScheduler scheduler;
    MixerConductor mixer(graph, scheduler, [] { return 0.0; },
                         sounddeck::DefaultTrackManifest(), "/assets");

    std::string error;
    assert(!mixer.LoadTracks(&error));
    assert(!mixer.is_loaded());
    assert(error.find("Audio 11_06.wav") != std::string::npos);
    assert(error.find("File does not exist") != std::string::npos);
    assert(graph.startCount_ == 0);
    assert(!mixer.StartSynchronizedPlayback());
    assert(!mixer.TogglePlayback());
}

void testMixerTransport()
{
    FakeTrackGraph graph;
    TickScheduler scheduler;
    double now = 0.0;
    scheduler.Advance(now);
    MixerConductor mixer(graph, scheduler, [&now] { return now; },
                         sounddeck::DefaultTrackManifest(), "/assets");
    std::string error;
    assert(mixer.LoadTracks(&error));

    // Every track shares one start time 100 ms ahead of the engine clock.
    graph.sampleTime_ = 1000;
    assert(!mixer.Pause());
    assert(mixer.StartSynchronizedPlayback());
    assert(mixer.is_playing());
    assert(mixer.is_polling_progress());
    assert(graph.plays_.size() == 4U);
    for (const auto& play : graph.plays_) {
        assert(play.atSampleTime == 1000 + 4800);
        assert(play.fromSeconds == 0.0);
    }
    assert(mixer.last_start_sample_time() == 5800);

    // A second start is ignored.
    assert(!mixer.StartSynchronizedPlayback());
    assert(graph.plays_.size() == 4U);

    // Progress is polled through the scheduler.
    now = 5.0;
    scheduler.Advance(now);
    assert(near(mixer.progress(), 0.5));

    now = 6.0;
    assert(mixer.Pause());
    assert(!mixer.is_playing());
    assert(!mixer.is_polling_progress());
    assert(graph.pauseCount_ == 4);
    assert(near(mixer.paused_offset(), 6.0));
    assert(!mixer.Pause());

    now = 20.0;
    scheduler.Advance(now);
    mixer.UpdateProgress();
    assert(near(mixer.progress(), 0.5));

    // Resuming reads from the paused offset.
    graph.sampleTime_ = 2000;
    assert(mixer.TogglePlayback());
    assert(graph.plays_.size() == 8U);
    for (std::size_t i = 4; i < 8; ++i) {
        assert(graph.plays_[i].fromSeconds == 6.0);
        assert(graph.plays_[i].atSampleTime == 6800);
    }
    now = 22.0;
    scheduler.Advance(now);
    assert(near(mixer.progress(), 0.8));

    // Leaving the screen stops polling but not playback.
    mixer.OnDisappear();
    assert(!mixer.is_polling_progress());
    assert(mixer.is_playing());
    now = 23.0;
    scheduler.Advance(now);
    assert(near(mixer.progress(), 0.8));
    assert(mixer.OnAppear(&error));
    assert(mixer.is_polling_progress());

    // Progress is clamped at the end of the first track.
    now = 60.0;
    scheduler.Advance(now);
    assert(mixer.progress() == 1.0);

    mixer.Stop();
    assert(!mixer.is_playing());
    assert(!mixer.is_polling_progress());
    assert(mixer.progress() == 0.0);
    assert(mixer.paused_offset() == 0.0);
    assert(graph.stopCount_ == 4);

    // After a stop playback starts from the beginning again.
    assert(mixer.StartSynchronizedPlayback());
    assert(graph.plays_.back().fromSeconds == 0.0);
}

void testMixerResumePastEnd()
{
    FakeTrackGraph graph;
    TickScheduler scheduler;
    double now = 0.0;
    scheduler.Advance(now);
    MixerConductor mixer(graph, scheduler, [&now] { return now; },
                         sounddeck::DefaultTrackManifest(), "/assets");
    std::string error;
    assert(mixer.LoadTracks(&error));

    assert(mixer.StartSynchronizedPlayback());
    now = 100.0;
    scheduler.Advance(now);
    assert(mixer.progress() == 1.0);

    // The wall clock ran far past the end of the files.
    now = 50000.0;
    assert(mixer.Pause());
    assert(mixer.paused_offset() > mixer.duration());

    assert(mixer.StartSynchronizedPlayback());
    assert(graph.plays_.size() == 8U);
    for (std::size_t i = 4; i < 8; ++i) {
        assert(graph.plays_[i].fromSeconds == mixer.duration());
    }
}

void testMixerWithoutAudioDevice()
{
    FakeTrackGraph graph;
    graph.startResult_ = false;
    TickScheduler scheduler;
    double now = 0.0;
    scheduler.Advance(now);
    MixerConductor mixer(graph, scheduler, [&now] { return now; },
                         sounddeck::DefaultTrackManifest(), "/assets");

    // The files decode, only the engine start fails: the screen stays
    // usable and the playhead runs without sound.
    std::string error;
    assert(!mixer.LoadTracks(&error));
    assert(error.find("audio device unavailable") != std::string::npos);
    assert(mixer.is_loaded());
    assert(mixer.track_count() == 4);

    assert(mixer.StartSynchronizedPlayback());
    assert(mixer.is_playing());
    now = 5.0;
    scheduler.Advance(now);
    assert(near(mixer.progress(), 0.5));
}

void testMixerDestructorUnregisters()
{
    FakeTrackGraph graph;
    TickScheduler scheduler;
    {
        MixerConductor mixer(graph, scheduler, [] { return 0.0; },
                             sounddeck::DefaultTrackManifest(), "/assets");
        std::string error;
        assert(mixer.LoadTracks(&error));
        assert(mixer.StartSynchronizedPlayback());
        assert(scheduler.task_count() == 1);
    }
    assert(scheduler.task_count() == 0);
}

}  // namespace

int main()
{
    testSynthDefaults();
    testSynthControls();
    testNoiseDefaults();
    testNoisePlayback();
    testNoiseAutopan();
    testMixerLoading();
    testMixerLoadFailure();
    testMixerTransport();
    testMixerResumePastEnd();
    testMixerWithoutAudioDevice();
    testMixerDestructorUnregisters();

    std::cout << "sounddeck-conductor-tests: OK" << std::endl;
    return 0;
}
