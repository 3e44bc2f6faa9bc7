#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "core/Autopanner.h"
#include "core/FrequencyMath.h"
#include "core/LaunchOptions.h"
#include "core/NoiseGenerator.h"
#include "core/PlaybackClock.h"
#include "core/ScopeHistory.h"
#include "core/StereoField.h"
#include "core/TickScheduler.h"
#include "core/TrackManifest.h"
#include "core/Waveform.h"
#include "core/WaveformOverview.h"

// Tests for the JUCE-free building blocks of SoundDeck. They run as a
// normal binary and are integrated with CTest.

using sounddeck::Autopanner;
using sounddeck::LaunchOptions;
using sounddeck::NoiseColour;
using sounddeck::NoiseGenerator;
using sounddeck::PlaybackClock;
using sounddeck::ScopeHistory;
using sounddeck::TickScheduler;
using sounddeck::TrackManifest;
using sounddeck::Waveform;

namespace {

bool near(const double a, const double b, const double eps = 1.0e-5)
{
    return std::fabs(a - b) <= eps;
}

void testFrequencyMath()
{
    const float base = 100.0F;
    const float detuned = sounddeck::DetuneFrequency(base, 7.0F);
    assert(near(detuned, 100.0 * std::pow(2.0, 7.0 / 1200.0), 1.0e-3));
    assert(detuned > base);

    // A full octave of cents doubles the frequency; negative cents lower it.
    assert(near(sounddeck::DetuneFrequency(base, 1200.0F), 200.0, 1.0e-3));
    assert(sounddeck::DetuneFrequency(base, -7.0F) < base);
    assert(sounddeck::DetuneFrequency(base, 0.0F) == base);

    for (const float f : {20.0F, 100.0F, 440.0F, 1500.0F}) {
        assert(sounddeck::OctaveUpFrequency(f) == 2.0F * f);
    }

    assert(near(sounddeck::LayerAmplitude(0.3F, 50.0F), 0.15));
    assert(near(sounddeck::LayerAmplitude(0.3F, 100.0F), 0.3));
    assert(sounddeck::LayerAmplitude(0.3F, 0.0F) == 0.0F);
}

void testWaveforms()
{
    assert(near(sounddeck::WaveformSample(Waveform::kSine, 0.0), 0.0));
    assert(near(sounddeck::WaveformSample(Waveform::kSine, 0.25), 1.0));
    assert(near(sounddeck::WaveformSample(Waveform::kSine, 0.75), -1.0));

    assert(sounddeck::WaveformSample(Waveform::kSquare, 0.1) == 1.0F);
    assert(sounddeck::WaveformSample(Waveform::kSquare, 0.6) == -1.0F);

    assert(near(sounddeck::WaveformSample(Waveform::kSawtooth, 0.0), -1.0));
    assert(near(sounddeck::WaveformSample(Waveform::kSawtooth, 0.5), 0.0));

    assert(near(sounddeck::WaveformSample(Waveform::kTriangle, 0.0), 0.0));
    assert(near(sounddeck::WaveformSample(Waveform::kTriangle, 0.25), 1.0));
    assert(near(sounddeck::WaveformSample(Waveform::kTriangle, 0.75), -1.0));

    // Phases outside [0,1) wrap.
    assert(near(sounddeck::WaveformSample(Waveform::kSawtooth, 1.25),
                sounddeck::WaveformSample(Waveform::kSawtooth, 0.25)));
    assert(near(sounddeck::WaveformSample(Waveform::kSawtooth, -0.75),
                sounddeck::WaveformSample(Waveform::kSawtooth, 0.25)));

    assert(sounddeck::WaveformName(Waveform::kSine) == "Sine");
    assert(sounddeck::WaveformName(Waveform::kSquare) == "Square");
    assert(sounddeck::WaveformName(Waveform::kSawtooth) == "Sawtooth");
    assert(sounddeck::WaveformName(Waveform::kTriangle) == "Triangle");
    assert(sounddeck::WaveformFromIndex(2) == Waveform::kSawtooth);
    assert(sounddeck::WaveformFromIndex(-3) == Waveform::kSine);
    assert(sounddeck::WaveformFromIndex(99) == Waveform::kTriangle);
}

void testNoiseGenerators()
{
    constexpr int kNumSamples = 10000;

    for (const auto colour : sounddeck::kAllNoiseColours) {
        NoiseGenerator a(colour, 42U);
        NoiseGenerator b(colour, 42U);
        bool anyNonZero = false;
        for (int i = 0; i < kNumSamples; ++i) {
            const float sa = a.NextSample();
            const float sb = b.NextSample();
            assert(sa == sb);
            assert(sa >= -1.0F && sa <= 1.0F);
            anyNonZero = anyNonZero || sa != 0.0F;
        }
        assert(anyNonZero);
    }

    // A zero seed behaves like seed 1.
    {
        NoiseGenerator zero(NoiseColour::kWhite, 0U);
        NoiseGenerator one(NoiseColour::kWhite, 1U);
        for (int i = 0; i < 100; ++i) {
            assert(zero.NextSample() == one.NextSample());
        }
    }

    // Reseeding restarts the sequence.
    {
        NoiseGenerator gen(NoiseColour::kPink, 7U);
        std::vector<float> first(64);
        gen.Render(first.data(), 64);
        gen.Reseed(7U);
        std::vector<float> second(64);
        gen.Render(second.data(), 64);
        assert(first == second);
    }

    // White noise is centred; brown noise moves far less between
    // consecutive samples than white noise.
    {
        NoiseGenerator white(NoiseColour::kWhite, 3U);
        NoiseGenerator brown(NoiseColour::kBrown, 3U);
        double sum = 0.0;
        double whiteDiff = 0.0;
        double brownDiff = 0.0;
        float prevWhite = white.NextSample();
        float prevBrown = brown.NextSample();
        for (int i = 0; i < kNumSamples; ++i) {
            const float w = white.NextSample();
            const float br = brown.NextSample();
            sum += w;
            whiteDiff += std::fabs(w - prevWhite);
            brownDiff += std::fabs(br - prevBrown);
            prevWhite = w;
            prevBrown = br;
        }
        assert(std::fabs(sum / kNumSamples) < 0.05);
        assert(brownDiff < whiteDiff * 0.5);
    }

    assert(sounddeck::NoiseColourName(NoiseColour::kPink) == "Pink");
    assert(sounddeck::NoiseColourName(NoiseColour::kWhite) == "White");
    assert(sounddeck::NoiseColourName(NoiseColour::kBrown) == "Brown");
    for (const auto colour : sounddeck::kAllNoiseColours) {
        assert(NoiseGenerator(colour).colour() == colour);
    }
}

void testStereoField()
{
    // Amount 0 (width 1) leaves the pair untouched.
    {
        float left[] = {1.0F, -0.5F, 0.25F};
        float right[] = {0.0F, 0.5F, -0.25F};
        sounddeck::ApplyStereoFieldLimit(left, right, 3, 0.0F);
        assert(left[0] == 1.0F && left[1] == -0.5F && left[2] == 0.25F);
        assert(right[0] == 0.0F && right[1] == 0.5F && right[2] == -0.25F);
    }

    // Amount 1 (width 0) collapses to mono.
    {
        float left[] = {1.0F, -0.5F, 0.25F};
        float right[] = {0.0F, 0.5F, -0.25F};
        sounddeck::ApplyStereoFieldLimit(left, right, 3, 1.0F);
        for (int i = 0; i < 3; ++i) {
            assert(left[i] == right[i]);
        }
        assert(near(left[0], 0.5));
    }

    // Half width halves the side signal.
    {
        float left[] = {1.0F};
        float right[] = {0.0F};
        sounddeck::ApplyStereoFieldLimit(left, right, 1, 0.5F);
        assert(near(left[0], 0.75));
        assert(near(right[0], 0.25));
    }
}

void testAutopanner()
{
    Autopanner panner;
    assert(!panner.is_enabled());
    assert(!panner.Tick().has_value());
    assert(panner.phase() == 0.0F);

    panner.Enable();
    const auto first = panner.Tick();
    assert(first.has_value());
    assert(near(panner.phase(), 0.01));
    assert(near((*first)[0], std::sin(0.01)));
    assert(near((*first)[1], std::sin(2.01)));
    assert(near((*first)[2], std::sin(4.01)));

    // Rate scales the phase step.
    panner.set_rate(2.0F);
    panner.Tick();
    panner.Tick();
    assert(panner.tick_count() == 3);
    assert(near(panner.phase(), 0.05));

    // Disabling discards the accumulator; re-enabling restarts at 0.
    panner.Disable();
    assert(!panner.is_enabled());
    assert(panner.phase() == 0.0F);
    assert(!panner.Tick().has_value());

    panner.Enable(0.5F);
    assert(panner.depth() == 0.5F);
    assert(panner.phase() == 0.0F);
    const auto scaled = panner.Tick();
    assert(scaled.has_value());
    assert(near((*scaled)[0], 0.5 * std::sin(0.02)));
    assert(near(panner.rate(), 2.0));
}

void testTickScheduler()
{
    TickScheduler scheduler;
    assert(scheduler.Register(0.0, [] {}) == TickScheduler::kInvalidTaskId);
    assert(scheduler.Register(0.25, TickScheduler::Callback{}) ==
           TickScheduler::kInvalidTaskId);

    int fastCount = 0;
    int slowCount = 0;
    std::vector<int> order;
    const auto fast = scheduler.Register(0.25, [&] {
        ++fastCount;
        order.push_back(1);
    });
    const auto slow = scheduler.Register(0.5, [&] {
        ++slowCount;
        order.push_back(2);
    });
    assert(fast != TickScheduler::kInvalidTaskId);
    assert(slow != TickScheduler::kInvalidTaskId && slow != fast);
    assert(scheduler.task_count() == 2);

    scheduler.Advance(0.125);
    assert(fastCount == 0 && slowCount == 0);

    scheduler.Advance(0.25);
    assert(fastCount == 1 && slowCount == 0);

    scheduler.Advance(0.5);
    assert(fastCount == 2 && slowCount == 1);
    assert(order == (std::vector<int>{1, 1, 2}));

    // Falling far behind fires once, not once per missed interval.
    scheduler.Advance(10.0);
    assert(fastCount == 3 && slowCount == 2);
    scheduler.Advance(10.125);
    assert(fastCount == 3);
    scheduler.Advance(10.25);
    assert(fastCount == 4);

    // The clock never goes backwards.
    scheduler.Advance(5.0);
    assert(scheduler.now() == 10.25);
    assert(fastCount == 4);

    assert(scheduler.Unregister(slow));
    assert(!scheduler.Unregister(slow));
    assert(!scheduler.is_registered(slow));
    assert(scheduler.is_registered(fast));

    // A task may remove itself from its own callback.
    int selfCount = 0;
    TickScheduler::TaskId self = TickScheduler::kInvalidTaskId;
    self = scheduler.Register(0.25, [&] {
        ++selfCount;
        scheduler.Unregister(self);
    });
    scheduler.Advance(10.5);
    scheduler.Advance(11.0);
    assert(selfCount == 1);
    assert(!scheduler.is_registered(self));
    assert(scheduler.task_count() == 1);
}

void testPlaybackClock()
{
    PlaybackClock clock;
    assert(!clock.is_running());
    assert(clock.Progress(5.0, 10.0) == 0.0);

    assert(clock.Start(10.0));
    assert(!clock.Start(11.0));
    assert(near(clock.elapsed(12.0), 2.0));

    assert(clock.Pause(13.0));
    assert(!clock.Pause(14.0));
    assert(near(clock.paused_offset(), 3.0));
    assert(near(clock.elapsed(100.0), 3.0));

    // Resuming keeps counting from the paused offset.
    assert(clock.Start(20.0));
    assert(near(clock.elapsed(21.0), 4.0));
    assert(near(clock.Progress(21.0, 8.0), 0.5));
    assert(clock.Progress(21.0, 0.0) == 0.0);
    assert(clock.Progress(1000.0, 8.0) == 1.0);

    // Progress is non-decreasing while running.
    double last = 0.0;
    for (double t = 20.0; t < 40.0; t += 0.5) {
        const double p = clock.Progress(t, 8.0);
        assert(p >= last);
        last = p;
    }

    clock.Reset();
    assert(!clock.is_running());
    assert(clock.paused_offset() == 0.0);
}

void testScopeHistory()
{
    ScopeHistory history(8);
    history.setSampleRate(8.0);

    std::vector<float> points(4, -1.0F);
    history.snapshot(points.data(), 4, 0.5);
    assert(points == (std::vector<float>{0.0F, 0.0F, 0.0F, 0.0F}));
    assert(history.available() == 0);

    const float firstBlock[] = {1.0F, 2.0F, 3.0F, 4.0F};
    history.write(firstBlock, 4);
    assert(history.available() == 4);
    history.snapshot(points.data(), 4, 0.5);
    assert(points == (std::vector<float>{1.0F, 2.0F, 3.0F, 4.0F}));

    // Keep writing past the capacity: the newest samples win.
    std::vector<float> more;
    for (int v = 5; v <= 24; ++v) {
        more.push_back(static_cast<float>(v));
    }
    history.write(more.data(), static_cast<int>(more.size()));
    assert(history.available() == 8);

    std::vector<float> window(8, 0.0F);
    history.snapshot(window.data(), 8, 1.0);
    for (int i = 0; i < 8; ++i) {
        assert(window[static_cast<std::size_t>(i)] ==
               static_cast<float>(17 + i));
    }

    history.reset();
    assert(history.available() == 0);
}

void testWaveformOverview()
{
    std::vector<float> constant(1024, 0.5F);
    auto overview = sounddeck::ComputeRmsOverview(constant.data(), 1024);
    assert(overview.size() == 2U);
    assert(near(overview[0], 0.5) && near(overview[1], 0.5));

    // A trailing partial window still yields a value.
    std::vector<float> odd(1030, -0.25F);
    overview = sounddeck::ComputeRmsOverview(odd.data(), 1030);
    assert(overview.size() == 3U);
    assert(near(overview[2], 0.25));

    std::vector<float> ramp = {0.0F, 0.0F, 1.0F, 1.0F};
    overview = sounddeck::ComputeRmsOverview(ramp.data(), 4, 2);
    assert(overview.size() == 2U);
    assert(overview[0] == 0.0F && near(overview[1], 1.0));
    assert(near(sounddeck::OverviewPeak(overview), 1.0));

    assert(sounddeck::ComputeRmsOverview(nullptr, 10).empty());
    assert(sounddeck::ComputeRmsOverview(ramp.data(), 4, 0).empty());
    assert(sounddeck::OverviewPeak({}) == 0.0F);
}

void testTrackManifest()
{
    const TrackManifest defaults = sounddeck::DefaultTrackManifest();
    assert(defaults.size() == 4U);
    assert(defaults[0].filename == "syn_34.wav");
    assert(defaults[0].name == "Synthesizer");
    assert(defaults[1].filename == "Audio 10_07.wav");
    assert(defaults[1].name == "Lead Synth");
    assert(defaults[2].name == "Pad");
    assert(defaults[3].filename == "bs_10.wav");
    assert(defaults[3].name == "Bass");

    TrackManifest parsed;
    std::string error;
    assert(sounddeck::ParseTrackManifest(
        sounddeck::SerializeTrackManifest(defaults), parsed, &error));
    assert(error.empty());
    assert(parsed.size() == defaults.size());
    for (std::size_t i = 0; i < parsed.size(); ++i) {
        assert(parsed[i].filename == defaults[i].filename);
        assert(parsed[i].name == defaults[i].name);
    }

    // Comments, blank lines and a missing label.
    const std::string text =
        "# stems\n"
        "sounddeck_tracks_v1\n"
        "\n"
        "track drums.wav | Drums \n"
        "track keys.wav|\n";
    TrackManifest custom;
    assert(sounddeck::ParseTrackManifest(text, custom, &error));
    assert(custom.size() == 2U);
    assert(custom[0].filename == "drums.wav" && custom[0].name == "Drums");
    assert(custom[1].filename == "keys.wav" && custom[1].name == "keys.wav");

    // Failures leave the output untouched and report the line.
    TrackManifest untouched = custom;
    assert(!sounddeck::ParseTrackManifest("track a.wav|A\n", untouched,
                                          &error));
    assert(error.find("line 1") != std::string::npos);
    assert(untouched.size() == 2U);

    assert(!sounddeck::ParseTrackManifest(
        "sounddeck_tracks_v1\ntrack a.wav|A\ntrack b.wav\n", untouched,
        &error));
    assert(error.find("line 3") != std::string::npos);
    assert(untouched.size() == 2U);

    assert(!sounddeck::ParseTrackManifest(
        "sounddeck_tracks_v1\nloop a.wav|A\n", untouched, &error));
    assert(!sounddeck::ParseTrackManifest("", untouched, nullptr));
}

void testLaunchOptions()
{
    LaunchOptions options = sounddeck::ParseLaunchOptions({});
    assert(options.audioEnabled);
    assert(options.assetsDirectory.empty());
    assert(options.manifestPath.empty());

    options = sounddeck::ParseLaunchOptions(
        {"--no-audio", "\"/tmp/my tracks\""});
    assert(!options.audioEnabled);
    assert(options.assetsDirectory == "/tmp/my tracks");

    // The last positional token wins.
    options = sounddeck::ParseLaunchOptions({"first", "second"});
    assert(options.assetsDirectory == "second");

    // --assets takes precedence over positional tokens.
    options = sounddeck::ParseLaunchOptions(
        {"--assets=/a", "/b", "--manifest='/m.txt'", "--verbose"});
    assert(options.assetsDirectory == "/a");
    assert(options.manifestPath == "/m.txt");
    assert(options.ignored.size() == 1U);
    assert(options.ignored[0] == "--verbose");
}

}  // namespace

int main()
{
    testFrequencyMath();
    testWaveforms();
    testNoiseGenerators();
    testStereoField();
    testAutopanner();
    testTickScheduler();
    testPlaybackClock();
    testScopeHistory();
    testWaveformOverview();
    testTrackManifest();
    testLaunchOptions();

    std::cout << "sounddeck-core-tests: OK" << std::endl;
    return 0;
}
