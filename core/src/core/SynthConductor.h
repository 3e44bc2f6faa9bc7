#pragma once

#include <string>

#include "core/AudioGraphs.h"
#include "core/Waveform.h"

namespace sounddeck {

// State behind the mono synth screen: a base oscillator, an octave-up
// layer and a slightly detuned layer. Layer levels are percentages of
// the base amplitude; the mute flag drives a short master fader ramp.
//
// Every setter updates the state and immediately writes the matching
// graph parameters.
class SynthConductor {
public:
    static constexpr float kDefaultFrequency = 100.0F;
    static constexpr float kMinFrequency = 20.0F;
    static constexpr float kMaxFrequency = 1500.0F;

    static constexpr float kBaseAmplitude = 0.3F;
    static constexpr float kMixerVolume = 0.75F;
    static constexpr float kDetuneCents = 7.0F;
    static constexpr double kMuteRampSeconds = 0.2;

    static constexpr float kReverbBalance = 0.4F;
    static constexpr float kReverbFeedback = 0.7F;
    static constexpr float kReverbCutoffHz = 3000.0F;

    explicit SynthConductor(SynthGraph& graph);

    SynthConductor(const SynthConductor&) = delete;
    SynthConductor& operator=(const SynthConductor&) = delete;

    void set_frequency(float hz);
    [[nodiscard]] float frequency() const noexcept { return frequency_; }

    // Layer levels in percent of the base amplitude, [0,100].
    void set_octave_up_multiplier(float percent);
    [[nodiscard]] float octave_up_multiplier() const noexcept
    {
        return octaveUpMultiplier_;
    }

    void set_detuned_multiplier(float percent);
    [[nodiscard]] float detuned_multiplier() const noexcept
    {
        return detunedMultiplier_;
    }

    void set_muted(bool muted);
    void ToggleMute() { set_muted(!muted_); }
    [[nodiscard]] bool is_muted() const noexcept { return muted_; }

    void set_waveform(Waveform waveform);
    [[nodiscard]] Waveform waveform() const noexcept { return waveform_; }

    // Frequencies currently written to the two layers.
    [[nodiscard]] float octave_up_frequency() const;
    [[nodiscard]] float detuned_frequency() const;

    // Brings the audio graph online.
    bool SetupAudio(std::string* error);

    // Starts/stops all three oscillators.
    void Start();
    void Stop();
    [[nodiscard]] bool oscillators_running() const noexcept
    {
        return oscillatorsRunning_;
    }

private:
    void UpdateFrequencies();
    void UpdateWaveforms();

    SynthGraph& graph_;

    float frequency_{kDefaultFrequency};
    float octaveUpMultiplier_{0.0F};
    float detunedMultiplier_{0.0F};
    bool muted_{true};
    Waveform waveform_{Waveform::kSine};
    bool oscillatorsRunning_{false};
};

}  // namespace sounddeck
