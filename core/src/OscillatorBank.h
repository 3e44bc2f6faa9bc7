#pragma once

#include <array>
#include <atomic>
#include <string>
#include <vector>

#include <juce_audio_basics/juce_audio_basics.h>

#include "core/AudioGraphs.h"
#include "core/ScopeHistory.h"

class AudioEngine;

// Synth graph: three phase-accumulating oscillators summed by a mixer,
// a master fader with a smoothed ramp and a stereo reverb. The mixer
// output (before the master fader) feeds the oscilloscope history.
//
// Parameter setters run on the UI thread and only touch atomics; the
// audio thread picks them up at the start of each block.
class OscillatorBank : public sounddeck::SynthGraph {
public:
    // At 44.1 kHz, 4096 samples correspond to ~93 ms of audio.
    static constexpr int kScopeHistorySize = 4096;

    explicit OscillatorBank(const AudioEngine& engine);
    ~OscillatorBank() override = default;

    // sounddeck::SynthGraph
    sounddeck::OscillatorNode& oscillator(sounddeck::SynthLayer layer) override;
    void SetMixerVolume(float volume) override;
    void SetMasterGain(float gain) override;
    void RampMasterGain(float target, double seconds) override;
    void SetReverb(float balance, float feedback, float cutoffHz) override;
    bool Start(std::string* error) override;

    // Audio thread.
    void prepare(double sampleRate, int maximumBlockSize);
    void render(float* left, float* right, int numSamples) noexcept;

    // UI thread: evenly spaced points covering the last `windowSeconds`
    // of the mixer output.
    void getScopeSnapshot(float* dst, int numPoints,
                          double windowSeconds) const noexcept;

private:
    class Oscillator final : public sounddeck::OscillatorNode {
    public:
        void SetAmplitude(float amplitude) override;
        [[nodiscard]] float amplitude() const override;
        void Start() override;
        void Stop() override;
        void SetFrequency(float hz) override;
        [[nodiscard]] float frequency() const override;
        void SetWaveform(sounddeck::Waveform waveform) override;

        // Audio thread: next output sample including amplitude, or 0
        // while stopped.
        [[nodiscard]] float nextSample(double sampleRate) noexcept;

    private:
        std::atomic<float> frequency_{440.0F};
        std::atomic<float> amplitude_{0.0F};
        std::atomic<int> waveform_{0};
        std::atomic<bool> running_{false};

        // Normalised phase in [0,1); audio thread only.
        double phase_{0.0};
    };

    void applyPendingParameters() noexcept;

    const AudioEngine& engine_;

    std::array<Oscillator, sounddeck::kNumSynthLayers> oscillators_;

    std::atomic<float> mixerVolume_{1.0F};
    std::atomic<bool> active_{false};

    // Master fader requests. The request counter is bumped after the
    // target and ramp time so the audio thread sees a complete request.
    std::atomic<float> masterTarget_{1.0F};
    std::atomic<double> masterRampSeconds_{0.0};
    std::atomic<int> masterRequest_{0};
    int appliedMasterRequest_{0};
    juce::SmoothedValue<float> masterGain_{1.0F};

    std::atomic<float> reverbBalance_{0.0F};
    std::atomic<float> reverbFeedback_{0.5F};
    std::atomic<float> reverbCutoffHz_{5000.0F};
    std::atomic<int> reverbRequest_{0};
    int appliedReverbRequest_{-1};
    juce::Reverb reverb_;

    sounddeck::ScopeHistory scope_{kScopeHistorySize};

    double sampleRate_{44100.0};
    std::vector<float> mono_;
    std::vector<float> scratchLeft_;
    std::vector<float> scratchRight_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(OscillatorBank)
};
