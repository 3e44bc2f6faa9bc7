#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_dsp/juce_dsp.h>

#include "core/AudioGraphs.h"
#include "core/NoiseGenerator.h"

class AudioEngine;

// Noise graph: pink, white and brown generators, each with its own
// amplitude and balanced panner, summed, narrowed by the stereo-field
// limiter and sent through a reverb.
class NoiseField : public sounddeck::NoiseGraph {
public:
    explicit NoiseField(const AudioEngine& engine);
    ~NoiseField() override = default;

    // sounddeck::NoiseGraph
    sounddeck::AmplitudeNode& source(sounddeck::NoiseColour colour) override;
    sounddeck::PanNode& panner(sounddeck::NoiseColour colour) override;
    void SetStereoFieldAmount(float amount) override;
    void SetReverbMix(float dryWet) override;
    bool Start(std::string* error) override;
    void Stop() override;

    // Audio thread.
    void prepare(double sampleRate, int maximumBlockSize);
    void render(float* left, float* right, int numSamples) noexcept;

private:
    // One generator with its amplitude and panner. The same object is
    // exposed as both the source and the panner node of its colour.
    class Channel final : public sounddeck::AmplitudeNode,
                          public sounddeck::PanNode {
    public:
        Channel(sounddeck::NoiseColour colour, std::uint32_t seed);

        void SetAmplitude(float amplitude) override;
        [[nodiscard]] float amplitude() const override;
        void Start() override;
        void Stop() override;

        void SetPan(float pan) override;
        [[nodiscard]] float pan() const override;

        void prepare(double sampleRate, int maximumBlockSize);

        // Audio thread: adds the panned channel into `left`/`right`.
        void renderAdding(float* left, float* right, int numSamples) noexcept;

    private:
        std::atomic<float> amplitude_{0.0F};
        std::atomic<float> pan_{0.0F};
        std::atomic<bool> running_{false};

        sounddeck::NoiseGenerator generator_;
        juce::dsp::Panner<float> panner_;
        juce::AudioBuffer<float> buffer_;
    };

    const AudioEngine& engine_;

    std::array<std::unique_ptr<Channel>, sounddeck::kNumNoiseColours> channels_;

    std::atomic<bool> active_{false};
    std::atomic<float> stereoFieldAmount_{0.0F};
    std::atomic<float> reverbMix_{0.0F};

    juce::Reverb reverb_;
    float appliedReverbMix_{-1.0F};

    std::vector<float> mixLeft_;
    std::vector<float> mixRight_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(NoiseField)
};
