#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_basics/juce_audio_basics.h>

class OscillatorBank;
class NoiseField;
class TrackPlayerBank;

// Audio engine for SoundDeck.
//
// Responsibilities:
//   - Own a JUCE AudioDeviceManager (stereo output, no inputs).
//   - Host the three engine-side graphs (synth, noise field, track
//     players) and sum them into the device output.
//   - Maintain a monotonic sample clock used to schedule synchronized
//     track starts.
//
// When the device cannot be opened the engine stays usable: graphs can
// be configured and queried, but their Start() reports the failure.
class AudioEngine : public juce::AudioIODeviceCallback {
public:
    // When `openDevice` is false no device is opened and the engine
    // behaves as if initialisation had failed.
    explicit AudioEngine(bool openDevice = true);
    ~AudioEngine() override;

    // juce::AudioIODeviceCallback
    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData,
        int numInputChannels,
        float* const* outputChannelData,
        int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

    // Detaches the audio callback. Safe to call more than once.
    void shutdown();

    // True when the audio device failed to initialise (or was disabled
    // from the command line).
    [[nodiscard]] bool hasInitError() const noexcept { return initError_; }

    // True when the failure was specifically "no output channels".
    [[nodiscard]] bool hasNoOutputChannels() const noexcept
    {
        return noOutputChannels_;
    }

    [[nodiscard]] const std::string& initErrorMessage() const noexcept
    {
        return initErrorMessage_;
    }

    // Used by the graphs' Start(): returns false and writes a message
    // when there is no running device.
    bool checkDeviceReady(std::string* error) const;

    [[nodiscard]] double sampleRate() const noexcept
    {
        return sampleRate_.load(std::memory_order_relaxed);
    }

    // Number of samples rendered since the engine was created.
    [[nodiscard]] std::int64_t currentSampleTime() const noexcept
    {
        return sampleTime_.load(std::memory_order_acquire);
    }

    [[nodiscard]] OscillatorBank& synthGraph() noexcept { return *synth_; }
    [[nodiscard]] NoiseField& noiseGraph() noexcept { return *noise_; }
    [[nodiscard]] TrackPlayerBank& trackGraph() noexcept { return *tracks_; }

private:
    juce::AudioDeviceManager deviceManager_;

    std::unique_ptr<OscillatorBank> synth_;
    std::unique_ptr<NoiseField> noise_;
    std::unique_ptr<TrackPlayerBank> tracks_;

    // Device sample rate, written from audioDeviceAboutToStart.
    std::atomic<double> sampleRate_{44100.0};
    std::atomic<std::int64_t> sampleTime_{0};

    // Mix scratch buffers (audio thread only).
    std::vector<float> mixLeft_;
    std::vector<float> mixRight_;

    bool initError_{false};
    bool noOutputChannels_{false};
    std::string initErrorMessage_;
    bool isShutdown_{false};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioEngine)
};
