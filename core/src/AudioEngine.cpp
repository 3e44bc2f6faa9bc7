#include "AudioEngine.h"

#include <algorithm>

#include "NoiseField.h"
#include "OscillatorBank.h"
#include "TrackPlayerBank.h"

AudioEngine::AudioEngine(const bool openDevice)
{
    // Graphs must exist before the callback is registered: the device
    // may start calling back immediately.
    synth_ = std::make_unique<OscillatorBank>(*this);
    noise_ = std::make_unique<NoiseField>(*this);
    tracks_ = std::make_unique<TrackPlayerBank>(*this);

    if (!openDevice) {
        initError_ = true;
        initErrorMessage_ = "audio disabled from the command line";
        juce::Logger::writeToLog(
            "[sounddeck] Audio device disabled (--no-audio).");
        return;
    }

    // Initialise with no inputs and stereo outputs.
    const juce::String audioError =
        deviceManager_.initialiseWithDefaultDevices(/*numInputChannels*/ 0,
                                                    /*numOutputChannels*/ 2);
    if (audioError.isNotEmpty()) {
        juce::Logger::writeToLog("[sounddeck] Failed to initialise audio: " +
                                 audioError);

        initError_ = true;
        initErrorMessage_ = audioError.toStdString();
        if (audioError.containsIgnoreCase("no channels")) {
            noOutputChannels_ = true;
        }
        return;
    }

    deviceManager_.addAudioCallback(this);
    juce::Logger::writeToLog("[sounddeck] Audio engine initialised.");
}

AudioEngine::~AudioEngine()
{
    shutdown();
}

void AudioEngine::shutdown()
{
    if (isShutdown_) {
        return;
    }

    isShutdown_ = true;

    // No further callbacks may reach the graphs once they start being
    // destroyed; the device manager closes the device in its own
    // destructor.
    deviceManager_.removeAudioCallback(this);
}

bool AudioEngine::checkDeviceReady(std::string* const error) const
{
    if (!initError_ && !isShutdown_) {
        return true;
    }

    if (error != nullptr) {
        *error = "audio device unavailable";
        if (!initErrorMessage_.empty()) {
            *error += ": " + initErrorMessage_;
        }
    }
    return false;
}

void AudioEngine::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    const double sr =
        (device != nullptr) ? device->getCurrentSampleRate() : 44100.0;
    const double rate = sr > 0.0 ? sr : 44100.0;
    const int blockSize =
        (device != nullptr) ? std::max(1, device->getCurrentBufferSizeSamples())
                            : 512;

    sampleRate_.store(rate, std::memory_order_relaxed);

    mixLeft_.assign(static_cast<std::size_t>(blockSize), 0.0F);
    mixRight_.assign(static_cast<std::size_t>(blockSize), 0.0F);

    synth_->prepare(rate, blockSize);
    noise_->prepare(rate, blockSize);
    tracks_->prepare(rate, blockSize);

    juce::Logger::writeToLog("[sounddeck] Audio device started: " +
                             juce::String(rate) + " Hz, block " +
                             juce::String(blockSize));
}

void AudioEngine::audioDeviceStopped()
{
    juce::Logger::writeToLog("[sounddeck] Audio device stopped.");
}

void AudioEngine::audioDeviceIOCallbackWithContext(
    const float* const* inputChannelData,
    const int numInputChannels,
    float* const* outputChannelData,
    const int numOutputChannels,
    const int numSamples,
    const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused(inputChannelData, numInputChannels, context);

    // Hosts may deliver a block larger than announced; grow the scratch
    // buffers on the fly in that case.
    if (static_cast<int>(mixLeft_.size()) < numSamples) {
        mixLeft_.resize(static_cast<std::size_t>(numSamples), 0.0F);
        mixRight_.resize(static_cast<std::size_t>(numSamples), 0.0F);
    }

    std::fill(mixLeft_.begin(), mixLeft_.begin() + numSamples, 0.0F);
    std::fill(mixRight_.begin(), mixRight_.begin() + numSamples, 0.0F);

    const std::int64_t blockStart =
        sampleTime_.load(std::memory_order_relaxed);

    synth_->render(mixLeft_.data(), mixRight_.data(), numSamples);
    noise_->render(mixLeft_.data(), mixRight_.data(), numSamples);
    tracks_->render(mixLeft_.data(), mixRight_.data(), numSamples,
                    blockStart);

    for (int channel = 0; channel < numOutputChannels; ++channel) {
        auto* buffer = outputChannelData[channel];
        if (buffer == nullptr) {
            continue;
        }

        if (numOutputChannels == 1) {
            for (int i = 0; i < numSamples; ++i) {
                buffer[i] = 0.5F * (mixLeft_[static_cast<std::size_t>(i)] +
                                    mixRight_[static_cast<std::size_t>(i)]);
            }
        } else if (channel == 0) {
            std::copy(mixLeft_.begin(), mixLeft_.begin() + numSamples,
                      buffer);
        } else if (channel == 1) {
            std::copy(mixRight_.begin(), mixRight_.begin() + numSamples,
                      buffer);
        } else {
            std::fill(buffer, buffer + numSamples, 0.0F);
        }
    }

    sampleTime_.store(blockStart + numSamples, std::memory_order_release);
}
