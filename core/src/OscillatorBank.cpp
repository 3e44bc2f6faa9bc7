#include "OscillatorBank.h"

#include <algorithm>
#include <cmath>

#include "AudioEngine.h"
#include "core/Waveform.h"

void OscillatorBank::Oscillator::SetAmplitude(const float amplitude)
{
    amplitude_.store(amplitude, std::memory_order_relaxed);
}

float OscillatorBank::Oscillator::amplitude() const
{
    return amplitude_.load(std::memory_order_relaxed);
}

void OscillatorBank::Oscillator::Start()
{
    running_.store(true, std::memory_order_relaxed);
}

void OscillatorBank::Oscillator::Stop()
{
    running_.store(false, std::memory_order_relaxed);
}

void OscillatorBank::Oscillator::SetFrequency(const float hz)
{
    frequency_.store(hz, std::memory_order_relaxed);
}

float OscillatorBank::Oscillator::frequency() const
{
    return frequency_.load(std::memory_order_relaxed);
}

void OscillatorBank::Oscillator::SetWaveform(
    const sounddeck::Waveform waveform)
{
    waveform_.store(static_cast<int>(waveform), std::memory_order_relaxed);
}

float OscillatorBank::Oscillator::nextSample(const double sampleRate) noexcept
{
    if (!running_.load(std::memory_order_relaxed)) {
        return 0.0F;
    }

    const auto shape = sounddeck::WaveformFromIndex(
        waveform_.load(std::memory_order_relaxed));
    const float value = sounddeck::WaveformSample(shape, phase_) *
                        amplitude_.load(std::memory_order_relaxed);

    const double increment =
        static_cast<double>(frequency_.load(std::memory_order_relaxed)) /
        sampleRate;
    phase_ += increment;
    phase_ -= std::floor(phase_);

    return value;
}

OscillatorBank::OscillatorBank(const AudioEngine& engine) : engine_(engine)
{
    mono_.assign(512, 0.0F);
    scratchLeft_.assign(512, 0.0F);
    scratchRight_.assign(512, 0.0F);
}

sounddeck::OscillatorNode& OscillatorBank::oscillator(
    const sounddeck::SynthLayer layer)
{
    return oscillators_[static_cast<std::size_t>(layer)];
}

void OscillatorBank::SetMixerVolume(const float volume)
{
    mixerVolume_.store(volume, std::memory_order_relaxed);
}

void OscillatorBank::SetMasterGain(const float gain)
{
    RampMasterGain(gain, 0.0);
}

void OscillatorBank::RampMasterGain(const float target, const double seconds)
{
    masterTarget_.store(target, std::memory_order_relaxed);
    masterRampSeconds_.store(std::max(0.0, seconds),
                             std::memory_order_relaxed);
    masterRequest_.fetch_add(1, std::memory_order_release);
}

void OscillatorBank::SetReverb(const float balance, const float feedback,
                               const float cutoffHz)
{
    reverbBalance_.store(balance, std::memory_order_relaxed);
    reverbFeedback_.store(feedback, std::memory_order_relaxed);
    reverbCutoffHz_.store(cutoffHz, std::memory_order_relaxed);
    reverbRequest_.fetch_add(1, std::memory_order_release);
}

bool OscillatorBank::Start(std::string* const error)
{
    if (!engine_.checkDeviceReady(error)) {
        juce::Logger::writeToLog("[sounddeck] Synth graph not started: " +
                                 juce::String(error != nullptr ? *error : ""));
        return false;
    }

    if (!active_.exchange(true, std::memory_order_relaxed)) {
        juce::Logger::writeToLog("[sounddeck] Synth graph started.");
    }
    if (error != nullptr) {
        error->clear();
    }
    return true;
}

void OscillatorBank::prepare(const double sampleRate,
                             const int maximumBlockSize)
{
    sampleRate_ = sampleRate > 0.0 ? sampleRate : 44100.0;

    const auto size = static_cast<std::size_t>(std::max(1, maximumBlockSize));
    mono_.assign(size, 0.0F);
    scratchLeft_.assign(size, 0.0F);
    scratchRight_.assign(size, 0.0F);

    reverb_.setSampleRate(sampleRate_);
    reverb_.reset();

    // Re-apply the current fader target without a ramp so a device
    // restart does not replay an old fade.
    masterGain_.reset(sampleRate_, 0.0);
    masterGain_.setCurrentAndTargetValue(
        masterTarget_.load(std::memory_order_relaxed));
    appliedMasterRequest_ = masterRequest_.load(std::memory_order_acquire);
    appliedReverbRequest_ = -1;

    scope_.setSampleRate(sampleRate_);
    scope_.reset();
}

void OscillatorBank::applyPendingParameters() noexcept
{
    const int masterRequest = masterRequest_.load(std::memory_order_acquire);
    if (masterRequest != appliedMasterRequest_) {
        appliedMasterRequest_ = masterRequest;
        const float target = masterTarget_.load(std::memory_order_relaxed);
        const double ramp =
            masterRampSeconds_.load(std::memory_order_relaxed);
        if (ramp <= 0.0) {
            masterGain_.setCurrentAndTargetValue(target);
        } else {
            // reset() snaps to the target; restore the current value so
            // the fade starts from where the fader is now.
            const float current = masterGain_.getCurrentValue();
            masterGain_.reset(sampleRate_, ramp);
            masterGain_.setCurrentAndTargetValue(current);
            masterGain_.setTargetValue(target);
        }
    }

    const int reverbRequest = reverbRequest_.load(std::memory_order_acquire);
    if (reverbRequest != appliedReverbRequest_) {
        appliedReverbRequest_ = reverbRequest;

        const float balance = juce::jlimit(
            0.0F, 1.0F, reverbBalance_.load(std::memory_order_relaxed));
        const float feedback = juce::jlimit(
            0.0F, 1.0F, reverbFeedback_.load(std::memory_order_relaxed));
        const float cutoff = reverbCutoffHz_.load(std::memory_order_relaxed);

        // A low cutoff darkens the tail: map it onto damping relative to
        // the Nyquist frequency.
        const auto nyquist = static_cast<float>(sampleRate_ * 0.5);
        const float damping =
            1.0F - juce::jlimit(0.0F, 1.0F, cutoff / nyquist);

        juce::Reverb::Parameters params;
        params.roomSize = feedback;
        params.damping = damping;
        params.wetLevel = balance;
        params.dryLevel = 1.0F - balance;
        params.width = 1.0F;
        params.freezeMode = 0.0F;
        reverb_.setParameters(params);
    }
}

void OscillatorBank::render(float* const left, float* const right,
                            const int numSamples) noexcept
{
    if (!active_.load(std::memory_order_relaxed) || numSamples <= 0) {
        return;
    }

    if (static_cast<int>(mono_.size()) < numSamples) {
        const auto size = static_cast<std::size_t>(numSamples);
        mono_.resize(size, 0.0F);
        scratchLeft_.resize(size, 0.0F);
        scratchRight_.resize(size, 0.0F);
    }

    applyPendingParameters();

    const float mixerVolume = mixerVolume_.load(std::memory_order_relaxed);

    for (int i = 0; i < numSamples; ++i) {
        float sum = 0.0F;
        for (auto& osc : oscillators_) {
            sum += osc.nextSample(sampleRate_);
        }
        mono_[static_cast<std::size_t>(i)] = sum * mixerVolume;
    }

    scope_.write(mono_.data(), numSamples);

    for (int i = 0; i < numSamples; ++i) {
        const auto idx = static_cast<std::size_t>(i);
        const float sample = mono_[idx] * masterGain_.getNextValue();
        scratchLeft_[idx] = sample;
        scratchRight_[idx] = sample;
    }

    reverb_.processStereo(scratchLeft_.data(), scratchRight_.data(),
                          numSamples);

    for (int i = 0; i < numSamples; ++i) {
        const auto idx = static_cast<std::size_t>(i);
        left[i] += scratchLeft_[idx];
        right[i] += scratchRight_[idx];
    }
}

void OscillatorBank::getScopeSnapshot(float* const dst, const int numPoints,
                                      const double windowSeconds) const noexcept
{
    scope_.snapshot(dst, numPoints, windowSeconds);
}
