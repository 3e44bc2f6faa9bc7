#include "NoiseField.h"

#include <algorithm>

#include "AudioEngine.h"
#include "core/StereoField.h"

NoiseField::Channel::Channel(const sounddeck::NoiseColour colour,
                             const std::uint32_t seed)
    : generator_(colour, seed)
{
    panner_.setRule(juce::dsp::PannerRule::balanced);
    buffer_.setSize(2, 512);
}

void NoiseField::Channel::SetAmplitude(const float amplitude)
{
    amplitude_.store(amplitude, std::memory_order_relaxed);
}

float NoiseField::Channel::amplitude() const
{
    return amplitude_.load(std::memory_order_relaxed);
}

void NoiseField::Channel::Start()
{
    running_.store(true, std::memory_order_relaxed);
}

void NoiseField::Channel::Stop()
{
    running_.store(false, std::memory_order_relaxed);
}

void NoiseField::Channel::SetPan(const float pan)
{
    pan_.store(juce::jlimit(-1.0F, 1.0F, pan), std::memory_order_relaxed);
}

float NoiseField::Channel::pan() const
{
    return pan_.load(std::memory_order_relaxed);
}

void NoiseField::Channel::prepare(const double sampleRate,
                                  const int maximumBlockSize)
{
    const juce::dsp::ProcessSpec spec{
        sampleRate, static_cast<juce::uint32>(maximumBlockSize), 2};
    panner_.prepare(spec);
    buffer_.setSize(2, maximumBlockSize);
}

void NoiseField::Channel::renderAdding(float* const left, float* const right,
                                       const int numSamples) noexcept
{
    if (!running_.load(std::memory_order_relaxed)) {
        return;
    }

    const float amplitude = amplitude_.load(std::memory_order_relaxed);
    if (amplitude <= 0.0F) {
        return;
    }

    if (buffer_.getNumSamples() < numSamples) {
        buffer_.setSize(2, numSamples, false, false, true);
    }

    float* l = buffer_.getWritePointer(0);
    float* r = buffer_.getWritePointer(1);

    generator_.Render(l, numSamples);
    juce::FloatVectorOperations::multiply(l, amplitude, numSamples);
    juce::FloatVectorOperations::copy(r, l, numSamples);

    panner_.setPan(pan_.load(std::memory_order_relaxed));
    auto block = juce::dsp::AudioBlock<float>(buffer_).getSubBlock(
        0, static_cast<std::size_t>(numSamples));
    panner_.process(juce::dsp::ProcessContextReplacing<float>(block));

    juce::FloatVectorOperations::add(left, l, numSamples);
    juce::FloatVectorOperations::add(right, r, numSamples);
}

NoiseField::NoiseField(const AudioEngine& engine) : engine_(engine)
{
    // Distinct non-zero seeds so the three sources are uncorrelated.
    for (const auto colour : sounddeck::kAllNoiseColours) {
        const auto index = static_cast<std::uint32_t>(colour);
        const std::uint32_t seed = 0x12345678U + index * 0x9E3779B9U;
        channels_[static_cast<std::size_t>(colour)] =
            std::make_unique<Channel>(colour, seed);
    }

    mixLeft_.assign(512, 0.0F);
    mixRight_.assign(512, 0.0F);
}

sounddeck::AmplitudeNode& NoiseField::source(
    const sounddeck::NoiseColour colour)
{
    return *channels_[static_cast<std::size_t>(colour)];
}

sounddeck::PanNode& NoiseField::panner(const sounddeck::NoiseColour colour)
{
    return *channels_[static_cast<std::size_t>(colour)];
}

void NoiseField::SetStereoFieldAmount(const float amount)
{
    stereoFieldAmount_.store(amount, std::memory_order_relaxed);
}

void NoiseField::SetReverbMix(const float dryWet)
{
    reverbMix_.store(dryWet, std::memory_order_relaxed);
}

bool NoiseField::Start(std::string* const error)
{
    if (!engine_.checkDeviceReady(error)) {
        juce::Logger::writeToLog("[sounddeck] Noise graph not started: " +
                                 juce::String(error != nullptr ? *error : ""));
        return false;
    }

    active_.store(true, std::memory_order_relaxed);
    juce::Logger::writeToLog("[sounddeck] Noise graph started.");
    if (error != nullptr) {
        error->clear();
    }
    return true;
}

void NoiseField::Stop()
{
    if (active_.exchange(false, std::memory_order_relaxed)) {
        juce::Logger::writeToLog("[sounddeck] Noise graph stopped.");
    }
}

void NoiseField::prepare(const double sampleRate, const int maximumBlockSize)
{
    for (auto& channel : channels_) {
        channel->prepare(sampleRate, maximumBlockSize);
    }

    const auto size = static_cast<std::size_t>(std::max(1, maximumBlockSize));
    mixLeft_.assign(size, 0.0F);
    mixRight_.assign(size, 0.0F);

    reverb_.setSampleRate(sampleRate);
    reverb_.reset();
    appliedReverbMix_ = -1.0F;
}

void NoiseField::render(float* const left, float* const right,
                        const int numSamples) noexcept
{
    if (!active_.load(std::memory_order_relaxed) || numSamples <= 0) {
        return;
    }

    if (static_cast<int>(mixLeft_.size()) < numSamples) {
        mixLeft_.resize(static_cast<std::size_t>(numSamples), 0.0F);
        mixRight_.resize(static_cast<std::size_t>(numSamples), 0.0F);
    }

    std::fill(mixLeft_.begin(), mixLeft_.begin() + numSamples, 0.0F);
    std::fill(mixRight_.begin(), mixRight_.begin() + numSamples, 0.0F);

    for (auto& channel : channels_) {
        channel->renderAdding(mixLeft_.data(), mixRight_.data(), numSamples);
    }

    sounddeck::ApplyStereoFieldLimit(
        mixLeft_.data(), mixRight_.data(), numSamples,
        stereoFieldAmount_.load(std::memory_order_relaxed));

    const float mix =
        juce::jlimit(0.0F, 1.0F, reverbMix_.load(std::memory_order_relaxed));
    if (mix != appliedReverbMix_) {
        appliedReverbMix_ = mix;

        juce::Reverb::Parameters params;
        params.roomSize = 0.8F;
        params.damping = 0.5F;
        params.wetLevel = mix;
        params.dryLevel = 1.0F - mix;
        params.width = 1.0F;
        params.freezeMode = 0.0F;
        reverb_.setParameters(params);
    }

    reverb_.processStereo(mixLeft_.data(), mixRight_.data(), numSamples);

    juce::FloatVectorOperations::add(left, mixLeft_.data(), numSamples);
    juce::FloatVectorOperations::add(right, mixRight_.data(), numSamples);
}
