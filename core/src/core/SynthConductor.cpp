#include "core/SynthConductor.h"

#include "core/FrequencyMath.h"

namespace sounddeck {

SynthConductor::SynthConductor(SynthGraph& graph) : graph_(graph)
{
    graph_.SetMixerVolume(kMixerVolume);
    graph_.SetReverb(kReverbBalance, kReverbFeedback, kReverbCutoffHz);

    graph_.oscillator(SynthLayer::kBase).SetAmplitude(kBaseAmplitude);
    graph_.oscillator(SynthLayer::kOctaveUp).SetAmplitude(0.0F);
    graph_.oscillator(SynthLayer::kDetuned).SetAmplitude(0.0F);

    // Start silent without a ramp; later mute changes fade.
    if (muted_) {
        graph_.SetMasterGain(0.0F);
    }

    UpdateWaveforms();
    UpdateFrequencies();
}

void SynthConductor::set_frequency(const float hz)
{
    frequency_ = hz;
    UpdateFrequencies();
}

void SynthConductor::set_octave_up_multiplier(const float percent)
{
    octaveUpMultiplier_ = percent;
    const float base = graph_.oscillator(SynthLayer::kBase).amplitude();
    graph_.oscillator(SynthLayer::kOctaveUp)
        .SetAmplitude(LayerAmplitude(base, percent));
}

void SynthConductor::set_detuned_multiplier(const float percent)
{
    detunedMultiplier_ = percent;
    const float base = graph_.oscillator(SynthLayer::kBase).amplitude();
    graph_.oscillator(SynthLayer::kDetuned)
        .SetAmplitude(LayerAmplitude(base, percent));
}

void SynthConductor::set_muted(const bool muted)
{
    muted_ = muted;
    graph_.RampMasterGain(muted_ ? 0.0F : 1.0F, kMuteRampSeconds);
}

void SynthConductor::set_waveform(const Waveform waveform)
{
    waveform_ = waveform;
    UpdateWaveforms();
}

float SynthConductor::octave_up_frequency() const
{
    return graph_.oscillator(SynthLayer::kOctaveUp).frequency();
}

float SynthConductor::detuned_frequency() const
{
    return graph_.oscillator(SynthLayer::kDetuned).frequency();
}

bool SynthConductor::SetupAudio(std::string* const error)
{
    return graph_.Start(error);
}

void SynthConductor::Start()
{
    graph_.oscillator(SynthLayer::kBase).Start();
    graph_.oscillator(SynthLayer::kOctaveUp).Start();
    graph_.oscillator(SynthLayer::kDetuned).Start();
    oscillatorsRunning_ = true;
}

void SynthConductor::Stop()
{
    graph_.oscillator(SynthLayer::kBase).Stop();
    graph_.oscillator(SynthLayer::kOctaveUp).Stop();
    graph_.oscillator(SynthLayer::kDetuned).Stop();
    oscillatorsRunning_ = false;
}

void SynthConductor::UpdateFrequencies()
{
    graph_.oscillator(SynthLayer::kBase).SetFrequency(frequency_);
    graph_.oscillator(SynthLayer::kOctaveUp)
        .SetFrequency(OctaveUpFrequency(frequency_));
    graph_.oscillator(SynthLayer::kDetuned)
        .SetFrequency(DetuneFrequency(frequency_, kDetuneCents));
}

void SynthConductor::UpdateWaveforms()
{
    graph_.oscillator(SynthLayer::kBase).SetWaveform(waveform_);
    graph_.oscillator(SynthLayer::kOctaveUp).SetWaveform(waveform_);
    graph_.oscillator(SynthLayer::kDetuned).SetWaveform(waveform_);
}

}  // namespace sounddeck
