#include "MainComponent.h"

#include "AudioEngine.h"
#include "MainComponent_MixerView.h"
#include "MainComponent_NoiseView.h"
#include "MainComponent_SynthView.h"
#include "NoiseField.h"
#include "OscillatorBank.h"
#include "SoundDeckLookAndFeel.h"
#include "TrackPlayerBank.h"

MainComponent::MainComponent(AudioEngine& audioEngine,
                             sounddeck::TrackManifest manifest,
                             std::string assetsDirectory)
    : audioEngine_(audioEngine)
{
    synthConductor_ = std::make_unique<sounddeck::SynthConductor>(
        audioEngine_.synthGraph());
    noiseConductor_ = std::make_unique<sounddeck::NoiseConductor>(
        audioEngine_.noiseGraph(), scheduler_);
    mixerConductor_ = std::make_unique<sounddeck::MixerConductor>(
        audioEngine_.trackGraph(), scheduler_, &MainComponent::nowSeconds,
        std::move(manifest), std::move(assetsDirectory));

    synthView_ = std::make_unique<sounddeck::ui::SynthView>(
        *synthConductor_, audioEngine_.synthGraph());
    noiseView_ = std::make_unique<sounddeck::ui::NoiseView>(*noiseConductor_);
    mixerView_ = std::make_unique<sounddeck::ui::MixerView>(*mixerConductor_);

    const auto tabColour = SoundDeckLookAndFeel::kBackgroundColour;
    tabs_.setTabBarDepth(36);
    tabs_.addTab("Mono Synth", tabColour, synthView_.get(), false);
    tabs_.addTab("Ambient Noise", tabColour, noiseView_.get(), false);
    tabs_.addTab("Multi-Track", tabColour, mixerView_.get(), false);
    addAndMakeVisible(tabs_);

    if (audioEngine_.hasInitError()) {
        juce::String text = "Audio unavailable";
        if (audioEngine_.hasNoOutputChannels()) {
            text += ": no output channels";
        } else if (!audioEngine_.initErrorMessage().empty()) {
            text += ": " + juce::String(audioEngine_.initErrorMessage());
        }
        audioBanner_.setText(text, juce::dontSendNotification);
        audioBanner_.setJustificationType(juce::Justification::centred);
        audioBanner_.setColour(juce::Label::backgroundColourId,
                               juce::Colours::darkred);
        audioBanner_.setColour(juce::Label::textColourId,
                               juce::Colours::white);
        addAndMakeVisible(audioBanner_);
    }

    setSize(480, 820);

    scheduler_.Advance(nowSeconds());
    startTimerHz(kTimerHz);
}

MainComponent::~MainComponent()
{
    stopTimer();
    tabs_.clearTabs();
}

double MainComponent::nowSeconds()
{
    return juce::Time::getMillisecondCounterHiRes() / 1000.0;
}

void MainComponent::paint(juce::Graphics& g)
{
    g.fillAll(SoundDeckLookAndFeel::kBackgroundColour);
}

void MainComponent::resized()
{
    auto bounds = getLocalBounds();
    if (audioBanner_.isVisible()) {
        audioBanner_.setBounds(bounds.removeFromTop(28));
    }
    tabs_.setBounds(bounds);
}

void MainComponent::timerCallback()
{
    scheduler_.Advance(nowSeconds());

    synthView_->refresh();
    noiseView_->refresh();
    mixerView_->refresh();
}
