#include "MainComponent_SynthView.h"

#include <string>

#include "OscillatorBank.h"
#include "SoundDeckLookAndFeel.h"
#include "core/SynthConductor.h"
#include "core/Waveform.h"

namespace sounddeck::ui {

ScopeDisplay::ScopeDisplay(const OscillatorBank& source)
    : source_(source), points_(static_cast<std::size_t>(kNumPoints), 0.0F)
{
    setInterceptsMouseClicks(false, false);
}

void ScopeDisplay::refresh()
{
    source_.getScopeSnapshot(points_.data(), kNumPoints, kWindowSeconds);
    repaint();
}

void ScopeDisplay::paint(juce::Graphics& g)
{
    const auto bounds = getLocalBounds().toFloat();
    g.setColour(juce::Colour::fromFloatRGBA(0.0F, 0.05F, 0.15F, 1.0F));
    g.fillRoundedRectangle(bounds, 6.0F);

    const float midY = bounds.getCentreY();
    const float halfHeight = bounds.getHeight() * 0.45F;

    g.setColour(juce::Colours::white.withAlpha(0.08F));
    g.drawHorizontalLine(static_cast<int>(midY), bounds.getX(),
                         bounds.getRight());

    juce::Path path;
    for (int i = 0; i < kNumPoints; ++i) {
        const float x = bounds.getX() + bounds.getWidth() *
                                            static_cast<float>(i) /
                                            static_cast<float>(kNumPoints - 1);
        const float sample = juce::jlimit(
            -1.0F, 1.0F, points_[static_cast<std::size_t>(i)]);
        const float y = midY - sample * halfHeight;
        if (i == 0) {
            path.startNewSubPath(x, y);
        } else {
            path.lineTo(x, y);
        }
    }

    g.setColour(juce::Colours::cyan);
    g.strokePath(path, juce::PathStrokeType(1.5F));
}

SynthView::SynthView(SynthConductor& conductor,
                     const OscillatorBank& scopeSource)
    : conductor_(conductor),
      scope_(scopeSource),
      frequency_("Base Frequency", SynthConductor::kMinFrequency,
                 SynthConductor::kMaxFrequency),
      octaveUp_("oct", 0.0, 100.0, LabelledSlider::Style::kRotary),
      detuned_("det", 0.0, 100.0, LabelledSlider::Style::kRotary)
{
    startButton_.onClick = [this] { conductor_.Start(); };
    stopButton_.onClick = [this] { conductor_.Stop(); };
    muteButton_.onClick = [this] {
        conductor_.ToggleMute();
        updateMuteButton();
    };
    addAndMakeVisible(startButton_);
    addAndMakeVisible(stopButton_);
    addAndMakeVisible(muteButton_);
    updateMuteButton();

    addAndMakeVisible(scope_);

    // Combo box ids must be non-zero.
    for (const auto waveform : kAllWaveforms) {
        waveformBox_.addItem(WaveformName(waveform),
                             static_cast<int>(waveform) + 1);
    }
    waveformBox_.setSelectedId(static_cast<int>(conductor_.waveform()) + 1,
                               juce::dontSendNotification);
    waveformBox_.onChange = [this] {
        conductor_.set_waveform(
            WaveformFromIndex(waveformBox_.getSelectedId() - 1));
    };
    addAndMakeVisible(waveformBox_);

    frequency_.setValueFormatter(
        [](const float hz) { return juce::String(hz, 2) + " Hz"; });
    frequency_.setValue(conductor_.frequency());
    frequency_.setOnValueChanged([this](const float hz) {
        conductor_.set_frequency(hz);
        updateLayerReadouts();
    });
    addAndMakeVisible(frequency_);

    octaveUp_.setValue(conductor_.octave_up_multiplier());
    octaveUp_.setOnValueChanged([this](const float percent) {
        conductor_.set_octave_up_multiplier(percent);
    });
    addAndMakeVisible(octaveUp_);

    detuned_.setValue(conductor_.detuned_multiplier());
    detuned_.setOnValueChanged([this](const float percent) {
        conductor_.set_detuned_multiplier(percent);
    });
    addAndMakeVisible(detuned_);

    updateLayerReadouts();
}

void SynthView::paint(juce::Graphics& g)
{
    g.fillAll(SoundDeckLookAndFeel::kBackgroundColour);

    g.setColour(juce::Colours::white);
    g.setFont(juce::Font(18.0F, juce::Font::bold));
    g.drawText("Monophonic Synth", getLocalBounds().removeFromTop(36),
               juce::Justification::centred);
}

void SynthView::resized()
{
    auto bounds = getLocalBounds().reduced(16);
    bounds.removeFromTop(28);

    auto buttons = bounds.removeFromTop(36);
    const int buttonWidth = 96;
    const int spacing = 24;
    auto row = buttons.withSizeKeepingCentre(buttonWidth * 3 + spacing * 2,
                                             buttons.getHeight());
    startButton_.setBounds(row.removeFromLeft(buttonWidth));
    row.removeFromLeft(spacing);
    stopButton_.setBounds(row.removeFromLeft(buttonWidth));
    row.removeFromLeft(spacing);
    muteButton_.setBounds(row.removeFromLeft(buttonWidth));

    bounds.removeFromTop(16);
    scope_.setBounds(bounds.removeFromTop(200));

    bounds.removeFromTop(16);
    waveformBox_.setBounds(bounds.removeFromTop(28));

    bounds.removeFromTop(16);
    frequency_.setBounds(bounds.removeFromTop(48));

    bounds.removeFromTop(16);
    auto knobs = bounds.removeFromTop(120);
    const int knobWidth = 110;
    auto knobRow =
        knobs.withSizeKeepingCentre(knobWidth * 2 + 80, knobs.getHeight());
    octaveUp_.setBounds(knobRow.removeFromLeft(knobWidth));
    detuned_.setBounds(knobRow.removeFromRight(knobWidth));
}

void SynthView::visibilityChanged()
{
    if (isVisible()) {
        onAppear();
    } else {
        onDisappear();
    }
}

void SynthView::onAppear()
{
    std::string error;
    if (!conductor_.SetupAudio(&error)) {
        juce::Logger::writeToLog("[sounddeck] Synth audio setup failed: " +
                                 juce::String(error));
    }
}

void SynthView::onDisappear()
{
    conductor_.Stop();
}

void SynthView::refresh()
{
    if (isShowing()) {
        scope_.refresh();
    }
}

void SynthView::updateLayerReadouts()
{
    octaveUp_.setReadoutText(
        juce::String(conductor_.octave_up_frequency(), 2) + " Hz");
    detuned_.setReadoutText(
        juce::String(conductor_.detuned_frequency(), 2) + " Hz");
}

void SynthView::updateMuteButton()
{
    muteButton_.setButtonText(conductor_.is_muted() ? "Unmute" : "Mute");
}

}  // namespace sounddeck::ui
