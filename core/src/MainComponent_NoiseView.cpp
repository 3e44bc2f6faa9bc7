#include "MainComponent_NoiseView.h"

#include <string>

#include "SoundDeckLookAndFeel.h"
#include "core/NoiseConductor.h"

namespace sounddeck::ui {

NoiseView::NoiseView(NoiseConductor& conductor)
    : conductor_(conductor),
      stereoWidth_("Stereo Width", 0.0, 1.0),
      reverb_("Reverb", 0.0, 1.0),
      autopanRate_("Autopan Rate", 0.0, NoiseConductor::kMaxAutopanRate)
{
    playButton_.onClick = [this] {
        std::string error;
        if (!conductor_.TogglePlaying(&error)) {
            juce::Logger::writeToLog("[sounddeck] Noise playback failed: " +
                                     juce::String(error));
        }
        updateButtons();
    };
    autopanButton_.onClick = [this] {
        conductor_.ToggleAutopan();
        updateButtons();
    };
    addAndMakeVisible(playButton_);
    addAndMakeVisible(autopanButton_);
    updateButtons();

    addAndMakeVisible(noiseGroup_);
    for (const auto colour : kAllNoiseColours) {
        auto& controls = colourControls_[static_cast<std::size_t>(colour)];
        const juce::String name(NoiseColourName(colour));

        controls.volume =
            std::make_unique<LabelledSlider>(name + " Noise", 0.0, 1.0);
        controls.volume->setValue(conductor_.volume(colour));
        controls.volume->setOnValueChanged([this, colour](const float v) {
            conductor_.set_volume(colour, v);
        });
        addAndMakeVisible(*controls.volume);

        controls.pan = std::make_unique<LabelledSlider>(name + " Pan", -1.0, 1.0);
        controls.pan->setValue(conductor_.pan(colour));
        controls.pan->setOnValueChanged([this, colour](const float p) {
            conductor_.set_pan(colour, p);
        });
        addAndMakeVisible(*controls.pan);
    }

    addAndMakeVisible(fieldGroup_);

    stereoWidth_.setValue(conductor_.stereo_width());
    stereoWidth_.setOnValueChanged(
        [this](const float w) { conductor_.set_stereo_width(w); });
    addAndMakeVisible(stereoWidth_);

    reverb_.setValue(conductor_.reverb_mix());
    reverb_.setOnValueChanged(
        [this](const float mix) { conductor_.set_reverb_mix(mix); });
    addAndMakeVisible(reverb_);

    autopanRate_.setValue(conductor_.autopan_rate());
    autopanRate_.setOnValueChanged(
        [this](const float rate) { conductor_.set_autopan_rate(rate); });
    addAndMakeVisible(autopanRate_);
}

void NoiseView::paint(juce::Graphics& g)
{
    g.fillAll(SoundDeckLookAndFeel::kBackgroundColour);
}

void NoiseView::resized()
{
    auto bounds = getLocalBounds().reduced(16);

    auto buttons = bounds.removeFromTop(40);
    auto row = buttons.withSizeKeepingCentre(2 * 100 + 16, buttons.getHeight());
    playButton_.setBounds(row.removeFromLeft(100));
    autopanButton_.setBounds(row.removeFromRight(100));

    bounds.removeFromTop(12);

    constexpr int kSliderHeight = 44;
    constexpr int kGroupPadding = 24;

    auto noiseArea = bounds.removeFromTop(
        kGroupPadding + 2 * kNumNoiseColours * kSliderHeight + 8);
    noiseGroup_.setBounds(noiseArea);
    auto inner = noiseArea.reduced(12, 0).withTrimmedTop(kGroupPadding);
    for (auto& controls : colourControls_) {
        controls.volume->setBounds(inner.removeFromTop(kSliderHeight));
        controls.pan->setBounds(inner.removeFromTop(kSliderHeight));
    }

    bounds.removeFromTop(12);

    auto fieldArea = bounds.removeFromTop(kGroupPadding + 3 * kSliderHeight);
    fieldGroup_.setBounds(fieldArea);
    auto fieldInner = fieldArea.reduced(12, 0).withTrimmedTop(kGroupPadding / 2);
    stereoWidth_.setBounds(fieldInner.removeFromTop(kSliderHeight));
    reverb_.setBounds(fieldInner.removeFromTop(kSliderHeight));
    autopanRate_.setBounds(fieldInner.removeFromTop(kSliderHeight));
}

void NoiseView::refresh()
{
    if (!isShowing() || !conductor_.is_autopan()) {
        return;
    }

    for (const auto colour : kAllNoiseColours) {
        colourControls_[static_cast<std::size_t>(colour)].pan->setValue(
            conductor_.pan(colour));
    }
}

void NoiseView::updateButtons()
{
    playButton_.setButtonText(conductor_.is_playing() ? "Stop" : "Play");
    autopanButton_.setButtonText(conductor_.is_autopan() ? "Autopan On"
                                                         : "Autopan Off");
    autopanButton_.setToggleState(conductor_.is_autopan(),
                                  juce::dontSendNotification);
}

}  // namespace sounddeck::ui
