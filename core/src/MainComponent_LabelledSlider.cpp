#include "MainComponent_LabelledSlider.h"

#include <algorithm>
#include <utility>

namespace sounddeck::ui {

LabelledSlider::LabelledSlider(const juce::String& title,
                               const double minimum, const double maximum,
                               const Style style)
    : style_(style)
{
    title_.setText(title, juce::dontSendNotification);
    title_.setJustificationType(style_ == Style::kRotary
                                    ? juce::Justification::centred
                                    : juce::Justification::centredLeft);
    title_.setInterceptsMouseClicks(false, false);
    addAndMakeVisible(title_);

    readout_.setJustificationType(style_ == Style::kRotary
                                      ? juce::Justification::centred
                                      : juce::Justification::centredRight);
    readout_.setFont(juce::Font(13.0F, juce::Font::bold));
    addAndMakeVisible(readout_);

    slider_.setSliderStyle(style_ == Style::kRotary
                               ? juce::Slider::RotaryHorizontalVerticalDrag
                               : juce::Slider::LinearHorizontal);
    slider_.setTextBoxStyle(juce::Slider::NoTextBox, true, 0, 0);
    slider_.setRange(minimum, maximum, 0.0);
    slider_.onValueChange = [this] {
        refreshReadout();
        if (onValueChanged_) {
            onValueChanged_(value());
        }
    };
    addAndMakeVisible(slider_);

    // The rotary title sits on top of the knob.
    if (style_ == Style::kRotary) {
        title_.toFront(false);
    }

    refreshReadout();
}

void LabelledSlider::resized()
{
    auto bounds = getLocalBounds();

    if (style_ == Style::kRotary) {
        const auto readoutArea = bounds.removeFromBottom(20);
        readout_.setBounds(readoutArea);
        const int side = std::min(bounds.getWidth(), bounds.getHeight());
        const auto knob = bounds.withSizeKeepingCentre(side, side);
        slider_.setBounds(knob);
        title_.setBounds(knob.withSizeKeepingCentre(side, 20));
        return;
    }

    auto header = bounds.removeFromTop(20);
    readout_.setBounds(header.removeFromRight(90));
    title_.setBounds(header);
    slider_.setBounds(bounds);
}

void LabelledSlider::setValue(const float value, const bool notify)
{
    slider_.setValue(static_cast<double>(value),
                     notify ? juce::sendNotificationSync
                            : juce::dontSendNotification);
    refreshReadout();
}

float LabelledSlider::value() const noexcept
{
    return static_cast<float>(slider_.getValue());
}

void LabelledSlider::setOnValueChanged(std::function<void(float)> callback)
{
    onValueChanged_ = std::move(callback);
}

void LabelledSlider::setValueFormatter(
    std::function<juce::String(float)> formatter)
{
    formatter_ = std::move(formatter);
    refreshReadout();
}

void LabelledSlider::setReadoutText(const juce::String& text)
{
    hasCustomReadout_ = true;
    readout_.setText(text, juce::dontSendNotification);
}

void LabelledSlider::refreshReadout()
{
    if (hasCustomReadout_) {
        return;
    }

    const float v = value();
    readout_.setText(formatter_ ? formatter_(v) : juce::String(v, 2),
                     juce::dontSendNotification);
}

}  // namespace sounddeck::ui
