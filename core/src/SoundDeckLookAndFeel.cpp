#include "SoundDeckLookAndFeel.h"

#include <algorithm>

const juce::Colour SoundDeckLookAndFeel::kAccentColour{0xff3399ff};
const juce::Colour SoundDeckLookAndFeel::kBackgroundColour{0xff10141c};

SoundDeckLookAndFeel::SoundDeckLookAndFeel()
{
    setColour(juce::ResizableWindow::backgroundColourId, kBackgroundColour);
    setColour(juce::Slider::thumbColourId, kAccentColour);
    setColour(juce::Slider::trackColourId, kAccentColour.withAlpha(0.6F));
    setColour(juce::Slider::rotarySliderFillColourId, kAccentColour);
    setColour(juce::Slider::rotarySliderOutlineColourId,
              kAccentColour.withAlpha(0.3F));
    setColour(juce::TextButton::buttonColourId,
              kBackgroundColour.brighter(0.25F));
    setColour(juce::TextButton::buttonOnColourId, kAccentColour);
    setColour(juce::GroupComponent::outlineColourId,
              juce::Colours::white.withAlpha(0.2F));

    // Fontconfig resolves a well-known family from its caches.
    setDefaultSansSerifTypefaceName("DejaVu Sans");
}

void SoundDeckLookAndFeel::drawRotarySlider(
    juce::Graphics& g, const int x, const int y, const int width,
    const int height, const float sliderPosProportional,
    const float rotaryStartAngle, const float rotaryEndAngle,
    juce::Slider& slider)
{
    const auto bounds =
        juce::Rectangle<int>(x, y, width, height).toFloat().reduced(6.0F);
    const float radius = std::min(bounds.getWidth(), bounds.getHeight()) * 0.5F;
    const auto centre = bounds.getCentre();
    const float lineWidth = juce::jmax(3.0F, radius * 0.12F);
    const float arcRadius = radius - lineWidth * 0.5F;

    const float angle = rotaryStartAngle +
                        sliderPosProportional *
                            (rotaryEndAngle - rotaryStartAngle);

    juce::Path background;
    background.addCentredArc(centre.x, centre.y, arcRadius, arcRadius, 0.0F,
                             rotaryStartAngle, rotaryEndAngle, true);
    g.setColour(slider.findColour(juce::Slider::rotarySliderOutlineColourId));
    g.strokePath(background,
                 juce::PathStrokeType(lineWidth,
                                      juce::PathStrokeType::curved,
                                      juce::PathStrokeType::rounded));

    if (sliderPosProportional > 0.0F) {
        juce::Path value;
        value.addCentredArc(centre.x, centre.y, arcRadius, arcRadius, 0.0F,
                            rotaryStartAngle, angle, true);
        g.setColour(slider.findColour(juce::Slider::rotarySliderFillColourId));
        g.strokePath(value,
                     juce::PathStrokeType(lineWidth,
                                          juce::PathStrokeType::curved,
                                          juce::PathStrokeType::rounded));
    }
}
