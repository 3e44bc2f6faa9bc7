#pragma once

#include <juce_gui_extra/juce_gui_extra.h>

// Dark LookAndFeel shared by the three screens. Rotary sliders are
// drawn as an open arc knob.
class SoundDeckLookAndFeel : public juce::LookAndFeel_V4 {
public:
    SoundDeckLookAndFeel();

    void drawRotarySlider(juce::Graphics& g, int x, int y, int width,
                          int height, float sliderPosProportional,
                          float rotaryStartAngle, float rotaryEndAngle,
                          juce::Slider& slider) override;

    static const juce::Colour kAccentColour;
    static const juce::Colour kBackgroundColour;
};
