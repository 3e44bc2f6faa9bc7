#pragma once

#include <functional>

#include <juce_gui_basics/juce_gui_basics.h>

namespace sounddeck::ui {

// Title, value readout and slider stacked in one component. Used by
// every screen for continuous parameters.
//
// Linear sliders lay out as a title/value row above a horizontal bar;
// rotary sliders draw a knob with the title inside it and the readout
// below. Values reported via callbacks are in the slider's own range.
class LabelledSlider : public juce::Component {
public:
    enum class Style {
        kLinear,
        kRotary,
    };

    LabelledSlider(const juce::String& title, double minimum, double maximum,
                   Style style = Style::kLinear);
    ~LabelledSlider() override = default;

    void resized() override;

    // Does not notify by default: used to mirror external state changes.
    void setValue(float value, bool notify = false);
    [[nodiscard]] float value() const noexcept;

    void setOnValueChanged(std::function<void(float)> callback);

    // Readout formatting; the default prints two decimals.
    void setValueFormatter(std::function<juce::String(float)> formatter);

    // Overrides the readout with arbitrary text (for readouts that show a
    // derived quantity instead of the slider value).
    void setReadoutText(const juce::String& text);

private:
    void refreshReadout();

    Style style_;
    juce::Label title_;
    juce::Label readout_;
    juce::Slider slider_;

    bool hasCustomReadout_{false};
    std::function<void(float)> onValueChanged_;
    std::function<juce::String(float)> formatter_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LabelledSlider)
};

}  // namespace sounddeck::ui
