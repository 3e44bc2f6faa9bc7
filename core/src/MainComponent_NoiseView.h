#pragma once

#include <array>
#include <memory>

#include <juce_gui_basics/juce_gui_basics.h>

#include "MainComponent_LabelledSlider.h"
#include "core/NoiseGenerator.h"

namespace sounddeck {
class NoiseConductor;
}  // namespace sounddeck

namespace sounddeck::ui {

// "Ambient Noise" screen: play/autopan toggles, per-colour volume and
// pan, then stereo width, reverb and autopan rate.
class NoiseView : public juce::Component {
public:
    explicit NoiseView(NoiseConductor& conductor);
    ~NoiseView() override = default;

    void paint(juce::Graphics& g) override;
    void resized() override;

    // Called from the UI timer. Mirrors autopan motion into the pan
    // sliders.
    void refresh();

private:
    struct ColourControls {
        std::unique_ptr<LabelledSlider> volume;
        std::unique_ptr<LabelledSlider> pan;
    };

    void updateButtons();

    NoiseConductor& conductor_;

    juce::TextButton playButton_;
    juce::TextButton autopanButton_;

    juce::GroupComponent noiseGroup_{"noise", "Noise Controls"};
    std::array<ColourControls, kNumNoiseColours> colourControls_;

    juce::GroupComponent fieldGroup_;
    LabelledSlider stereoWidth_;
    LabelledSlider reverb_;
    LabelledSlider autopanRate_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(NoiseView)
};

}  // namespace sounddeck::ui
