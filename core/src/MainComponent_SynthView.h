#pragma once

#include <vector>

#include <juce_gui_basics/juce_gui_basics.h>

#include "MainComponent_LabelledSlider.h"

namespace sounddeck {
class SynthConductor;
}  // namespace sounddeck

class OscillatorBank;

namespace sounddeck::ui {

// Oscilloscope of the synth mixer output.
class ScopeDisplay : public juce::Component {
public:
    static constexpr int kNumPoints = 256;
    static constexpr double kWindowSeconds = 0.05;

    explicit ScopeDisplay(const OscillatorBank& source);

    void paint(juce::Graphics& g) override;

    // Pulls a fresh snapshot and repaints.
    void refresh();

private:
    const OscillatorBank& source_;
    std::vector<float> points_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ScopeDisplay)
};

// "Mono Synth" screen.
class SynthView : public juce::Component {
public:
    SynthView(SynthConductor& conductor, const OscillatorBank& scopeSource);
    ~SynthView() override = default;

    void paint(juce::Graphics& g) override;
    void resized() override;
    void visibilityChanged() override;

    // Called from the UI timer.
    void refresh();

private:
    void onAppear();
    void onDisappear();
    void updateLayerReadouts();
    void updateMuteButton();

    SynthConductor& conductor_;

    juce::TextButton startButton_{"Start"};
    juce::TextButton stopButton_{"Stop"};
    juce::TextButton muteButton_;

    ScopeDisplay scope_;
    juce::ComboBox waveformBox_;

    LabelledSlider frequency_;
    LabelledSlider octaveUp_;
    LabelledSlider detuned_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SynthView)
};

}  // namespace sounddeck::ui
