#pragma once

#include <memory>
#include <string>

#include <juce_gui_extra/juce_gui_extra.h>

#include "core/MixerConductor.h"
#include "core/NoiseConductor.h"
#include "core/SynthConductor.h"
#include "core/TickScheduler.h"
#include "core/TrackManifest.h"

class AudioEngine;

namespace sounddeck::ui {
class SynthView;
class NoiseView;
class MixerView;
}  // namespace sounddeck::ui

// Root component: one tab per screen plus an "audio unavailable"
// banner when the device could not be opened.
//
// Owns the conductors and the tick scheduler. A single juce::Timer on
// the message thread advances the scheduler (autopan, progress
// polling) and refreshes whatever the visible screen draws live.
class MainComponent : public juce::Component, public juce::Timer {
public:
    // UI refresh rate; also bounds the tick scheduler resolution, so it
    // must stay above the 16 ms autopan interval.
    static constexpr int kTimerHz = 120;

    MainComponent(AudioEngine& audioEngine, sounddeck::TrackManifest manifest,
                  std::string assetsDirectory);
    ~MainComponent() override;

    void paint(juce::Graphics& g) override;
    void resized() override;
    void timerCallback() override;

private:
    [[nodiscard]] static double nowSeconds();

    AudioEngine& audioEngine_;

    sounddeck::TickScheduler scheduler_;

    std::unique_ptr<sounddeck::SynthConductor> synthConductor_;
    std::unique_ptr<sounddeck::NoiseConductor> noiseConductor_;
    std::unique_ptr<sounddeck::MixerConductor> mixerConductor_;

    std::unique_ptr<sounddeck::ui::SynthView> synthView_;
    std::unique_ptr<sounddeck::ui::NoiseView> noiseView_;
    std::unique_ptr<sounddeck::ui::MixerView> mixerView_;

    // Declared after the views: the tabs only reference them.
    juce::TabbedComponent tabs_{juce::TabbedButtonBar::TabsAtBottom};
    juce::Label audioBanner_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainComponent)
};
