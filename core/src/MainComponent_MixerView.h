#pragma once

#include <memory>
#include <vector>

#include <juce_gui_basics/juce_gui_basics.h>

#include "MainComponent_LabelledSlider.h"

namespace sounddeck {
class MixerConductor;
}  // namespace sounddeck

namespace sounddeck::ui {

// One row of the mixer: name, mute button and volume slider on the
// left, the file's RMS overview on the right.
class TrackLane : public juce::Component {
public:
    // Left edge of the waveform area, also used to place the playhead.
    static constexpr int kWaveformStartX = 130;

    TrackLane(MixerConductor& conductor, int trackIndex, juce::Colour colour);
    ~TrackLane() override = default;

    void paint(juce::Graphics& g) override;
    void resized() override;

    // Re-reads the fader gain into the slider.
    void syncVolume();

private:
    MixerConductor& conductor_;
    const int trackIndex_;
    const juce::Colour colour_;

    juce::Label name_;
    juce::TextButton muteButton_{"M"};
    LabelledSlider volume_;

    std::vector<float> overview_;
    float overviewPeak_{0.0F};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TrackLane)
};

// "Multi-Track" screen: transport controls above the track lanes with
// a playhead drawn over the waveforms. Shows "Loading Tracks..." until
// the tracks are loaded; a failed load never leaves that state.
class MixerView : public juce::Component {
public:
    explicit MixerView(MixerConductor& conductor);
    ~MixerView() override = default;

    void paint(juce::Graphics& g) override;
    void paintOverChildren(juce::Graphics& g) override;
    void resized() override;
    void visibilityChanged() override;

    // Called from the UI timer.
    void refresh();

    static const juce::Colour kTrackColours[8];

private:
    void onAppear();
    void onDisappear();
    void buildLanes();
    void updateTransport();
    [[nodiscard]] juce::Rectangle<int> lanesArea() const;

    MixerConductor& conductor_;

    juce::TextButton playButton_;
    juce::TextButton stopButton_{"Stop"};
    juce::Label loadingLabel_;

    std::vector<std::unique_ptr<TrackLane>> lanes_;

    double lastPaintedProgress_{-1.0};
    bool lastPaintedPlaying_{false};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MixerView)
};

}  // namespace sounddeck::ui
