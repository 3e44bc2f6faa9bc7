#include "MainComponent_MixerView.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "SoundDeckLookAndFeel.h"
#include "core/MixerConductor.h"
#include "core/WaveformOverview.h"

namespace sounddeck::ui {

namespace {
constexpr int kTransportHeight = 72;
constexpr int kLaneHeight = 76;
}  // namespace

const juce::Colour MixerView::kTrackColours[8] = {
    juce::Colour::fromFloatRGBA(0.2F, 0.6F, 1.0F, 1.0F),  // blue
    juce::Colour::fromFloatRGBA(0.9F, 0.3F, 0.3F, 1.0F),  // red
    juce::Colour::fromFloatRGBA(0.3F, 0.8F, 0.4F, 1.0F),  // green
    juce::Colour::fromFloatRGBA(0.9F, 0.6F, 0.2F, 1.0F),  // orange
    juce::Colour::fromFloatRGBA(0.7F, 0.3F, 0.9F, 1.0F),  // purple
    juce::Colour::fromFloatRGBA(0.9F, 0.8F, 0.2F, 1.0F),  // yellow
    juce::Colour::fromFloatRGBA(0.3F, 0.8F, 0.8F, 1.0F),  // cyan
    juce::Colour::fromFloatRGBA(0.9F, 0.4F, 0.6F, 1.0F),  // pink
};

TrackLane::TrackLane(MixerConductor& conductor, const int trackIndex,
                     const juce::Colour colour)
    : conductor_(conductor),
      trackIndex_(trackIndex),
      colour_(colour),
      volume_("", 0.0, 1.0)
{
    const auto& tracks = conductor_.tracks();
    name_.setText(juce::String(tracks[static_cast<std::size_t>(trackIndex_)].name),
                  juce::dontSendNotification);
    name_.setColour(juce::Label::textColourId, colour_);
    name_.setFont(juce::Font(12.0F, juce::Font::bold));
    addAndMakeVisible(name_);

    muteButton_.onClick = [this] {
        conductor_.ToggleMute(trackIndex_);
        syncVolume();
    };
    addAndMakeVisible(muteButton_);

    volume_.setValueFormatter([](const float v) {
        return juce::String(static_cast<int>(v * 100.0F)) + "%";
    });
    volume_.setOnValueChanged(
        [this](const float v) { conductor_.SetVolume(trackIndex_, v); });
    addAndMakeVisible(volume_);
    syncVolume();

    overview_ = conductor_.overview(trackIndex_);
    overviewPeak_ = OverviewPeak(overview_);
}

void TrackLane::syncVolume()
{
    volume_.setValue(conductor_.volume(trackIndex_));
}

void TrackLane::paint(juce::Graphics& g)
{
    const auto bounds = getLocalBounds().toFloat();
    g.setColour(colour_.withAlpha(0.2F));
    g.fillRect(bounds);

    g.setColour(colour_.withAlpha(0.5F));
    g.fillRect(bounds.withTop(bounds.getBottom() - 1.0F));

    auto wave = bounds.withTrimmedLeft(static_cast<float>(kWaveformStartX))
                    .reduced(0.0F, 8.0F);
    const float midY = wave.getCentreY();

    g.setColour(colour_.withAlpha(0.5F));
    g.drawHorizontalLine(static_cast<int>(midY), wave.getX(), wave.getRight());

    if (overview_.empty() || overviewPeak_ <= 0.0F || wave.getWidth() <= 0.0F) {
        return;
    }

    // Mirrored envelope, one column per pixel.
    const int columns = static_cast<int>(wave.getWidth());
    const float halfHeight = wave.getHeight() * 0.5F;
    juce::Path envelope;
    for (int x = 0; x < columns; ++x) {
        const auto index = static_cast<std::size_t>(
            static_cast<double>(x) / columns *
            static_cast<double>(overview_.size()));
        const float level =
            overview_[std::min(index, overview_.size() - 1)] / overviewPeak_;
        const float px = wave.getX() + static_cast<float>(x);
        const float h = level * halfHeight;
        envelope.addRectangle(px, midY - h, 1.0F, juce::jmax(1.0F, 2.0F * h));
    }

    g.setColour(colour_);
    g.fillPath(envelope);
}

void TrackLane::resized()
{
    auto left = getLocalBounds().removeFromLeft(kWaveformStartX).reduced(8, 6);
    name_.setBounds(left.removeFromTop(18));
    auto controls = left;
    muteButton_.setBounds(controls.removeFromLeft(24).withSizeKeepingCentre(24, 24));
    controls.removeFromLeft(6);
    volume_.setBounds(controls);
}

MixerView::MixerView(MixerConductor& conductor) : conductor_(conductor)
{
    playButton_.onClick = [this] {
        conductor_.TogglePlayback();
        updateTransport();
    };
    stopButton_.onClick = [this] {
        conductor_.Stop();
        updateTransport();
        repaint();
    };
    addAndMakeVisible(playButton_);
    addAndMakeVisible(stopButton_);

    loadingLabel_.setText("Loading Tracks...", juce::dontSendNotification);
    loadingLabel_.setJustificationType(juce::Justification::centred);
    addAndMakeVisible(loadingLabel_);

    updateTransport();
}

void MixerView::paint(juce::Graphics& g)
{
    g.fillAll(SoundDeckLookAndFeel::kBackgroundColour);

    g.setColour(juce::Colours::white);
    g.setFont(juce::Font(18.0F, juce::Font::bold));
    g.drawText("Multi-track Mixer", getLocalBounds().removeFromTop(28),
               juce::Justification::centred);
}

void MixerView::paintOverChildren(juce::Graphics& g)
{
    if (lanes_.empty()) {
        return;
    }

    const auto area = lanesArea().withHeight(
        static_cast<int>(lanes_.size()) * kLaneHeight);
    const auto waveStart = static_cast<float>(area.getX() +
                                              TrackLane::kWaveformStartX);
    const auto waveWidth =
        static_cast<float>(area.getWidth() - TrackLane::kWaveformStartX);
    const float x =
        waveStart + waveWidth * static_cast<float>(conductor_.progress());

    g.setColour(conductor_.is_playing() ? juce::Colours::red
                                        : juce::Colours::red.withAlpha(0.4F));
    g.fillRect(juce::Rectangle<float>(x - 1.0F, static_cast<float>(area.getY()),
                                      2.0F,
                                      static_cast<float>(area.getHeight())));
}

juce::Rectangle<int> MixerView::lanesArea() const
{
    return getLocalBounds().withTrimmedTop(kTransportHeight);
}

void MixerView::resized()
{
    auto bounds = getLocalBounds();
    auto transport = bounds.removeFromTop(kTransportHeight).withTrimmedTop(28);
    auto row = transport.withSizeKeepingCentre(2 * 90 + 30, 36);
    playButton_.setBounds(row.removeFromLeft(90));
    stopButton_.setBounds(row.removeFromRight(90));

    loadingLabel_.setBounds(bounds);

    auto lanes = lanesArea();
    for (auto& lane : lanes_) {
        lane->setBounds(lanes.removeFromTop(kLaneHeight));
    }
}

void MixerView::visibilityChanged()
{
    if (isVisible()) {
        onAppear();
    } else {
        onDisappear();
    }
}

void MixerView::onAppear()
{
    const bool wasLoaded = conductor_.is_loaded();

    std::string error;
    if (!conductor_.OnAppear(&error)) {
        // Tracks that decoded fine but could not reach the device still
        // count as loaded; the screen stays usable without sound.
        const juce::String what = conductor_.is_loaded()
                                      ? "Track engine start failed: "
                                      : "Track loading failed: ";
        juce::Logger::writeToLog("[sounddeck] " + what + juce::String(error));
    }

    if (!wasLoaded && conductor_.is_loaded()) {
        juce::Logger::writeToLog("[sounddeck] Loaded " +
                                 juce::String(conductor_.track_count()) +
                                 " tracks.");
        buildLanes();
    }

    updateTransport();
}

void MixerView::onDisappear()
{
    conductor_.OnDisappear();
}

void MixerView::buildLanes()
{
    lanes_.clear();
    for (int i = 0; i < conductor_.track_count(); ++i) {
        auto lane = std::make_unique<TrackLane>(
            conductor_, i, kTrackColours[i % 8]);
        addAndMakeVisible(*lane);
        lanes_.push_back(std::move(lane));
    }
    resized();
}

void MixerView::updateTransport()
{
    const bool loaded = conductor_.is_loaded();
    playButton_.setButtonText(conductor_.is_playing() ? "Pause" : "Play");
    playButton_.setEnabled(loaded);
    stopButton_.setEnabled(loaded);
    loadingLabel_.setVisible(!loaded);
}

void MixerView::refresh()
{
    if (!isShowing()) {
        return;
    }

    const double progress = conductor_.progress();
    const bool playing = conductor_.is_playing();
    if (playing != lastPaintedPlaying_) {
        updateTransport();
    }
    if (std::abs(progress - lastPaintedProgress_) > 1.0e-4 ||
        playing != lastPaintedPlaying_) {
        lastPaintedProgress_ = progress;
        lastPaintedPlaying_ = playing;
        repaint(lanesArea());
    }
}

}  // namespace sounddeck::ui
