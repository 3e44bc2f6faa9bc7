#pragma once

#include <array>
#include <string>

#include "core/AudioGraphs.h"
#include "core/Autopanner.h"
#include "core/NoiseGenerator.h"
#include "core/TickScheduler.h"

namespace sounddeck {

// A source paired with its panner. Writing volume sets the source
// amplitude, writing pan sets the panner; both are written once on
// construction so graph and state start out consistent.
class PanVolumeNode {
public:
    PanVolumeNode(AmplitudeNode& node, PanNode& panner, float volume = 0.0F,
                  float pan = 0.0F);

    void set_volume(float volume);
    [[nodiscard]] float volume() const noexcept { return volume_; }

    void set_pan(float pan);
    [[nodiscard]] float pan() const noexcept { return pan_; }

    [[nodiscard]] AmplitudeNode& node() noexcept { return *node_; }

private:
    AmplitudeNode* node_;
    PanNode* panner_;
    float volume_;
    float pan_;
};

// State behind the ambient noise screen.
//
// The tick scheduler must outlive the conductor; the destructor removes
// any autopan task still registered.
class NoiseConductor {
public:
    static constexpr float kDefaultReverbMix = 0.1F;
    static constexpr float kDefaultStereoFieldAmount = 1.0F;
    static constexpr float kDefaultAutopanRate = 1.0F;
    static constexpr float kMaxAutopanRate = 10.0F;

    NoiseConductor(NoiseGraph& graph, TickScheduler& scheduler);
    ~NoiseConductor();

    NoiseConductor(const NoiseConductor&) = delete;
    NoiseConductor& operator=(const NoiseConductor&) = delete;

    // Starting starts every source and the graph; stopping stops the
    // graph and turns autopan off. Returns false with a message when the
    // graph cannot start, in which case the state stays stopped.
    bool SetPlaying(bool playing, std::string* error = nullptr);
    bool TogglePlaying(std::string* error = nullptr)
    {
        return SetPlaying(!playing_, error);
    }
    [[nodiscard]] bool is_playing() const noexcept { return playing_; }

    // Enabling (re)starts the pan motion from phase 0.
    void set_autopan(bool enabled, float depth = 1.0F);
    void ToggleAutopan() { set_autopan(!is_autopan()); }
    [[nodiscard]] bool is_autopan() const noexcept { return autopanner_.is_enabled(); }

    void set_autopan_rate(float rate) { autopanner_.set_rate(rate); }
    [[nodiscard]] float autopan_rate() const noexcept { return autopanner_.rate(); }

    [[nodiscard]] const Autopanner& autopanner() const noexcept { return autopanner_; }

    void set_volume(NoiseColour colour, float volume);
    [[nodiscard]] float volume(NoiseColour colour) const;

    void set_pan(NoiseColour colour, float pan);
    [[nodiscard]] float pan(NoiseColour colour) const;

    // Width shown to the user: 1 - limiter amount.
    void set_stereo_width(float width);
    [[nodiscard]] float stereo_width() const noexcept
    {
        return 1.0F - stereoFieldAmount_;
    }
    [[nodiscard]] float stereo_field_amount() const noexcept
    {
        return stereoFieldAmount_;
    }

    void set_reverb_mix(float dryWet);
    [[nodiscard]] float reverb_mix() const noexcept { return reverbMix_; }

private:
    void OnAutopanTick();
    void UnregisterAutopanTask();

    [[nodiscard]] PanVolumeNode& channel(NoiseColour colour);
    [[nodiscard]] const PanVolumeNode& channel(NoiseColour colour) const;

    NoiseGraph& graph_;
    TickScheduler& scheduler_;

    std::array<PanVolumeNode, kNumNoiseColours> channels_;

    bool playing_{false};
    float stereoFieldAmount_{kDefaultStereoFieldAmount};
    float reverbMix_{kDefaultReverbMix};

    Autopanner autopanner_;
    TickScheduler::TaskId autopanTask_{TickScheduler::kInvalidTaskId};
};

}  // namespace sounddeck
