#include "core/NoiseConductor.h"

namespace sounddeck {

PanVolumeNode::PanVolumeNode(AmplitudeNode& node, PanNode& panner,
                             const float volume, const float pan)
    : node_(&node), panner_(&panner), volume_(volume), pan_(pan)
{
    node_->SetAmplitude(volume_);
    panner_->SetPan(pan_);
}

void PanVolumeNode::set_volume(const float volume)
{
    volume_ = volume;
    node_->SetAmplitude(volume_);
}

void PanVolumeNode::set_pan(const float pan)
{
    pan_ = pan;
    panner_->SetPan(pan_);
}

NoiseConductor::NoiseConductor(NoiseGraph& graph, TickScheduler& scheduler)
    : graph_(graph),
      scheduler_(scheduler),
      channels_{{
          PanVolumeNode(graph.source(NoiseColour::kPink),
                        graph.panner(NoiseColour::kPink)),
          PanVolumeNode(graph.source(NoiseColour::kWhite),
                        graph.panner(NoiseColour::kWhite)),
          PanVolumeNode(graph.source(NoiseColour::kBrown),
                        graph.panner(NoiseColour::kBrown)),
      }}
{
    autopanner_.set_rate(kDefaultAutopanRate);
    graph_.SetReverbMix(reverbMix_);
    graph_.SetStereoFieldAmount(stereoFieldAmount_);
}

NoiseConductor::~NoiseConductor()
{
    UnregisterAutopanTask();
}

bool NoiseConductor::SetPlaying(const bool playing, std::string* const error)
{
    if (playing) {
        for (auto& ch : channels_) {
            ch.node().Start();
        }
        if (!graph_.Start(error)) {
            playing_ = false;
            return false;
        }
        playing_ = true;
        return true;
    }

    graph_.Stop();
    playing_ = false;
    set_autopan(false);
    return true;
}

void NoiseConductor::set_autopan(const bool enabled, const float depth)
{
    UnregisterAutopanTask();

    if (!enabled) {
        autopanner_.Disable();
        return;
    }

    autopanner_.Enable(depth);
    autopanTask_ = scheduler_.Register(Autopanner::kTickIntervalSeconds,
                                       [this] { OnAutopanTick(); });
}

void NoiseConductor::OnAutopanTick()
{
    const auto pans = autopanner_.Tick();
    if (!pans.has_value()) {
        return;
    }
    for (std::size_t i = 0; i < channels_.size(); ++i) {
        channels_[i].set_pan((*pans)[i]);
    }
}

void NoiseConductor::UnregisterAutopanTask()
{
    if (autopanTask_ != TickScheduler::kInvalidTaskId) {
        scheduler_.Unregister(autopanTask_);
        autopanTask_ = TickScheduler::kInvalidTaskId;
    }
}

PanVolumeNode& NoiseConductor::channel(const NoiseColour colour)
{
    return channels_[static_cast<std::size_t>(colour)];
}

const PanVolumeNode& NoiseConductor::channel(const NoiseColour colour) const
{
    return channels_[static_cast<std::size_t>(colour)];
}

void NoiseConductor::set_volume(const NoiseColour colour, const float volume)
{
    channel(colour).set_volume(volume);
}

float NoiseConductor::volume(const NoiseColour colour) const
{
    return channel(colour).volume();
}

void NoiseConductor::set_pan(const NoiseColour colour, const float pan)
{
    channel(colour).set_pan(pan);
}

float NoiseConductor::pan(const NoiseColour colour) const
{
    return channel(colour).pan();
}

void NoiseConductor::set_stereo_width(const float width)
{
    stereoFieldAmount_ = 1.0F - width;
    graph_.SetStereoFieldAmount(stereoFieldAmount_);
}

void NoiseConductor::set_reverb_mix(const float dryWet)
{
    reverbMix_ = dryWet;
    graph_.SetReverbMix(reverbMix_);
}

}  // namespace sounddeck
