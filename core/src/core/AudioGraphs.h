#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/NoiseGenerator.h"
#include "core/Waveform.h"

namespace sounddeck {

// Abstract views of the engine-side audio graphs. Conductors only talk
// to these interfaces; the application implements them on top of JUCE
// and the tests with recording fakes. All methods are called from the
// UI thread.

// Capability shared by every sound source: a linear output amplitude
// plus start/stop.
class AmplitudeNode {
public:
    virtual ~AmplitudeNode() = default;

    virtual void SetAmplitude(float amplitude) = 0;
    [[nodiscard]] virtual float amplitude() const = 0;

    virtual void Start() = 0;
    virtual void Stop() = 0;
};

// Stereo placement of one source, pan in [-1,1].
class PanNode {
public:
    virtual ~PanNode() = default;

    virtual void SetPan(float pan) = 0;
    [[nodiscard]] virtual float pan() const = 0;
};

class OscillatorNode : public AmplitudeNode {
public:
    virtual void SetFrequency(float hz) = 0;
    [[nodiscard]] virtual float frequency() const = 0;

    virtual void SetWaveform(Waveform waveform) = 0;
};

// Layers of the mono synth, in mixer order.
enum class SynthLayer {
    kBase = 0,
    kOctaveUp,
    kDetuned,
};

inline constexpr int kNumSynthLayers = 3;

// Three oscillators -> mixer -> master fader -> reverb.
class SynthGraph {
public:
    virtual ~SynthGraph() = default;

    [[nodiscard]] virtual OscillatorNode& oscillator(SynthLayer layer) = 0;

    virtual void SetMixerVolume(float volume) = 0;

    // Immediate master fader change.
    virtual void SetMasterGain(float gain) = 0;

    // Linear master fader ramp towards `target` over `seconds`.
    virtual void RampMasterGain(float target, double seconds) = 0;

    // Reverb balance in [0,1], feedback in [0,1], cutoff in Hz.
    virtual void SetReverb(float balance, float feedback, float cutoffHz) = 0;

    // Brings the graph online. Returns false with a message when the
    // audio device is unavailable.
    virtual bool Start(std::string* error) = 0;
};

// Three noise sources, each behind its own panner -> mixer ->
// stereo-field limiter -> reverb.
class NoiseGraph {
public:
    virtual ~NoiseGraph() = default;

    [[nodiscard]] virtual AmplitudeNode& source(NoiseColour colour) = 0;
    [[nodiscard]] virtual PanNode& panner(NoiseColour colour) = 0;

    // Limiting amount in [0,1]; 1 is mono.
    virtual void SetStereoFieldAmount(float amount) = 0;

    virtual void SetReverbMix(float dryWet) = 0;

    virtual bool Start(std::string* error) = 0;
    virtual void Stop() = 0;
};

// A bank of file players, one fader per player, summed into a mixer.
class TrackGraph {
public:
    virtual ~TrackGraph() = default;

    virtual void RemoveAllTracks() = 0;

    // Decodes `path` and appends a player for it. Returns false with a
    // message when the file is missing or cannot be decoded.
    virtual bool AddTrack(const std::string& path, std::string* error) = 0;

    [[nodiscard]] virtual int track_count() const = 0;

    virtual void SetTrackGain(int index, float gain) = 0;
    [[nodiscard]] virtual float track_gain(int index) const = 0;

    [[nodiscard]] virtual double track_duration(int index) const = 0;

    // RMS overview of the decoded file (see WaveformOverview.h).
    [[nodiscard]] virtual std::vector<float> track_overview(int index) const = 0;

    // Engine clock used to schedule synchronized starts.
    [[nodiscard]] virtual double sample_rate() const = 0;
    [[nodiscard]] virtual std::int64_t current_sample_time() const = 0;

    // Starts the player at engine sample `atSampleTime`, reading from
    // `fromSeconds` into the file.
    virtual void PlayTrack(int index, double fromSeconds,
                           std::int64_t atSampleTime) = 0;
    virtual void PauseTrack(int index) = 0;
    virtual void StopTrack(int index) = 0;

    virtual bool Start(std::string* error) = 0;
};

}  // namespace sounddeck
