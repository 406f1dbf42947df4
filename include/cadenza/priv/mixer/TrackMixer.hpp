#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <vector>

#include "../common.hpp"
#include "../model/Arrangement.hpp"
#include "../processor/ProcessorRegistry.hpp"

namespace cadenza {

    enum class ClipMode {
        Hard, // clamp to [-1, 1]
        Soft  // tanh
    };

    const char* clipModeName(ClipMode mode);

    struct TrackLevel {
        float peak{0};
        float rms{0};
    };

    double decibelsToGain(double db);

    // Per-track mono buses, effect chains, and the stereo (or mono) master.
    // Owned by the render thread; only the meters are read from elsewhere.
    class TrackMixer {
        struct TrackMeter {
            std::atomic<float> peak{0};
            std::atomic<float> rms{0};
        };

        uint32_t max_block_frames;
        ClipMode clip_mode;
        double master_gain;
        const std::vector<ConfiguredTrack>* tracks_{nullptr};
        std::vector<std::vector<float>> track_buffers_;
        std::vector<uint8_t> track_signal_;
        std::vector<float> effect_scratch_;
        std::array<MixerState, kMaxTracks> mixer_states_{};
        std::array<int64_t, kMaxTracks> tail_remaining_{};
        // set while a track's chain keeps failing; the error is logged once per failure run
        std::array<uint8_t, kMaxTracks> chain_failing_{};
        std::array<TrackMeter, kMaxTracks> meters_{};
        size_t track_count_{0};
        uint64_t effect_failures_{0};

        bool runEffectChain(size_t trackIndex, int32_t frames, const RenderContext& context);
        bool chainTail(size_t trackIndex, const RenderContext& context, int64_t& tail);
        bool markChainFailed(size_t trackIndex);

    public:
        TrackMixer(uint32_t maxBlockFrames, ClipMode clipMode, double masterVolumeDb);

        // Binds the configured effect chains of a new snapshot. Tail counters restart.
        void bindTracks(const std::vector<ConfiguredTrack>* tracks, size_t trackCount);
        size_t trackCount() const { return track_count_; }

        const MixerState& mixerState(cadenza_track_index_t trackIndex) const { return mixer_states_[trackIndex]; }
        bool mixerState(cadenza_track_index_t trackIndex, const MixerState& state);

        void masterVolumeDb(double db) { master_gain = decibelsToGain(db); }
        void clipMode(ClipMode mode) { clip_mode = mode; }

        // Clears the track buses for a block of `frames` frames.
        void beginBlock(int32_t frames);
        std::vector<std::vector<float>>& trackBuffers() { return track_buffers_; }
        std::vector<uint8_t>& trackSignal() { return track_signal_; }

        // Runs every track's effect chain while it has input or an effect tail is still ringing.
        void processEffects(int32_t frames, const RenderContext& context);
        // Applies gain, pan, mute and solo, sums into `outputs` (overwriting), then master volume and clipping.
        void mix(float** outputs, uint32_t channelCount, uint32_t outputOffset, int32_t frames);

        // Clears effect state and tails. Called on stop, seek and loop jumps.
        // An effect whose reset() throws is counted as a failure and the remaining effects are still reset.
        void resetEffects();

        TrackLevel level(cadenza_track_index_t trackIndex) const;
        uint64_t effectFailures() const { return effect_failures_; }
        // True from a chain's first failure until it processes a block successfully again.
        bool chainFailing(cadenza_track_index_t trackIndex) const { return chain_failing_[trackIndex] != 0; }
    };

}
