#pragma once

#include <cstdint>
#include <vector>

#include "LiveVoice.hpp"
#include "../processor/ProcessorRegistry.hpp"

namespace cadenza {

    // Which voices get their buffers extended first when more of them need a chunk than
    // the per-block budget allows.
    enum class ExtensionPolicy {
        // Fewest buffered samples first; ties go to the older voice.
        MostUrgentFirst,
        // Pool order, resuming after the last voice served in the previous block.
        RoundRobin
    };

    const char* extensionPolicyName(ExtensionPolicy policy);

    struct VoiceEngineSettings {
        double sampleRate{48000.0};
        int32_t maxBlockFrames{1024};
        int32_t maxVoices{64};
        double preRenderSeconds{2.0};
        double extensionChunkSeconds{1.0};
        // A sustaining voice asks for a chunk once fewer than this many seconds remain buffered
        // beyond the current block. 0 means only when the block would run out.
        double extensionLeadSeconds{0.5};
        // Chunk renders allowed per block; 0 or less removes the limit.
        int32_t extensionBudgetPerBlock{8};
        ExtensionPolicy extensionPolicy{ExtensionPolicy::MostUrgentFirst};
        double releaseSeconds{0.3};
        double retriggerReleaseSeconds{0.05};
    };

    struct VoiceEngineStatistics {
        uint64_t sourceRenderCalls{0};
        uint64_t extensionRenders{0};
        // Blocks in which a sustaining voice had fewer samples than requested and was padded with silence.
        uint64_t underruns{0};
        uint64_t renderFailures{0};
        uint64_t evictions{0};
    };

    // Owns every sounding voice, scheduled or live. Render-thread only.
    //
    // A note-on renders the pre-render window right away; afterwards the voice streams from its
    // buffer and is extended chunk by chunk under the per-block budget. A note-off applies an
    // exponential release to the samples that are already rendered and truncates the voice there,
    // so a release never makes a voice longer.
    class VoiceEngine {
        VoiceEngineSettings settings_;
        std::vector<LiveVoice> voices_;
        std::vector<int32_t> candidates_;
        const std::vector<ConfiguredTrack>* tracks_{nullptr};
        uint64_t next_voice_id_{1};
        size_t round_robin_cursor_{0};
        int64_t pre_render_frames_;
        int64_t chunk_frames_;
        int64_t lead_frames_;
        int64_t release_frames_;
        int64_t retrigger_release_frames_;
        VoiceEngineStatistics stats_{};

        const ConfiguredProcessor* sourceOf(cadenza_track_index_t trackIndex) const;
        LiveVoice& allocate();
        bool renderChunk(LiveVoice& voice, int64_t frames, const RenderContext& context);
        void fail(LiveVoice& voice, const char* reason);

    public:
        explicit VoiceEngine(const VoiceEngineSettings& settings);

        const VoiceEngineSettings& settings() const { return settings_; }
        const VoiceEngineStatistics& statistics() const { return stats_; }

        // The configured tracks of the current snapshot. The vector must outlive its use here.
        void bindTracks(const std::vector<ConfiguredTrack>* tracks) { tracks_ = tracks; }

        // Starts a voice `frameOffset` frames into the current block. Returns nullptr when the
        // track has no usable source or the source failed on its first window.
        LiveVoice* noteOn(cadenza_track_index_t trackIndex, int32_t noteIndex, int32_t pitch, int32_t velocity,
                          double durationSeconds, int32_t frameOffset, const RenderContext& context);
        // Releases the voice playing that note. Live voices (noteIndex -1) match on track and pitch.
        size_t noteOff(cadenza_track_index_t trackIndex, int32_t noteIndex, int32_t pitch, int32_t frameOffset);
        void release(LiveVoice& voice, int32_t frameOffset, int64_t releaseFrames);

        // Stops every voice at `frameOffset` of the current block without a release tail.
        void cutAll(int32_t frameOffset);
        // Voices on tracks at or beyond `trackCount` are returned to the pool.
        void clearTracksFrom(cadenza_track_index_t trackCount);
        void clearAll();

        // Extends buffers that would run low during the next `frames` frames, within the budget.
        void extend(int32_t frames, const RenderContext& context);
        // Copies the next `frames` samples of every voice, scaled by velocity, into its track buffer.
        // trackSignal[i] becomes non-zero when track i received samples.
        void render(int32_t frames, std::vector<std::vector<float>>& trackBuffers, std::vector<uint8_t>& trackSignal);

        size_t activeVoiceCount() const;
        size_t activeVoiceCount(cadenza_track_index_t trackIndex) const;

        template <typename F>
        void forEachVoice(F&& f) const {
            for (auto& v : voices_)
                if (v.active())
                    f(v);
        }
    };

}
