#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "EngineConfiguration.hpp"
#include "../input/InputEvents.hpp"
#include "../mixer/TrackMixer.hpp"
#include "../model/Arrangement.hpp"
#include "../processor/ProcessorRegistry.hpp"
#include "../sequencer/NoteScheduler.hpp"

namespace cadenza {

    struct TrackConfigurationError {
        cadenza_track_index_t trackIndex{-1};
        StatusCode status{StatusCode::OK};
        std::string error{};
    };

    struct ArrangementLoadResult {
        // False only when nothing could be loaded. Tracks that failed configuration are listed
        // in trackErrors and stay silent; the rest of the arrangement plays.
        bool success{false};
        StatusCode status{StatusCode::OK};
        std::string error{};
        std::vector<TrackConfigurationError> trackErrors{};
        size_t activeTrackCount{0};
    };

    struct EngineStatistics {
        uint64_t renderFailures{0};
        uint64_t timingViolations{0};
        uint64_t voiceEvictions{0};
        uint64_t droppedInputEvents{0};
        uint64_t underruns{0};
        uint64_t sourceRenderCalls{0};
        uint64_t blocksRendered{0};
    };

    // The real-time sound generation core.
    //
    // Two contexts use it. The control/input side loads arrangements, sends transport commands
    // and pushes live events; none of these touch render state, they only publish a snapshot
    // or enqueue a command. The render side calls processAudio() once per output block, which
    // drains the queue, advances the scheduler, streams voices and mixes.
    //
    // Observers (playhead, transport state, voice counts, statistics, levels) are published
    // at the end of each block and are safe to read from any thread.
    class RenderEngine {
    protected:
        RenderEngine() = default;

    public:
        static std::unique_ptr<RenderEngine> create(const EngineConfiguration& configuration,
                                                    std::shared_ptr<ProcessorRegistry> registry);

        virtual ~RenderEngine() = default;

        virtual const EngineConfiguration& configuration() const = 0;
        virtual ProcessorRegistry& registry() = 0;

        // Configures every track off the render thread and publishes the result as the next
        // snapshot. The render thread switches to it at its next block boundary.
        virtual ArrangementLoadResult loadArrangement(std::shared_ptr<const ArrangementData> arrangement) = 0;
        // Publishes an empty snapshot; the render thread discards every voice and queued event when it adopts it.
        virtual void closeArrangement() = 0;
        // Frees snapshots the render thread has let go of. Called from the control thread.
        virtual size_t collectGarbage() = 0;

        // Returns false when the queue was full and the event was dropped.
        virtual bool enqueueLiveEvent(const LiveNoteEvent& event) = 0;
        // Decodes note-on/off UMPs and enqueues them. Returns the number of events accepted.
        virtual size_t enqueueUmp(const uint32_t* ump, size_t sizeInBytes, cadenza_timestamp_t timestamp) = 0;

        virtual bool play(cadenza_tick_t fromTick = 0) = 0;
        virtual bool stop() = 0;
        virtual bool seek(cadenza_tick_t tick) = 0;
        virtual bool setLoopRegion(cadenza_tick_t startTick, std::optional<cadenza_tick_t> endTick) = 0;
        virtual bool setLoopEnabled(bool enabled) = 0;
        virtual bool setMixerState(cadenza_track_index_t trackIndex, const MixerState& state) = 0;

        // Renders `frameCount` frames into `outputs` (one non-interleaved buffer per channel).
        // Always fills the buffers, even when processors fail or the deadline is missed.
        virtual StatusCode processAudio(float** outputs, uint32_t channelCount, int32_t frameCount) = 0;

        virtual double playheadTick() const = 0;
        virtual TransportState transportState() const = 0;
        virtual size_t activeVoiceCount() const = 0;
        virtual size_t activeVoiceCount(cadenza_track_index_t trackIndex) const = 0;
        virtual TrackLevel trackLevel(cadenza_track_index_t trackIndex) const = 0;
        virtual EngineStatistics statistics() const = 0;

        uint64_t renderFailureCount() const { return statistics().renderFailures; }
        uint64_t timingViolationCount() const { return statistics().timingViolations; }
        uint64_t voiceEvictionCount() const { return statistics().voiceEvictions; }
        uint64_t droppedInputEventCount() const { return statistics().droppedInputEvents; }
        uint64_t underrunCount() const { return statistics().underruns; }
    };

}
