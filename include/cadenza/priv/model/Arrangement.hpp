#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "../common.hpp"
#include "../processor/ProcessorMetadata.hpp"

namespace cadenza {

    struct TempoSegment {
        cadenza_tick_t startTick{0};
        double bpm{kDefaultBpm};
        int32_t numerator{4};
        int32_t denominator{4};
    };

    // Edits replace notes, they never mutate one in place.
    struct ScoredNote {
        int32_t pitch{60};
        cadenza_tick_t startTick{0};
        cadenza_tick_t durationTicks{0};
        int32_t onVelocity{100};
        int32_t offVelocity{0};

        cadenza_tick_t endTick() const { return startTick + durationTicks; }
    };

    // Trivially copyable: it travels through the input queue as-is.
    struct MixerState {
        double volumeDb{0.0};
        // -1 (left) .. 1 (right)
        double pan{0.0};
        bool muted{false};
        bool soloed{false};
        int32_t midiChannel{0};
        int32_t noteRangeMin{0};
        int32_t noteRangeMax{127};
        bool receiveLiveInput{false};
    };

    struct ProcessorSlot {
        std::string processorId{};
        ParameterValues parameters{};
        bool active{true};
    };

    struct TrackData {
        std::string name{};
        std::vector<ScoredNote> notes{};
        ProcessorSlot source{};
        std::vector<ProcessorSlot> effects{};
        MixerState mixer{};
    };

    // The whole-arrangement snapshot handed to the engine. The engine never modifies it;
    // edits produce a new snapshot.
    struct ArrangementData {
        std::string name{};
        int32_t ticksPerQuarterNote{kDefaultTicksPerQuarterNote};
        double defaultBpm{kDefaultBpm};
        int32_t defaultNumerator{4};
        int32_t defaultDenominator{4};
        cadenza_tick_t lengthTicks{1920};
        std::vector<TempoSegment> tempoSegments{};
        std::vector<TrackData> tracks{};

        // End of the last note, or lengthTicks if that is later.
        cadenza_tick_t contentEndTick() const {
            cadenza_tick_t end = lengthTicks;
            for (auto& track : tracks)
                for (auto& note : track.notes)
                    end = std::max(end, note.endTick());
            return end;
        }
    };

}
