#pragma once

#include <cstdint>
#include <vector>

#include "../common.hpp"
#include "../model/Arrangement.hpp"

namespace cadenza {

    struct TimeSignature {
        int32_t numerator{4};
        int32_t denominator{4};
    };

    // 1-based bar and beat, as shown in an editor ruler.
    struct MusicalPosition {
        int64_t bar{1};
        int32_t beat{1};
        cadenza_tick_t tickInBeat{0};
    };

    // Resolves ticks to seconds and back across tempo and time-signature changes.
    //
    // The segment list given to the constructor is normalized: sorted by start tick, later
    // duplicates win, invalid tempos or signatures fall back to the defaults, and a default
    // segment at tick 0 fills any leading gap. After that the segments partition [0, inf).
    // Bpm always counts quarter notes, whatever the time-signature denominator is.
    class TempoMap {
        int32_t ticks_per_quarter_note;
        std::vector<TempoSegment> segments_;
        // Seconds elapsed at the start of each segment.
        std::vector<double> segment_seconds_;

        size_t segmentIndexAtTick(double tick) const;
        size_t segmentIndexAtSeconds(double seconds) const;
        double secondsPerTickOf(const TempoSegment& segment) const;

    public:
        explicit TempoMap(int32_t ticksPerQuarterNote = kDefaultTicksPerQuarterNote,
                          double defaultBpm = kDefaultBpm,
                          int32_t defaultNumerator = 4,
                          int32_t defaultDenominator = 4,
                          std::vector<TempoSegment> segments = {});

        static TempoMap fromArrangement(const ArrangementData& arrangement);

        int32_t ticksPerQuarterNote() const { return ticks_per_quarter_note; }
        const std::vector<TempoSegment>& segments() const { return segments_; }

        double bpmAtTick(cadenza_tick_t tick) const;
        TimeSignature timeSignatureAtTick(cadenza_tick_t tick) const;
        double secondsPerTick(cadenza_tick_t tick) const;

        // Fractional ticks are accepted; the scheduler keeps a fractional playhead.
        double secondsAtTick(double tick) const;
        double ticksToSeconds(double fromTick, double toTick) const;
        // Inverse of secondsAtTick(). Results within 1e-7 of an integer tick snap to it.
        double tickAtSeconds(double seconds) const;

        MusicalPosition positionAtTick(cadenza_tick_t tick) const;
    };

}
