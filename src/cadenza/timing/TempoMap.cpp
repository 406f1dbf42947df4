#include <algorithm>
#include <cmath>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    static bool validDenominator(int32_t denominator) {
        return denominator > 0 && denominator <= 64 && (denominator & (denominator - 1)) == 0;
    }

    TempoMap::TempoMap(int32_t ticksPerQuarterNote, double defaultBpm, int32_t defaultNumerator,
                       int32_t defaultDenominator, std::vector<TempoSegment> segments) :
        ticks_per_quarter_note(ticksPerQuarterNote > 0 ? ticksPerQuarterNote : kDefaultTicksPerQuarterNote) {

        if (!(defaultBpm > 0.0) || !std::isfinite(defaultBpm))
            defaultBpm = kDefaultBpm;
        if (defaultNumerator <= 0 || !validDenominator(defaultDenominator)) {
            defaultNumerator = 4;
            defaultDenominator = 4;
        }

        // stable_sort keeps input order among equal ticks, so the later entry is the one kept below.
        std::stable_sort(segments.begin(), segments.end(), [](const TempoSegment& a, const TempoSegment& b) {
            return a.startTick < b.startTick;
        });

        for (auto& s : segments) {
            if (s.startTick < 0)
                continue;
            TempoSegment segment = s;
            if (!(segment.bpm > 0.0) || !std::isfinite(segment.bpm))
                segment.bpm = defaultBpm;
            if (segment.numerator <= 0 || !validDenominator(segment.denominator)) {
                segment.numerator = defaultNumerator;
                segment.denominator = defaultDenominator;
            }
            if (!segments_.empty() && segments_.back().startTick == segment.startTick)
                segments_.back() = segment;
            else
                segments_.push_back(segment);
        }

        if (segments_.empty() || segments_.front().startTick != 0)
            segments_.insert(segments_.begin(), TempoSegment{0, defaultBpm, defaultNumerator, defaultDenominator});

        segment_seconds_.reserve(segments_.size());
        double elapsed = 0.0;
        for (size_t i = 0; i < segments_.size(); i++) {
            segment_seconds_.push_back(elapsed);
            if (i + 1 < segments_.size())
                elapsed += static_cast<double>(segments_[i + 1].startTick - segments_[i].startTick) * secondsPerTickOf(segments_[i]);
        }
    }

    TempoMap TempoMap::fromArrangement(const ArrangementData& arrangement) {
        return TempoMap(arrangement.ticksPerQuarterNote, arrangement.defaultBpm,
                        arrangement.defaultNumerator, arrangement.defaultDenominator,
                        arrangement.tempoSegments);
    }

    double TempoMap::secondsPerTickOf(const TempoSegment& segment) const {
        return 60.0 / (segment.bpm * ticks_per_quarter_note);
    }

    size_t TempoMap::segmentIndexAtTick(double tick) const {
        auto it = std::upper_bound(segments_.begin(), segments_.end(), tick, [](double t, const TempoSegment& s) {
            return t < static_cast<double>(s.startTick);
        });
        return it == segments_.begin() ? 0 : static_cast<size_t>(it - segments_.begin() - 1);
    }

    size_t TempoMap::segmentIndexAtSeconds(double seconds) const {
        auto it = std::upper_bound(segment_seconds_.begin(), segment_seconds_.end(), seconds);
        return it == segment_seconds_.begin() ? 0 : static_cast<size_t>(it - segment_seconds_.begin() - 1);
    }

    double TempoMap::bpmAtTick(cadenza_tick_t tick) const {
        return segments_[segmentIndexAtTick(static_cast<double>(tick))].bpm;
    }

    TimeSignature TempoMap::timeSignatureAtTick(cadenza_tick_t tick) const {
        auto& s = segments_[segmentIndexAtTick(static_cast<double>(tick))];
        return {s.numerator, s.denominator};
    }

    double TempoMap::secondsPerTick(cadenza_tick_t tick) const {
        return secondsPerTickOf(segments_[segmentIndexAtTick(static_cast<double>(tick))]);
    }

    double TempoMap::secondsAtTick(double tick) const {
        auto index = segmentIndexAtTick(tick);
        auto& s = segments_[index];
        return segment_seconds_[index] + (tick - static_cast<double>(s.startTick)) * secondsPerTickOf(s);
    }

    double TempoMap::ticksToSeconds(double fromTick, double toTick) const {
        return secondsAtTick(toTick) - secondsAtTick(fromTick);
    }

    double TempoMap::tickAtSeconds(double seconds) const {
        auto index = segmentIndexAtSeconds(seconds);
        auto& s = segments_[index];
        double tick = static_cast<double>(s.startTick) + (seconds - segment_seconds_[index]) / secondsPerTickOf(s);
        auto rounded = std::round(tick);
        if (std::abs(tick - rounded) < 1e-7)
            tick = rounded;
        return tick;
    }

    MusicalPosition TempoMap::positionAtTick(cadenza_tick_t tick) const {
        if (tick < 0)
            tick = 0;
        auto ticksPerBeat = [this](const TempoSegment& s) {
            return std::max<cadenza_tick_t>(1, static_cast<cadenza_tick_t>(ticks_per_quarter_note) * 4 / s.denominator);
        };

        // Bars restart wherever the meter changes; tempo-only changes leave the bar grid alone.
        int64_t completedBars = 0;
        cadenza_tick_t meterStart = 0;
        const TempoSegment* meter = &segments_.front();
        for (auto& s : segments_) {
            if (s.startTick > tick)
                break;
            if (s.numerator == meter->numerator && s.denominator == meter->denominator)
                continue;
            auto barLength = ticksPerBeat(*meter) * meter->numerator;
            completedBars += (s.startTick - meterStart + barLength - 1) / barLength;
            meterStart = s.startTick;
            meter = &s;
        }

        auto beatLength = ticksPerBeat(*meter);
        auto barLength = beatLength * meter->numerator;
        auto offset = tick - meterStart;
        MusicalPosition position;
        position.bar = completedBars + offset / barLength + 1;
        auto inBar = offset % barLength;
        position.beat = static_cast<int32_t>(inBar / beatLength) + 1;
        position.tickInBeat = inBar % beatLength;
        return position;
    }

}
