#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "../common.hpp"
#include "../model/Arrangement.hpp"
#include "../timing/TempoMap.hpp"

namespace cadenza {

    enum class TransportState {
        Stopped,
        Playing,
        Looping
    };

    const char* transportStateName(TransportState state);

    struct ScheduledEvent {
        enum class Type {
            NoteOff,
            NoteOn,
            LoopJump
        };

        Type type{Type::NoteOn};
        cadenza_track_index_t trackIndex{-1};
        // Index into the track's notes; -1 for loop jumps.
        int32_t noteIndex{-1};
        int32_t pitch{0};
        int32_t velocity{0};
        cadenza_tick_t tick{0};
        // Position of the event inside the block passed to advance(); 0 for step().
        int32_t frameOffset{0};
        double durationSeconds{0.0};
        // Note-offs emitted because of a loop jump, stop or seek rather than a note ending.
        bool forced{false};
    };

    // Read-only scheduling data for one arrangement snapshot, built off the render thread.
    class SchedulePlan {
    public:
        struct TrackIndex {
            bool active{false};
            // Note indices ordered by start tick, and by end tick.
            std::vector<int32_t> byStart{};
            std::vector<int32_t> byEnd{};
        };

    private:
        std::shared_ptr<const ArrangementData> arrangement_;
        TempoMap tempo_map_;
        std::vector<TrackIndex> tracks_;
        size_t total_notes_{0};

    public:
        // `activeTracks` marks tracks whose configuration succeeded; empty means all of them.
        SchedulePlan(std::shared_ptr<const ArrangementData> arrangement, const std::vector<bool>& activeTracks = {});

        const ArrangementData& arrangement() const { return *arrangement_; }
        const TempoMap& tempoMap() const { return tempo_map_; }
        const std::vector<TrackIndex>& tracks() const { return tracks_; }
        size_t totalNotes() const { return total_notes_; }
        cadenza_tick_t lengthTicks() const { return arrangement_->lengthTicks; }
    };

    // Advances a playhead over a SchedulePlan and reports which notes start and end.
    //
    // Events inside one step are ordered by tick; on the same tick note-offs come before
    // note-ons, except that a zero-length note's own note-off follows its note-on.
    // Note-offs are only reported for notes whose note-on was reported, so starting in the
    // middle of a note leaves it silent instead of cutting off an unrelated voice.
    //
    // Everything here runs on the render thread; no method allocates once the sounding-note
    // capacity is reserved, as long as `out` has spare capacity.
    class NoteScheduler {
        struct SoundingNote {
            cadenza_track_index_t trackIndex;
            int32_t noteIndex;
            int32_t pitch;
        };

        std::shared_ptr<const SchedulePlan> plan_{};
        bool playing_{false};
        bool loop_enabled_{false};
        cadenza_tick_t loop_start_{0};
        std::optional<cadenza_tick_t> loop_end_{};
        double position_{0};
        // The playhead is derived from an origin and a sample count to avoid accumulating rounding errors.
        double origin_seconds_{0};
        int64_t samples_since_origin_{0};
        std::vector<SoundingNote> sounding_{};
        std::vector<ScheduledEvent> pending_{};

        // Maps ticks of the interval being processed to frames of the current block.
        struct FrameClock {
            double sampleRate{0};
            int32_t frames{0};
            // Seconds into the block at which the current interval starts, and the tempo-map time of that start.
            double intervalOffsetSeconds{0};
            double intervalStartSeconds{0};

            int32_t frameAt(const TempoMap& map, cadenza_tick_t tick) const;
        };

        bool loopActive() const;
        void collect(double fromTick, double toTick);
        void emitPending(const FrameClock& clock, std::vector<ScheduledEvent>& out);
        void forceNoteOffs(cadenza_tick_t tick, int32_t frameOffset, std::vector<ScheduledEvent>& out);
        void resetOrigin(double tick);
        // Returns true when the loop boundary was crossed.
        bool run(double fromTick, double toTick, FrameClock clock, std::vector<ScheduledEvent>& out);

    public:
        explicit NoteScheduler(size_t soundingNoteCapacity = 4096);

        // Takes effect immediately. Sounding notes get forced note-offs since their indices
        // refer to the previous snapshot; the playhead stays where it is.
        void plan(std::shared_ptr<const SchedulePlan> plan, std::vector<ScheduledEvent>& out);
        const std::shared_ptr<const SchedulePlan>& plan() const { return plan_; }

        TransportState state() const;
        double position() const { return position_; }
        cadenza_tick_t currentTick() const;
        size_t soundingNoteCount() const { return sounding_.size(); }

        void play(cadenza_tick_t fromTick, std::vector<ScheduledEvent>& out);
        void stop(std::vector<ScheduledEvent>& out);
        void seek(cadenza_tick_t tick, std::vector<ScheduledEvent>& out);

        // Returns false (and leaves the region unchanged) when end <= start.
        // A null end follows the arrangement length.
        bool setLoopRegion(cadenza_tick_t startTick, std::optional<cadenza_tick_t> endTick);
        void setLoopEnabled(bool enabled) { loop_enabled_ = enabled; }
        bool loopEnabled() const { return loop_enabled_; }
        cadenza_tick_t loopStartTick() const { return loop_start_; }
        cadenza_tick_t loopEndTick() const;

        // Processes the tick interval [currentTick, nextTick) without a sample clock.
        void step(cadenza_tick_t currentTick, cadenza_tick_t nextTick, std::vector<ScheduledEvent>& out);
        // Moves the playhead by `frames` samples through the tempo map, filling frame offsets.
        void advance(int32_t frames, double sampleRate, std::vector<ScheduledEvent>& out);
    };

}
