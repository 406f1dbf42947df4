#include <algorithm>
#include <cmath>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    const char* transportStateName(TransportState state) {
        switch (state) {
            case TransportState::Stopped: return "stopped";
            case TransportState::Playing: return "playing";
            case TransportState::Looping: return "looping";
        }
        return "unknown";
    }

    // SchedulePlan

    SchedulePlan::SchedulePlan(std::shared_ptr<const ArrangementData> arrangement, const std::vector<bool>& activeTracks) :
        arrangement_(arrangement ? std::move(arrangement) : std::make_shared<const ArrangementData>()),
        tempo_map_(TempoMap::fromArrangement(*arrangement_)) {

        auto& tracks = arrangement_->tracks;
        tracks_.resize(tracks.size());
        for (size_t t = 0; t < tracks.size(); t++) {
            auto& notes = tracks[t].notes;
            auto& index = tracks_[t];
            index.active = activeTracks.empty() || (t < activeTracks.size() && activeTracks[t]);
            for (int32_t i = 0; i < static_cast<int32_t>(notes.size()); i++) {
                auto& n = notes[i];
                if (n.pitch < 0 || n.pitch > 127 || n.durationTicks < 0 || n.startTick < 0)
                    continue;
                index.byStart.push_back(i);
            }
            index.byEnd = index.byStart;
            std::stable_sort(index.byStart.begin(), index.byStart.end(), [&notes](int32_t a, int32_t b) {
                return notes[a].startTick < notes[b].startTick;
            });
            std::stable_sort(index.byEnd.begin(), index.byEnd.end(), [&notes](int32_t a, int32_t b) {
                return notes[a].endTick() < notes[b].endTick();
            });
            total_notes_ += index.byStart.size();
        }
    }

    // NoteScheduler

    NoteScheduler::NoteScheduler(size_t soundingNoteCapacity) {
        sounding_.reserve(soundingNoteCapacity);
        pending_.reserve(soundingNoteCapacity);
    }

    int32_t NoteScheduler::FrameClock::frameAt(const TempoMap& map, cadenza_tick_t tick) const {
        if (sampleRate <= 0 || frames <= 0)
            return 0;
        double seconds = intervalOffsetSeconds + map.secondsAtTick(static_cast<double>(tick)) - intervalStartSeconds;
        auto frame = static_cast<int64_t>(std::llround(seconds * sampleRate));
        return static_cast<int32_t>(std::clamp<int64_t>(frame, 0, frames - 1));
    }

    void NoteScheduler::plan(std::shared_ptr<const SchedulePlan> plan, std::vector<ScheduledEvent>& out) {
        forceNoteOffs(currentTick(), 0, out);
        plan_ = std::move(plan);
        resetOrigin(position_);
    }

    TransportState NoteScheduler::state() const {
        if (!playing_)
            return TransportState::Stopped;
        return loopActive() ? TransportState::Looping : TransportState::Playing;
    }

    cadenza_tick_t NoteScheduler::currentTick() const {
        return static_cast<cadenza_tick_t>(std::floor(position_));
    }

    cadenza_tick_t NoteScheduler::loopEndTick() const {
        if (loop_end_)
            return *loop_end_;
        return plan_ ? plan_->lengthTicks() : 0;
    }

    bool NoteScheduler::loopActive() const {
        return loop_enabled_ && loopEndTick() > loop_start_;
    }

    bool NoteScheduler::setLoopRegion(cadenza_tick_t startTick, std::optional<cadenza_tick_t> endTick) {
        if (startTick < 0 || (endTick && *endTick <= startTick))
            return false;
        loop_start_ = startTick;
        loop_end_ = endTick;
        return true;
    }

    void NoteScheduler::resetOrigin(double tick) {
        origin_seconds_ = plan_ ? plan_->tempoMap().secondsAtTick(tick) : 0.0;
        samples_since_origin_ = 0;
    }

    void NoteScheduler::play(cadenza_tick_t fromTick, std::vector<ScheduledEvent>& out) {
        forceNoteOffs(currentTick(), 0, out);
        position_ = static_cast<double>(std::max<cadenza_tick_t>(0, fromTick));
        resetOrigin(position_);
        playing_ = true;
    }

    void NoteScheduler::stop(std::vector<ScheduledEvent>& out) {
        forceNoteOffs(currentTick(), 0, out);
        playing_ = false;
    }

    void NoteScheduler::seek(cadenza_tick_t tick, std::vector<ScheduledEvent>& out) {
        forceNoteOffs(currentTick(), 0, out);
        position_ = static_cast<double>(std::max<cadenza_tick_t>(0, tick));
        resetOrigin(position_);
    }

    void NoteScheduler::forceNoteOffs(cadenza_tick_t tick, int32_t frameOffset, std::vector<ScheduledEvent>& out) {
        for (auto& s : sounding_) {
            ScheduledEvent e;
            e.type = ScheduledEvent::Type::NoteOff;
            e.trackIndex = s.trackIndex;
            e.noteIndex = s.noteIndex;
            e.pitch = s.pitch;
            e.tick = tick;
            e.frameOffset = frameOffset;
            e.forced = true;
            out.push_back(e);
        }
        sounding_.clear();
    }

    // Gathers note-ons and note-offs for integer ticks in [ceil(fromTick), ceil(toTick)) into pending_.
    void NoteScheduler::collect(double fromTick, double toTick) {
        pending_.clear();
        auto lo = static_cast<cadenza_tick_t>(std::ceil(fromTick));
        auto hi = static_cast<cadenza_tick_t>(std::ceil(toTick));
        if (hi <= lo)
            return;

        auto& map = plan_->tempoMap();
        auto& tracks = plan_->arrangement().tracks;
        for (size_t t = 0; t < plan_->tracks().size(); t++) {
            auto& index = plan_->tracks()[t];
            if (!index.active)
                continue;
            auto& notes = tracks[t].notes;

            auto on = std::lower_bound(index.byStart.begin(), index.byStart.end(), lo, [&notes](int32_t i, cadenza_tick_t tick) {
                return notes[i].startTick < tick;
            });
            for (; on != index.byStart.end() && notes[*on].startTick < hi; ++on) {
                auto& n = notes[*on];
                ScheduledEvent e;
                e.type = ScheduledEvent::Type::NoteOn;
                e.trackIndex = static_cast<cadenza_track_index_t>(t);
                e.noteIndex = *on;
                e.pitch = n.pitch;
                e.velocity = std::clamp(n.onVelocity, 1, 127);
                e.tick = n.startTick;
                e.durationSeconds = map.ticksToSeconds(static_cast<double>(n.startTick), static_cast<double>(n.endTick()));
                pending_.push_back(e);
            }

            auto off = std::lower_bound(index.byEnd.begin(), index.byEnd.end(), lo, [&notes](int32_t i, cadenza_tick_t tick) {
                return notes[i].endTick() < tick;
            });
            for (; off != index.byEnd.end() && notes[*off].endTick() < hi; ++off) {
                auto& n = notes[*off];
                ScheduledEvent e;
                e.type = ScheduledEvent::Type::NoteOff;
                e.trackIndex = static_cast<cadenza_track_index_t>(t);
                e.noteIndex = *off;
                e.pitch = n.pitch;
                e.velocity = std::clamp(n.offVelocity, 0, 127);
                e.tick = n.endTick();
                pending_.push_back(e);
            }
        }
    }

    // Sorts pending_ and moves it into `out`, dropping note-offs of notes that never sounded.
    void NoteScheduler::emitPending(const FrameClock& clock, std::vector<ScheduledEvent>& out) {
        auto& notes = plan_->arrangement().tracks;
        auto phase = [&notes](const ScheduledEvent& e) {
            if (e.type == ScheduledEvent::Type::NoteOn)
                return 1;
            return notes[e.trackIndex].notes[e.noteIndex].durationTicks == 0 ? 2 : 0;
        };
        std::sort(pending_.begin(), pending_.end(), [&phase](const ScheduledEvent& a, const ScheduledEvent& b) {
            if (a.tick != b.tick)
                return a.tick < b.tick;
            auto pa = phase(a), pb = phase(b);
            if (pa != pb)
                return pa < pb;
            if (a.trackIndex != b.trackIndex)
                return a.trackIndex < b.trackIndex;
            return a.noteIndex < b.noteIndex;
        });

        auto& map = plan_->tempoMap();
        for (auto& e : pending_) {
            if (e.type == ScheduledEvent::Type::NoteOn) {
                sounding_.push_back({e.trackIndex, e.noteIndex, e.pitch});
            } else {
                auto it = std::find_if(sounding_.begin(), sounding_.end(), [&e](const SoundingNote& s) {
                    return s.trackIndex == e.trackIndex && s.noteIndex == e.noteIndex;
                });
                if (it == sounding_.end())
                    continue;
                *it = sounding_.back();
                sounding_.pop_back();
            }
            e.frameOffset = clock.frameAt(map, e.tick);
            out.push_back(e);
        }
        pending_.clear();
    }

    bool NoteScheduler::run(double fromTick, double toTick, FrameClock clock, std::vector<ScheduledEvent>& out) {
        auto& map = plan_->tempoMap();
        clock.intervalStartSeconds = map.secondsAtTick(fromTick);
        bool jumped = false;

        if (loopActive()) {
            auto loopStart = static_cast<double>(loop_start_);
            auto loopEnd = static_cast<double>(loopEndTick());
            if (fromTick < loopEnd && toTick >= loopEnd) {
                collect(fromTick, loopEnd);
                emitPending(clock, out);

                auto boundaryFrame = clock.frameAt(map, loopEndTick());
                forceNoteOffs(loopEndTick(), boundaryFrame, out);
                ScheduledEvent jump;
                jump.type = ScheduledEvent::Type::LoopJump;
                jump.tick = loopEndTick();
                jump.frameOffset = boundaryFrame;
                out.push_back(jump);

                clock.intervalOffsetSeconds += map.secondsAtTick(loopEnd) - clock.intervalStartSeconds;
                clock.intervalStartSeconds = map.secondsAtTick(loopStart);
                toTick = loopStart + std::fmod(toTick - loopEnd, loopEnd - loopStart);
                fromTick = loopStart;
                jumped = true;
            } else if (fromTick >= loopEnd) {
                // already past the loop end when the loop was engaged: wrap at the start of the interval
                auto tick = static_cast<cadenza_tick_t>(std::floor(fromTick));
                forceNoteOffs(tick, 0, out);
                ScheduledEvent jump;
                jump.type = ScheduledEvent::Type::LoopJump;
                jump.tick = tick;
                jump.frameOffset = 0;
                out.push_back(jump);

                clock.intervalStartSeconds = map.secondsAtTick(loopStart);
                toTick = loopStart + std::fmod(toTick - fromTick, loopEnd - loopStart);
                fromTick = loopStart;
                jumped = true;
            }
        }

        collect(fromTick, toTick);
        emitPending(clock, out);
        position_ = toTick;
        return jumped;
    }

    void NoteScheduler::step(cadenza_tick_t currentTick, cadenza_tick_t nextTick, std::vector<ScheduledEvent>& out) {
        if (!playing_ || !plan_ || nextTick < currentTick)
            return;
        run(static_cast<double>(currentTick), static_cast<double>(nextTick), FrameClock{}, out);
        resetOrigin(position_);
    }

    void NoteScheduler::advance(int32_t frames, double sampleRate, std::vector<ScheduledEvent>& out) {
        if (!playing_ || !plan_ || frames <= 0 || sampleRate <= 0)
            return;
        auto& map = plan_->tempoMap();
        samples_since_origin_ += frames;
        double endSeconds = origin_seconds_ + static_cast<double>(samples_since_origin_) / sampleRate;
        double toTick = std::max(position_, map.tickAtSeconds(endSeconds));

        FrameClock clock{.sampleRate = sampleRate, .frames = frames};
        if (run(position_, toTick, clock, out))
            resetOrigin(position_);
    }

}
