#include <gtest/gtest.h>
#include "TestProcessors.hpp"

using namespace cadenza;
using cadenza_test::note;

class NoteSchedulerTest : public ::testing::Test {
protected:
    NoteScheduler scheduler;
    std::vector<ScheduledEvent> events;

    void load(std::vector<std::vector<ScoredNote>> tracks, cadenza_tick_t lengthTicks = 1920,
              std::vector<bool> active = {}) {
        auto arrangement = std::make_shared<ArrangementData>();
        arrangement->lengthTicks = lengthTicks;
        for (auto& notes : tracks) {
            TrackData track;
            track.notes = std::move(notes);
            arrangement->tracks.push_back(std::move(track));
        }
        scheduler.plan(std::make_shared<SchedulePlan>(arrangement, active), events);
        events.clear();
    }
};

// Test: One quarter note at 120bpm gives exactly one note-on and one note-off
TEST_F(NoteSchedulerTest, SingleNoteOnAndOff) {
    load({{note(60, 0, 480)}});
    scheduler.play(0, events);
    EXPECT_TRUE(events.empty());

    scheduler.step(0, 481, events);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].type, ScheduledEvent::Type::NoteOn);
    EXPECT_EQ(events[0].tick, 0);
    EXPECT_EQ(events[0].pitch, 60);
    EXPECT_NEAR(events[0].durationSeconds, 0.5, 1e-12);
    EXPECT_EQ(events[1].type, ScheduledEvent::Type::NoteOff);
    EXPECT_EQ(events[1].tick, 480);
    EXPECT_FALSE(events[1].forced);
}

// Test: Intervals are half-open
TEST_F(NoteSchedulerTest, IntervalsAreHalfOpen) {
    load({{note(60, 0, 480)}});
    scheduler.play(0, events);
    scheduler.step(0, 480, events);
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, ScheduledEvent::Type::NoteOn);
    events.clear();
    scheduler.step(480, 960, events);
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, ScheduledEvent::Type::NoteOff);
}

// Test: On the same tick note-offs come before note-ons
TEST_F(NoteSchedulerTest, NoteOffBeforeNoteOnOnSameTick) {
    load({{note(60, 0, 480), note(60, 480, 480)}, {note(64, 480, 100)}});
    scheduler.play(0, events);
    scheduler.step(0, 500, events);
    ASSERT_EQ(events.size(), 4);
    EXPECT_EQ(events[0].type, ScheduledEvent::Type::NoteOn);
    EXPECT_EQ(events[1].type, ScheduledEvent::Type::NoteOff);
    EXPECT_EQ(events[1].tick, 480);
    EXPECT_EQ(events[2].type, ScheduledEvent::Type::NoteOn);
    EXPECT_EQ(events[2].trackIndex, 0);
    EXPECT_EQ(events[3].type, ScheduledEvent::Type::NoteOn);
    EXPECT_EQ(events[3].trackIndex, 1);
}

// Test: A zero-length note emits its on and off in the same step, in that order
TEST_F(NoteSchedulerTest, ZeroDurationNote) {
    load({{note(42, 240, 0)}});
    scheduler.play(0, events);
    scheduler.step(0, 480, events);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].type, ScheduledEvent::Type::NoteOn);
    EXPECT_EQ(events[1].type, ScheduledEvent::Type::NoteOff);
    EXPECT_EQ(events[0].tick, 240);
    EXPECT_EQ(events[1].tick, 240);
    EXPECT_EQ(scheduler.soundingNoteCount(), 0);
}

// Test: Crossing the loop end force-releases, jumps, and lands at loopStart + remainder
TEST_F(NoteSchedulerTest, LoopJumpLandsOnRemainder) {
    load({{note(60, 1910, 100), note(62, 0, 10), note(64, 20, 100)}});
    ASSERT_TRUE(scheduler.setLoopRegion(0, 1920));
    scheduler.setLoopEnabled(true);
    scheduler.play(1900, events);
    EXPECT_EQ(scheduler.state(), TransportState::Looping);

    scheduler.step(1900, 1950, events);
    ASSERT_EQ(events.size(), 6);
    EXPECT_EQ(events[0].type, ScheduledEvent::Type::NoteOn);
    EXPECT_EQ(events[0].tick, 1910);
    EXPECT_EQ(events[1].type, ScheduledEvent::Type::NoteOff);
    EXPECT_TRUE(events[1].forced);
    EXPECT_EQ(events[1].pitch, 60);
    EXPECT_EQ(events[2].type, ScheduledEvent::Type::LoopJump);
    EXPECT_EQ(events[3].type, ScheduledEvent::Type::NoteOn);
    EXPECT_EQ(events[3].tick, 0);
    EXPECT_EQ(events[4].type, ScheduledEvent::Type::NoteOff);
    EXPECT_EQ(events[4].tick, 10);
    EXPECT_EQ(events[5].type, ScheduledEvent::Type::NoteOn);
    EXPECT_EQ(events[5].tick, 20);
    EXPECT_EQ(scheduler.currentTick(), 30);
}

// Test: Enabling the loop while the playhead is beyond the loop end wraps on the next step
TEST_F(NoteSchedulerTest, LoopEngagesWhenPlayheadIsPastLoopEnd) {
    load({{note(60, 1990, 200), note(62, 10, 60), note(64, 100, 50)}}, 3840);
    scheduler.play(1980, events);
    scheduler.step(1980, 2000, events);
    ASSERT_EQ(events.size(), 1);
    events.clear();
    ASSERT_TRUE(scheduler.setLoopRegion(0, 1920));
    scheduler.setLoopEnabled(true);
    EXPECT_EQ(scheduler.state(), TransportState::Looping);

    scheduler.step(2000, 2050, events);
    ASSERT_GE(events.size(), 3);
    EXPECT_EQ(events[0].type, ScheduledEvent::Type::NoteOff);
    EXPECT_TRUE(events[0].forced);
    EXPECT_EQ(events[0].pitch, 60);
    EXPECT_EQ(events[1].type, ScheduledEvent::Type::LoopJump);
    EXPECT_EQ(events[1].frameOffset, 0);
    EXPECT_EQ(events[2].type, ScheduledEvent::Type::NoteOn);
    EXPECT_EQ(events[2].pitch, 62);
    EXPECT_EQ(events.size(), 3);
    EXPECT_EQ(scheduler.currentTick(), 50);

    events.clear();
    scheduler.step(50, 120, events);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].type, ScheduledEvent::Type::NoteOff);
    EXPECT_FALSE(events[0].forced);
    EXPECT_EQ(events[1].pitch, 64);
}

// Test: Loop end defaults to the arrangement length and invalid regions are rejected
TEST_F(NoteSchedulerTest, LoopRegionRules) {
    load({{}}, 3840);
    EXPECT_EQ(scheduler.loopEndTick(), 3840);
    EXPECT_FALSE(scheduler.setLoopRegion(960, 960));
    EXPECT_FALSE(scheduler.setLoopRegion(960, 480));
    EXPECT_EQ(scheduler.loopEndTick(), 3840);
    EXPECT_TRUE(scheduler.setLoopRegion(480, std::nullopt));
    EXPECT_EQ(scheduler.loopStartTick(), 480);
    EXPECT_EQ(scheduler.loopEndTick(), 3840);

    scheduler.play(0, events);
    EXPECT_EQ(scheduler.state(), TransportState::Playing);
    scheduler.setLoopEnabled(true);
    EXPECT_EQ(scheduler.state(), TransportState::Looping);
}

// Test: Stopping twice is the same as stopping once
TEST_F(NoteSchedulerTest, StopIsIdempotent) {
    load({{note(60, 0, 960)}});
    scheduler.play(0, events);
    scheduler.step(0, 10, events);
    ASSERT_EQ(scheduler.soundingNoteCount(), 1);
    events.clear();

    scheduler.stop(events);
    ASSERT_EQ(events.size(), 1);
    EXPECT_TRUE(events[0].forced);
    EXPECT_EQ(scheduler.state(), TransportState::Stopped);
    events.clear();

    scheduler.stop(events);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(scheduler.state(), TransportState::Stopped);
    EXPECT_EQ(scheduler.soundingNoteCount(), 0);

    // stepping while stopped does nothing
    scheduler.step(10, 2000, events);
    EXPECT_TRUE(events.empty());
}

// Test: Seeking releases sounding notes and does not re-trigger notes already under way
TEST_F(NoteSchedulerTest, SeekReleasesWithoutRetrigger) {
    load({{note(60, 0, 960)}});
    scheduler.play(0, events);
    scheduler.step(0, 10, events);
    events.clear();

    scheduler.seek(480, events);
    ASSERT_EQ(events.size(), 1);
    EXPECT_TRUE(events[0].forced);
    events.clear();

    scheduler.step(480, 1000, events);
    EXPECT_TRUE(events.empty());
}

// Test: The sample clock places events at frame offsets through the tempo map
TEST_F(NoteSchedulerTest, AdvanceComputesFrameOffsets) {
    // 120bpm, 480 tpqn, 48kHz: 50 samples per tick
    load({{note(60, 10, 5)}});
    scheduler.play(0, events);
    scheduler.advance(1024, 48000.0, events);
    ASSERT_EQ(events.size(), 2);
    EXPECT_NEAR(events[0].frameOffset, 500, 1);
    EXPECT_NEAR(events[1].frameOffset, 750, 1);
    EXPECT_NEAR(scheduler.position(), 1024.0 / 50.0, 1e-9);

    // many small blocks do not drift
    for (int i = 0; i < 1000; i++)
        scheduler.advance(48, 48000.0, events);
    EXPECT_NEAR(scheduler.position(), (1024.0 + 48000.0) / 50.0, 1e-6);
}

// Test: A tempo change in the middle of a block is honoured
TEST_F(NoteSchedulerTest, TempoChangeMidBlock) {
    auto arrangement = std::make_shared<ArrangementData>();
    arrangement->tempoSegments = {{0, 120.0, 4, 4}, {10, 60.0, 4, 4}};
    TrackData track;
    track.notes = {note(60, 20, 10)};
    arrangement->tracks.push_back(track);
    scheduler.plan(std::make_shared<SchedulePlan>(arrangement), events);
    scheduler.play(0, events);

    // ticks 0-10 take 500 samples, ticks 10-20 take 1000
    scheduler.advance(2048, 48000.0, events);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events[0].type, ScheduledEvent::Type::NoteOn);
    EXPECT_NEAR(events[0].frameOffset, 1500, 1);
}

// Test: Inactive tracks are skipped
TEST_F(NoteSchedulerTest, InactiveTracksAreSkipped) {
    load({{note(60, 0, 10)}, {note(62, 0, 10)}}, 1920, {false, true});
    scheduler.play(0, events);
    scheduler.step(0, 100, events);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].trackIndex, 1);
    EXPECT_EQ(events[1].trackIndex, 1);
}

// Test: Replacing the plan releases what the previous plan was sounding
TEST_F(NoteSchedulerTest, ReplacingPlanReleasesSoundingNotes) {
    load({{note(60, 0, 960)}});
    scheduler.play(0, events);
    scheduler.step(0, 10, events);
    events.clear();

    auto replacement = std::make_shared<ArrangementData>();
    replacement->tracks.resize(1);
    scheduler.plan(std::make_shared<SchedulePlan>(replacement), events);
    ASSERT_EQ(events.size(), 1);
    EXPECT_TRUE(events[0].forced);
    EXPECT_EQ(scheduler.currentTick(), 10);
}
