#include <gtest/gtest.h>
#include <array>
#include <vector>
#include "cadenza/cadenza.hpp"

using namespace cadenza;

class LiveInputTest : public ::testing::Test {
protected:
    std::array<MixerState, 4> mixers{};
    std::array<bool, 4> active{true, true, true, true};

    void SetUp() override {
        // 0: whole keyboard on channel 0
        mixers[0].receiveLiveInput = true;
        // 1: upper split on channel 0
        mixers[1].receiveLiveInput = true;
        mixers[1].noteRangeMin = 48;
        // 2: channel 0 but not listening
        mixers[2].receiveLiveInput = false;
        // 3: channel 1
        mixers[3].receiveLiveInput = true;
        mixers[3].midiChannel = 1;
    }

    std::vector<cadenza_track_index_t> routed(const LiveNoteEvent& event) {
        std::vector<cadenza_track_index_t> result;
        LiveInputRouter::route(event, mixers.data(), active, mixers.size(), [&](cadenza_track_index_t t) {
            result.push_back(t);
        });
        return result;
    }
};

// Test: Channel 0 pitch 40 only reaches the track whose range covers it
TEST_F(LiveInputTest, RoutesByChannelAndRange) {
    auto tracks = routed({.channel = 0, .pitch = 40, .velocity = 100, .isNoteOn = true});
    ASSERT_EQ(tracks.size(), 1);
    EXPECT_EQ(tracks[0], 0);
}

// Test: One channel fans out to every split that covers the pitch
TEST_F(LiveInputTest, FansOutAcrossSplits) {
    auto tracks = routed({.channel = 0, .pitch = 60, .velocity = 100, .isNoteOn = true});
    ASSERT_EQ(tracks.size(), 2);
    EXPECT_EQ(tracks[0], 0);
    EXPECT_EQ(tracks[1], 1);

    auto onChannel1 = routed({.channel = 1, .pitch = 60, .velocity = 100, .isNoteOn = true});
    ASSERT_EQ(onChannel1.size(), 1);
    EXPECT_EQ(onChannel1[0], 3);
}

// Test: Events nobody accepts are dropped
TEST_F(LiveInputTest, DropsUnmatchedEvents) {
    EXPECT_TRUE(routed({.channel = 9, .pitch = 60, .velocity = 100, .isNoteOn = true}).empty());
    active[0] = false;
    EXPECT_TRUE(routed({.channel = 0, .pitch = 40, .velocity = 100, .isNoteOn = true}).empty());
}

// Test: Range bounds are inclusive
TEST_F(LiveInputTest, RangeIsInclusive) {
    MixerState split;
    split.receiveLiveInput = true;
    split.noteRangeMin = 40;
    split.noteRangeMax = 40;
    EXPECT_TRUE(LiveInputRouter::accepts(split, {.channel = 0, .pitch = 40}));
    EXPECT_FALSE(LiveInputRouter::accepts(split, {.channel = 0, .pitch = 41}));
    EXPECT_FALSE(LiveInputRouter::accepts(split, {.channel = 0, .pitch = 39}));
}

// Test: MIDI 1.0 and MIDI 2.0 note messages become live events
TEST_F(LiveInputTest, DecodesUmp) {
    std::vector<uint32_t> ump{
        0x20903C64,             // MIDI 1.0 note-on, channel 0, note 60, velocity 100
        0x20813C40,             // MIDI 1.0 note-off, channel 1, note 60
        0x20923E00,             // MIDI 1.0 note-on with velocity 0, channel 2
        0x20B00740,             // control change: ignored
        0x00000000,             // utility NOOP: ignored
        0x40953C00, 0xFFFF0000, // MIDI 2.0 note-on, channel 5, note 60, full velocity
        0x40903D00, 0x01000000, // MIDI 2.0 note-on with a tiny velocity
        0x40853C00, 0x80000000, // MIDI 2.0 note-off, channel 5
    };
    std::vector<LiveNoteEvent> events;
    auto count = UmpInputDecoder::decode(ump.data(), ump.size() * sizeof(uint32_t), 1234,
                                         [&](const LiveNoteEvent& e) { events.push_back(e); });
    ASSERT_EQ(count, 6);
    ASSERT_EQ(events.size(), 6);

    EXPECT_TRUE(events[0].isNoteOn);
    EXPECT_EQ(events[0].channel, 0);
    EXPECT_EQ(events[0].pitch, 60);
    EXPECT_EQ(events[0].velocity, 100);
    EXPECT_EQ(events[0].timestamp, 1234);

    EXPECT_FALSE(events[1].isNoteOn);
    EXPECT_EQ(events[1].channel, 1);

    EXPECT_FALSE(events[2].isNoteOn);
    EXPECT_EQ(events[2].pitch, 62);

    EXPECT_TRUE(events[3].isNoteOn);
    EXPECT_EQ(events[3].channel, 5);
    EXPECT_EQ(events[3].velocity, 127);

    EXPECT_TRUE(events[4].isNoteOn);
    EXPECT_EQ(events[4].velocity, 1);

    EXPECT_FALSE(events[5].isNoteOn);
    EXPECT_EQ(events[5].velocity, 64);
}

// Test: Empty input decodes to nothing
TEST_F(LiveInputTest, DecodesEmptyInput) {
    size_t calls = 0;
    EXPECT_EQ(UmpInputDecoder::decode(nullptr, 0, 0, [&](const LiveNoteEvent&) { calls++; }), 0);
    EXPECT_EQ(calls, 0);
}
