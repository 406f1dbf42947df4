#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "TestProcessors.hpp"

using namespace cadenza;
using namespace cadenza_test;

class RenderEngineTest : public ::testing::Test {
protected:
    static constexpr int32_t kBlock = 480;

    std::shared_ptr<ProcessorRegistry> registry;
    std::vector<float> left = std::vector<float>(kBlock);
    std::vector<float> right = std::vector<float>(kBlock);
    float* outputs[2]{left.data(), right.data()};

    void SetUp() override {
        registry = ProcessorRegistry::createWithBuiltins();
        ASSERT_TRUE(registry->registerProcessor([] { return std::make_unique<SineSource>(); }).success);
        ASSERT_TRUE(registry->registerProcessor([] { return std::make_unique<ThrowingSource>(); }).success);
        ASSERT_TRUE(registry->registerProcessor([] { return std::make_unique<SlowSource>(); }).success);
        ASSERT_TRUE(registry->registerProcessor([] { return std::make_unique<FixedTailEffect>(); }).success);
        ASSERT_TRUE(registry->registerProcessor([] { return std::make_unique<UnpreparableSource>(); }).success);
    }

    static EngineConfiguration configuration() {
        EngineConfiguration c;
        c.sampleRate = 48000;
        c.maxBlockFrames = kBlock;
        c.preRenderSeconds = 0.5;
        c.extensionChunkSeconds = 0.25;
        c.extensionLeadSeconds = 0.1;
        return c;
    }

    std::unique_ptr<RenderEngine> createEngine(const EngineConfiguration& c = configuration()) {
        auto engine = RenderEngine::create(c, registry);
        EXPECT_TRUE(engine);
        return engine;
    }

    static TrackData sineTrack(std::vector<ScoredNote> notes = {}) {
        TrackData track;
        track.name = "sine";
        track.source.processorId = SineSource::kId;
        track.notes = std::move(notes);
        return track;
    }

    static TrackData liveTrack(int32_t channel, int32_t low, int32_t high) {
        auto track = sineTrack();
        track.mixer.receiveLiveInput = true;
        track.mixer.midiChannel = channel;
        track.mixer.noteRangeMin = low;
        track.mixer.noteRangeMax = high;
        return track;
    }

    static std::shared_ptr<ArrangementData> arrangementOf(std::vector<TrackData> tracks) {
        auto a = std::make_shared<ArrangementData>();
        a->name = "test";
        a->tracks = std::move(tracks);
        return a;
    }

    // Renders `blocks` blocks and returns the peak absolute sample across both channels.
    float render(RenderEngine& engine, int blocks) {
        float peak = 0;
        for (int b = 0; b < blocks; b++) {
            EXPECT_EQ(engine.processAudio(outputs, 2, kBlock), StatusCode::OK);
            for (int32_t i = 0; i < kBlock; i++)
                peak = std::max({peak, std::abs(left[i]), std::abs(right[i])});
        }
        return peak;
    }
};

// Test: An invalid configuration does not produce an engine
TEST_F(RenderEngineTest, RejectsInvalidConfiguration) {
    auto c = configuration();
    c.sampleRate = 10;
    EXPECT_FALSE(RenderEngine::create(c, registry));
}

// Test: A scored note sounds once the transport plays
TEST_F(RenderEngineTest, PlaysScoredNote) {
    auto engine = createEngine();
    auto load = engine->loadArrangement(arrangementOf({sineTrack({note(69, 0, 480)})}));
    ASSERT_TRUE(load.success) << load.error;
    EXPECT_EQ(load.activeTrackCount, 1);

    EXPECT_EQ(render(*engine, 1), 0.0f);
    EXPECT_EQ(engine->transportState(), TransportState::Stopped);

    ASSERT_TRUE(engine->play());
    EXPECT_GT(render(*engine, 1), 0.5f);
    EXPECT_EQ(engine->transportState(), TransportState::Playing);
    EXPECT_EQ(engine->activeVoiceCount(), 1);
    EXPECT_EQ(engine->activeVoiceCount(0), 1);
    EXPECT_GT(engine->trackLevel(0).peak, 0.5f);
    EXPECT_GT(engine->statistics().blocksRendered, 0);
}

// Test: Stop silences everything and a second stop changes nothing
TEST_F(RenderEngineTest, StopIsIdempotent) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({sineTrack({note(60, 0, 1920), note(64, 0, 1920)})}));
    engine->play();
    render(*engine, 2);
    EXPECT_EQ(engine->activeVoiceCount(), 2);

    engine->stop();
    engine->stop();
    EXPECT_EQ(render(*engine, 1), 0.0f);
    EXPECT_EQ(engine->activeVoiceCount(), 0);
    EXPECT_EQ(engine->transportState(), TransportState::Stopped);

    engine->stop();
    EXPECT_EQ(render(*engine, 1), 0.0f);
    EXPECT_EQ(engine->activeVoiceCount(), 0);
}

// Test: Live notes reach tracks by channel and note range, and releases complete
TEST_F(RenderEngineTest, RoutesLiveInput) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({liveTrack(0, 0, 59), liveTrack(0, 60, 127), liveTrack(1, 0, 127)}));

    ASSERT_TRUE(engine->enqueueLiveEvent({.channel = 0, .pitch = 40, .velocity = 100, .isNoteOn = true}));
    EXPECT_GT(render(*engine, 1), 0.0f);
    EXPECT_EQ(engine->activeVoiceCount(0), 1);
    EXPECT_EQ(engine->activeVoiceCount(1), 0);
    EXPECT_EQ(engine->activeVoiceCount(2), 0);

    engine->enqueueLiveEvent({.channel = 0, .pitch = 72, .velocity = 100, .isNoteOn = true});
    render(*engine, 1);
    EXPECT_EQ(engine->activeVoiceCount(1), 1);

    // live voices keep sounding past the pre-rendered window
    render(*engine, 100);
    EXPECT_EQ(engine->activeVoiceCount(), 2);

    engine->enqueueLiveEvent({.channel = 0, .pitch = 40, .velocity = 0, .isNoteOn = false});
    engine->enqueueLiveEvent({.channel = 0, .pitch = 72, .velocity = 0, .isNoteOn = false});
    render(*engine, 40);
    EXPECT_EQ(engine->activeVoiceCount(), 0);
    EXPECT_EQ(render(*engine, 1), 0.0f);
}

// Test: Live events no track accepts are dropped without a voice
TEST_F(RenderEngineTest, DropsUnroutedLiveInput) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({liveTrack(0, 0, 59), sineTrack()}));
    engine->enqueueLiveEvent({.channel = 0, .pitch = 80, .velocity = 100, .isNoteOn = true});
    engine->enqueueLiveEvent({.channel = 9, .pitch = 40, .velocity = 100, .isNoteOn = true});
    EXPECT_EQ(render(*engine, 1), 0.0f);
    EXPECT_EQ(engine->activeVoiceCount(), 0);
}

// Test: UMP input is decoded into live notes
TEST_F(RenderEngineTest, AcceptsUmpInput) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({liveTrack(0, 0, 59), liveTrack(0, 60, 127)}));
    uint32_t ump[]{0x20903C64, 0x20B00740};
    EXPECT_EQ(engine->enqueueUmp(ump, sizeof(ump), 0), 1);
    render(*engine, 1);
    EXPECT_EQ(engine->activeVoiceCount(0), 0);
    EXPECT_EQ(engine->activeVoiceCount(1), 1);
}

// Test: Stop discards the live notes queued before it
TEST_F(RenderEngineTest, StopDiscardsEarlierLiveNotes) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({liveTrack(0, 0, 127)}));
    engine->enqueueLiveEvent({.channel = 0, .pitch = 40, .velocity = 100, .isNoteOn = true});
    engine->stop();
    render(*engine, 1);
    EXPECT_EQ(engine->activeVoiceCount(), 0);

    engine->enqueueLiveEvent({.channel = 0, .pitch = 41, .velocity = 100, .isNoteOn = true});
    engine->stop();
    engine->enqueueLiveEvent({.channel = 0, .pitch = 42, .velocity = 100, .isNoteOn = true});
    render(*engine, 1);
    EXPECT_EQ(engine->activeVoiceCount(), 1);
}

// Test: A track that fails configuration stays silent while the others play
TEST_F(RenderEngineTest, ConfigurationErrorLeavesOtherTracksPlaying) {
    auto engine = createEngine();
    auto broken = sineTrack({note(60, 0, 960)});
    broken.source.processorId = "NO_SUCH_PROCESSOR";
    auto load = engine->loadArrangement(arrangementOf({broken, sineTrack({note(60, 0, 960)})}));
    ASSERT_TRUE(load.success);
    EXPECT_EQ(load.activeTrackCount, 1);
    ASSERT_EQ(load.trackErrors.size(), 1);
    EXPECT_EQ(load.trackErrors[0].trackIndex, 0);
    EXPECT_EQ(load.trackErrors[0].status, StatusCode::UNKNOWN_PROCESSOR);
    EXPECT_EQ(load.status, StatusCode::UNKNOWN_PROCESSOR);

    engine->play();
    EXPECT_GT(render(*engine, 2), 0.5f);
    EXPECT_EQ(engine->activeVoiceCount(0), 0);
    EXPECT_EQ(engine->activeVoiceCount(1), 1);
}

// Test: A stateful processor that fails to prepare silences only its own track
TEST_F(RenderEngineTest, PrepareFailureLeavesOtherTracksPlaying) {
    auto engine = createEngine();
    auto broken = sineTrack({note(60, 0, 960)});
    broken.source.processorId = UnpreparableSource::kId;
    ArrangementLoadResult load;
    EXPECT_NO_THROW(load = engine->loadArrangement(arrangementOf({broken, sineTrack({note(60, 0, 960)})})));
    ASSERT_TRUE(load.success);
    EXPECT_EQ(load.activeTrackCount, 1);
    ASSERT_EQ(load.trackErrors.size(), 1);
    EXPECT_EQ(load.trackErrors[0].trackIndex, 0);
    EXPECT_EQ(load.trackErrors[0].status, StatusCode::INVALID_STATE);
    EXPECT_NE(load.trackErrors[0].error.find("no resources"), std::string::npos);

    engine->play();
    EXPECT_GT(render(*engine, 2), 0.5f);
    EXPECT_EQ(engine->activeVoiceCount(0), 0);
    EXPECT_EQ(engine->activeVoiceCount(1), 1);
}

// Test: Arrangements the engine cannot hold are refused as a whole
TEST_F(RenderEngineTest, RejectsUnloadableArrangements) {
    auto engine = createEngine();
    EXPECT_FALSE(engine->loadArrangement(nullptr).success);

    std::vector<TrackData> tracks(kMaxTracks + 1, sineTrack());
    auto load = engine->loadArrangement(arrangementOf(tracks));
    EXPECT_FALSE(load.success);
    EXPECT_EQ(load.status, StatusCode::INVALID_PARAMETER);
}

// Test: A throwing source only loses its own voice
TEST_F(RenderEngineTest, RenderFailureIsIsolated) {
    auto engine = createEngine();
    auto throwing = sineTrack({note(60, 0, 960)});
    throwing.source.processorId = ThrowingSource::kId;
    engine->loadArrangement(arrangementOf({throwing, sineTrack({note(60, 0, 960)})}));
    engine->play();

    EXPECT_GT(render(*engine, 3), 0.5f);
    EXPECT_GE(engine->renderFailureCount(), 1);
    EXPECT_EQ(engine->activeVoiceCount(0), 0);
    EXPECT_EQ(engine->activeVoiceCount(1), 1);
    for (int32_t i = 0; i < kBlock; i++)
        ASSERT_TRUE(std::isfinite(left[i]));
}

// Test: Looping wraps the playhead and retriggers the loop content
TEST_F(RenderEngineTest, LoopsAndRetriggers) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({sineTrack({note(60, 0, 240)})}));
    ASSERT_TRUE(engine->setLoopRegion(0, 480));
    ASSERT_TRUE(engine->setLoopEnabled(true));
    engine->play();

    // 480 ticks at 120 BPM are half a second, so 101 blocks of 10 ms wrap twice
    render(*engine, 101);
    EXPECT_EQ(engine->transportState(), TransportState::Looping);
    EXPECT_LT(engine->playheadTick(), 100.0);
    EXPECT_EQ(engine->activeVoiceCount(), 1);

    EXPECT_FALSE(engine->setLoopRegion(480, 480));
}

// Test: Seeking moves the playhead without restarting notes already in progress
TEST_F(RenderEngineTest, SeekMovesPlayhead) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({sineTrack({note(60, 0, 1920)})}));
    engine->play();
    render(*engine, 1);
    EXPECT_EQ(engine->activeVoiceCount(), 1);

    engine->seek(960);
    render(*engine, 1);
    EXPECT_EQ(engine->activeVoiceCount(), 0);
    EXPECT_GT(engine->playheadTick(), 960.0);
}

// Test: Blocks that overrun their real-time budget are counted
TEST_F(RenderEngineTest, CountsTimingViolations) {
    auto engine = createEngine();
    auto slow = sineTrack({note(60, 0, 960)});
    slow.source.processorId = SlowSource::kId;
    engine->loadArrangement(arrangementOf({slow}));
    engine->play();
    render(*engine, 1);
    EXPECT_GE(engine->timingViolationCount(), 1);
    EXPECT_EQ(engine->activeVoiceCount(), 1);
}

// Test: A full input queue drops events and counts them
TEST_F(RenderEngineTest, CountsDroppedInputEvents) {
    auto c = configuration();
    c.inputQueueCapacity = 64;
    auto engine = createEngine(c);
    engine->loadArrangement(arrangementOf({liveTrack(0, 0, 127)}));

    uint64_t accepted = 0;
    for (int i = 0; i < 500; i++)
        if (engine->enqueueLiveEvent({.channel = 0, .pitch = static_cast<uint8_t>(i % 128), .velocity = 100, .isNoteOn = false}))
            accepted++;
    EXPECT_GT(engine->droppedInputEventCount(), 0);
    EXPECT_EQ(accepted + engine->droppedInputEventCount(), 500);

    render(*engine, 1);
    EXPECT_TRUE(engine->enqueueLiveEvent({.channel = 0, .pitch = 60, .velocity = 100, .isNoteOn = true}));
}

// Test: A call larger than the maximum block is rendered in slices
TEST_F(RenderEngineTest, SplitsLargeCalls) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({sineTrack({note(69, 0, 1920)})}));
    engine->play();

    std::vector<float> wideLeft(kBlock * 10), wideRight(kBlock * 10);
    float* wide[2]{wideLeft.data(), wideRight.data()};
    ASSERT_EQ(engine->processAudio(wide, 2, kBlock * 10), StatusCode::OK);
    // 4800 frames at 48kHz and 960 ticks per second
    EXPECT_NEAR(engine->playheadTick(), 96.0, 1e-6);
    EXPECT_EQ(engine->statistics().blocksRendered, 1);
    EXPECT_NE(wideLeft[kBlock * 10 - 1], 0.0f);
}

// Test: Bad output arguments are refused
TEST_F(RenderEngineTest, RejectsBadOutputs) {
    auto engine = createEngine();
    EXPECT_EQ(engine->processAudio(nullptr, 2, kBlock), StatusCode::INVALID_STATE);
    EXPECT_EQ(engine->processAudio(outputs, 0, kBlock), StatusCode::INVALID_STATE);
    EXPECT_EQ(engine->processAudio(outputs, 2, 0), StatusCode::OK);
}

// Test: Closing the arrangement discards voices and pending input
TEST_F(RenderEngineTest, CloseArrangement) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({liveTrack(0, 0, 127)}));
    engine->enqueueLiveEvent({.channel = 0, .pitch = 60, .velocity = 100, .isNoteOn = true});
    render(*engine, 1);
    EXPECT_EQ(engine->activeVoiceCount(), 1);

    engine->enqueueLiveEvent({.channel = 0, .pitch = 62, .velocity = 100, .isNoteOn = true});
    engine->closeArrangement();
    EXPECT_EQ(render(*engine, 1), 0.0f);
    EXPECT_EQ(engine->activeVoiceCount(), 0);
    EXPECT_EQ(engine->transportState(), TransportState::Stopped);

    engine->enqueueLiveEvent({.channel = 0, .pitch = 64, .velocity = 100, .isNoteOn = true});
    EXPECT_EQ(render(*engine, 1), 0.0f);
    EXPECT_GE(engine->collectGarbage(), 1);
}

// Test: Replacing the arrangement releases the notes of the old one
TEST_F(RenderEngineTest, ReplacingArrangementReleasesNotes) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({sineTrack({note(60, 0, 19200)})}));
    engine->play();
    render(*engine, 2);
    EXPECT_EQ(engine->activeVoiceCount(), 1);

    engine->loadArrangement(arrangementOf({sineTrack()}));
    render(*engine, 40);
    EXPECT_EQ(engine->activeVoiceCount(), 0);
}

// Test: The mix stays within [-1, 1] no matter how many voices sound
TEST_F(RenderEngineTest, OutputIsClipped) {
    auto engine = createEngine();
    std::vector<TrackData> tracks;
    for (int t = 0; t < kMaxTracks; t++)
        tracks.push_back(sineTrack({note(60, 0, 960, 127), note(64, 0, 960, 127), note(67, 0, 960, 127)}));
    engine->loadArrangement(arrangementOf(tracks));
    engine->play();
    auto peak = render(*engine, 10);
    EXPECT_LE(peak, 1.0f);
    EXPECT_GT(peak, 0.5f);
}

// Test: Mixer changes take effect at the next block
TEST_F(RenderEngineTest, MixerStateMutes) {
    auto engine = createEngine();
    engine->loadArrangement(arrangementOf({sineTrack({note(60, 0, 1920)})}));
    engine->play();
    EXPECT_GT(render(*engine, 1), 0.0f);

    MixerState muted;
    muted.muted = true;
    ASSERT_TRUE(engine->setMixerState(0, muted));
    EXPECT_EQ(render(*engine, 1), 0.0f);
    EXPECT_EQ(engine->trackLevel(0).peak, 0.0f);
    EXPECT_EQ(engine->activeVoiceCount(), 1);

    EXPECT_FALSE(engine->setMixerState(kMaxTracks, muted));
}
