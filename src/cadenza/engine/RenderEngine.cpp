#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <format>

#include "concurrentqueue.h"
#include "cadenza/cadenza.hpp"

namespace cadenza {

    namespace {
        // Everything the render thread needs from one arrangement, built and prepared on the control thread.
        // An empty arrangement means "closed".
        struct EngineSnapshot {
            std::shared_ptr<const ArrangementData> arrangement{};
            std::shared_ptr<const SchedulePlan> plan{};
            std::vector<ConfiguredTrack> tracks{};
            std::array<uint8_t, kMaxTracks> active{};
        };

        constexpr size_t kRetiredSnapshotCapacity = 16;
    }

    class RenderEngineImpl : public RenderEngine {
        EngineConfiguration config_;
        std::shared_ptr<ProcessorRegistry> registry_;

        // control -> render
        std::shared_ptr<const EngineSnapshot> pending_snapshot_{};
        moodycamel::ConcurrentQueue<EngineCommand> commands_;
        // render -> control
        moodycamel::ConcurrentQueue<std::shared_ptr<const EngineSnapshot>> retired_;

        // render thread only
        std::shared_ptr<const EngineSnapshot> current_{};
        NoteScheduler scheduler_{};
        VoiceEngine voices_;
        TrackMixer mixer_;
        std::vector<EngineCommand> drained_{};
        std::vector<ScheduledEvent> events_{};

        // published observers
        std::atomic<double> playhead_tick_{0};
        std::atomic<TransportState> transport_state_{TransportState::Stopped};
        std::atomic<uint32_t> active_voices_{0};
        std::array<std::atomic<uint32_t>, kMaxTracks> track_voices_{};
        std::atomic<uint64_t> dropped_input_events_{0};
        std::atomic<uint64_t> timing_violations_{0};
        std::atomic<uint64_t> blocks_rendered_{0};
        std::atomic<uint64_t> render_failures_{0};
        std::atomic<uint64_t> voice_evictions_{0};
        std::atomic<uint64_t> underruns_{0};
        std::atomic<uint64_t> source_render_calls_{0};

        bool enqueue(const EngineCommand& command);
        RenderContext renderContext(cadenza_tick_t tick) const;
        size_t trackCount() const;
        void retire(std::shared_ptr<const EngineSnapshot> snapshot);
        void adoptSnapshot();
        void discardQueuedCommands();
        void applyCommands();
        void applyLiveNote(const LiveNoteEvent& note);
        void dispatch(std::vector<ScheduledEvent>& events);
        void renderSlice(float** outputs, uint32_t channelCount, uint32_t outputOffset, int32_t frames);
        void publishObservers();

    public:
        RenderEngineImpl(const EngineConfiguration& configuration, std::shared_ptr<ProcessorRegistry> registry);
        ~RenderEngineImpl() override = default;

        const EngineConfiguration& configuration() const override { return config_; }
        ProcessorRegistry& registry() override { return *registry_; }

        ArrangementLoadResult loadArrangement(std::shared_ptr<const ArrangementData> arrangement) override;
        void closeArrangement() override;
        size_t collectGarbage() override;

        bool enqueueLiveEvent(const LiveNoteEvent& event) override;
        size_t enqueueUmp(const uint32_t* ump, size_t sizeInBytes, cadenza_timestamp_t timestamp) override;

        bool play(cadenza_tick_t fromTick) override;
        bool stop() override;
        bool seek(cadenza_tick_t tick) override;
        bool setLoopRegion(cadenza_tick_t startTick, std::optional<cadenza_tick_t> endTick) override;
        bool setLoopEnabled(bool enabled) override;
        bool setMixerState(cadenza_track_index_t trackIndex, const MixerState& state) override;

        StatusCode processAudio(float** outputs, uint32_t channelCount, int32_t frameCount) override;

        double playheadTick() const override { return playhead_tick_.load(std::memory_order_acquire); }
        TransportState transportState() const override { return transport_state_.load(std::memory_order_acquire); }
        size_t activeVoiceCount() const override { return active_voices_.load(std::memory_order_acquire); }
        size_t activeVoiceCount(cadenza_track_index_t trackIndex) const override;
        TrackLevel trackLevel(cadenza_track_index_t trackIndex) const override;
        EngineStatistics statistics() const override;
    };

    std::unique_ptr<RenderEngine> RenderEngine::create(const EngineConfiguration& configuration,
                                                       std::shared_ptr<ProcessorRegistry> registry) {
        auto error = configuration.validate();
        if (!error.empty()) {
            Logger::global()->logError("%s: %s", errorKindName(ErrorKind::ConfigurationError), error.c_str());
            return nullptr;
        }
        if (!registry)
            registry = ProcessorRegistry::createWithBuiltins();
        return std::make_unique<RenderEngineImpl>(configuration, std::move(registry));
    }

    RenderEngineImpl::RenderEngineImpl(const EngineConfiguration& configuration, std::shared_ptr<ProcessorRegistry> registry) :
        config_(configuration),
        registry_(std::move(registry)),
        commands_(configuration.inputQueueCapacity),
        retired_(kRetiredSnapshotCapacity),
        voices_(configuration.voiceSettings()),
        mixer_(static_cast<uint32_t>(configuration.maxBlockFrames), configuration.clipMode, configuration.masterVolumeDb) {
        drained_.resize(config_.inputQueueCapacity);
        // forced note-offs for every sounding note plus one block of regular events
        events_.reserve(8192);
        voices_.bindTracks(nullptr);
        mixer_.bindTracks(nullptr, 0);
    }

    // Control thread -----------------------------------------------------------------------

    ArrangementLoadResult RenderEngineImpl::loadArrangement(std::shared_ptr<const ArrangementData> arrangement) {
        ArrangementLoadResult result;
        collectGarbage();

        if (!arrangement) {
            result.status = StatusCode::INVALID_STATE;
            result.error = "no arrangement given";
            return result;
        }
        if (arrangement->tracks.size() > static_cast<size_t>(kMaxTracks)) {
            result.status = StatusCode::INVALID_PARAMETER;
            result.error = std::format("arrangement '{}' has {} tracks, at most {} are supported",
                                       arrangement->name, arrangement->tracks.size(), kMaxTracks);
            Logger::global()->logError("%s: %s", errorKindName(ErrorKind::ConfigurationError), result.error.c_str());
            return result;
        }

        auto snapshot = std::make_shared<EngineSnapshot>();
        snapshot->arrangement = arrangement;
        snapshot->tracks.resize(arrangement->tracks.size());
        std::vector<bool> activeTracks(arrangement->tracks.size(), false);

        for (size_t t = 0; t < arrangement->tracks.size(); t++) {
            auto& configured = snapshot->tracks[t];
            auto configuration = registry_->configureTrack(arrangement->tracks[t], configured);
            if (!configuration.success) {
                Logger::global()->logWarning("%s: %s", errorKindName(ErrorKind::ConfigurationError), configuration.error.c_str());
                result.trackErrors.push_back({static_cast<cadenza_track_index_t>(t), configuration.status, configuration.error});
                configured = {};
                continue;
            }
            // Fresh stateful instances are not shared with the render thread yet.
            std::string prepareError;
            try {
                if (configured.source.processor && configured.source.processor->metadata().stateful)
                    configured.source.processor->prepare(config_.sampleRate, config_.maxBlockFrames);
                for (auto& e : configured.effects)
                    if (e.processor->metadata().stateful)
                        e.processor->prepare(config_.sampleRate, config_.maxBlockFrames);
            } catch (const std::exception& e) {
                prepareError = std::format("track {}: prepare failed: {}", t, e.what());
            } catch (...) {
                prepareError = std::format("track {}: prepare failed with a non-standard exception", t);
            }
            if (!prepareError.empty()) {
                Logger::global()->logWarning("%s: %s", errorKindName(ErrorKind::ConfigurationError), prepareError.c_str());
                result.trackErrors.push_back({static_cast<cadenza_track_index_t>(t), StatusCode::INVALID_STATE, prepareError});
                configured = {};
                continue;
            }
            snapshot->active[t] = 1;
            activeTracks[t] = true;
            result.activeTrackCount++;
        }
        snapshot->plan = std::make_shared<SchedulePlan>(arrangement, activeTracks);

        std::atomic_store_explicit(&pending_snapshot_, std::shared_ptr<const EngineSnapshot>(std::move(snapshot)),
                                   std::memory_order_release);
        result.success = true;
        if (!result.trackErrors.empty()) {
            result.status = result.trackErrors.front().status;
            result.error = std::format("{} of {} tracks could not be configured",
                                       result.trackErrors.size(), arrangement->tracks.size());
        }
        return result;
    }

    void RenderEngineImpl::closeArrangement() {
        std::atomic_store_explicit(&pending_snapshot_, std::shared_ptr<const EngineSnapshot>(std::make_shared<EngineSnapshot>()),
                                   std::memory_order_release);
    }

    size_t RenderEngineImpl::collectGarbage() {
        size_t freed = 0;
        std::shared_ptr<const EngineSnapshot> snapshot;
        while (retired_.try_dequeue(snapshot)) {
            snapshot.reset();
            freed++;
        }
        return freed;
    }

    bool RenderEngineImpl::enqueue(const EngineCommand& command) {
        if (commands_.try_enqueue(command))
            return true;
        dropped_input_events_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    bool RenderEngineImpl::enqueueLiveEvent(const LiveNoteEvent& event) {
        EngineCommand command;
        command.type = EngineCommand::Type::LiveNote;
        command.note = event;
        command.note.channel &= 0x0F;
        command.note.pitch &= 0x7F;
        command.note.velocity &= 0x7F;
        return enqueue(command);
    }

    size_t RenderEngineImpl::enqueueUmp(const uint32_t* ump, size_t sizeInBytes, cadenza_timestamp_t timestamp) {
        size_t accepted = 0;
        UmpInputDecoder::decode(ump, sizeInBytes, timestamp, [&](const LiveNoteEvent& e) {
            if (enqueueLiveEvent(e))
                accepted++;
        });
        return accepted;
    }

    bool RenderEngineImpl::play(cadenza_tick_t fromTick) {
        EngineCommand command;
        command.type = EngineCommand::Type::Play;
        command.tick = fromTick;
        return enqueue(command);
    }

    bool RenderEngineImpl::stop() {
        EngineCommand command;
        command.type = EngineCommand::Type::Stop;
        return enqueue(command);
    }

    bool RenderEngineImpl::seek(cadenza_tick_t tick) {
        EngineCommand command;
        command.type = EngineCommand::Type::Seek;
        command.tick = tick;
        return enqueue(command);
    }

    bool RenderEngineImpl::setLoopRegion(cadenza_tick_t startTick, std::optional<cadenza_tick_t> endTick) {
        if (endTick && *endTick <= startTick)
            return false;
        EngineCommand command;
        command.type = EngineCommand::Type::SetLoopRegion;
        command.tick = startTick;
        command.hasLoopEnd = endTick.has_value();
        command.loopEnd = endTick.value_or(0);
        return enqueue(command);
    }

    bool RenderEngineImpl::setLoopEnabled(bool enabled) {
        EngineCommand command;
        command.type = EngineCommand::Type::SetLoopEnabled;
        command.enabled = enabled;
        return enqueue(command);
    }

    bool RenderEngineImpl::setMixerState(cadenza_track_index_t trackIndex, const MixerState& state) {
        if (trackIndex < 0 || trackIndex >= kMaxTracks)
            return false;
        EngineCommand command;
        command.type = EngineCommand::Type::SetMixerState;
        command.trackIndex = trackIndex;
        command.mixer = state;
        return enqueue(command);
    }

    // Render thread ------------------------------------------------------------------------

    size_t RenderEngineImpl::trackCount() const {
        return current_ && current_->arrangement ? current_->tracks.size() : 0;
    }

    RenderContext RenderEngineImpl::renderContext(cadenza_tick_t tick) const {
        RenderContext context{
            .sampleRate = config_.sampleRate,
            .bpm = kDefaultBpm,
            .ticksPerQuarterNote = kDefaultTicksPerQuarterNote,
            .currentTick = tick,
            .trackIndex = -1,
        };
        if (auto& plan = scheduler_.plan()) {
            context.bpm = plan->tempoMap().bpmAtTick(tick);
            context.ticksPerQuarterNote = plan->tempoMap().ticksPerQuarterNote();
        }
        return context;
    }

    void RenderEngineImpl::retire(std::shared_ptr<const EngineSnapshot> snapshot) {
        if (!snapshot)
            return;
        // Falls back to freeing here when the control thread has not collected for a long time.
        if (!retired_.try_enqueue(std::move(snapshot)))
            Logger::global()->logWarning("retired snapshot queue is full; releasing a snapshot on the render thread");
    }

    void RenderEngineImpl::discardQueuedCommands() {
        while (commands_.try_dequeue_bulk(drained_.data(), drained_.size()) > 0) {
        }
    }

    void RenderEngineImpl::adoptSnapshot() {
        auto next = std::atomic_exchange_explicit(&pending_snapshot_, std::shared_ptr<const EngineSnapshot>{},
                                                  std::memory_order_acq_rel);
        if (!next)
            return;

        // Note indices of the sounding notes belong to the outgoing snapshot.
        events_.clear();
        if (next->arrangement) {
            scheduler_.plan(next->plan, events_);
            dispatch(events_);
        } else {
            scheduler_.stop(events_);
            scheduler_.plan(nullptr, events_);
            events_.clear();
            voices_.clearAll();
            discardQueuedCommands();
        }

        auto count = next->arrangement ? next->tracks.size() : 0;
        voices_.clearTracksFrom(static_cast<cadenza_track_index_t>(count));
        voices_.bindTracks(&next->tracks);
        mixer_.bindTracks(&next->tracks, count);
        for (size_t t = 0; t < count; t++)
            mixer_.mixerState(static_cast<cadenza_track_index_t>(t), next->arrangement->tracks[t].mixer);
        mixer_.resetEffects();

        retire(std::move(current_));
        current_ = std::move(next);
    }

    void RenderEngineImpl::applyLiveNote(const LiveNoteEvent& note) {
        if (!current_ || !current_->arrangement)
            return;
        std::array<MixerState, kMaxTracks> mixers;
        auto count = trackCount();
        for (size_t t = 0; t < count; t++)
            mixers[t] = mixer_.mixerState(static_cast<cadenza_track_index_t>(t));

        bool isNoteOn = note.isNoteOn && note.velocity > 0;
        auto context = renderContext(scheduler_.currentTick());
        LiveInputRouter::route(note, mixers.data(), current_->active, count, [&](cadenza_track_index_t track) {
            if (isNoteOn)
                voices_.noteOn(track, -1, note.pitch, note.velocity, 0.0, 0, context);
            else
                voices_.noteOff(track, -1, note.pitch, 0);
        });
    }

    void RenderEngineImpl::applyCommands() {
        auto count = commands_.try_dequeue_bulk(drained_.data(), drained_.size());
        if (count == 0)
            return;

        // A stop discards the live notes queued before it.
        size_t firstKept = 0;
        for (size_t i = 0; i < count; i++)
            if (drained_[i].type == EngineCommand::Type::Stop)
                firstKept = i;

        for (size_t i = 0; i < count; i++) {
            auto& command = drained_[i];
            events_.clear();
            switch (command.type) {
            case EngineCommand::Type::LiveNote:
                if (i >= firstKept)
                    applyLiveNote(command.note);
                break;
            case EngineCommand::Type::Play:
                scheduler_.play(command.tick, events_);
                dispatch(events_);
                break;
            case EngineCommand::Type::Stop:
                scheduler_.stop(events_);
                voices_.clearAll();
                mixer_.resetEffects();
                break;
            case EngineCommand::Type::Seek:
                scheduler_.seek(command.tick, events_);
                voices_.cutAll(0);
                mixer_.resetEffects();
                break;
            case EngineCommand::Type::SetLoopRegion: {
                std::optional<cadenza_tick_t> end;
                if (command.hasLoopEnd)
                    end = command.loopEnd;
                if (!scheduler_.setLoopRegion(command.tick, end))
                    Logger::global()->logWarning("loop region %lld..%lld ignored: end must be after start",
                                                 static_cast<long long>(command.tick), static_cast<long long>(command.loopEnd));
                break;
            }
            case EngineCommand::Type::SetLoopEnabled:
                scheduler_.setLoopEnabled(command.enabled);
                break;
            case EngineCommand::Type::SetMixerState:
                mixer_.mixerState(command.trackIndex, command.mixer);
                break;
            }
        }
        events_.clear();
    }

    void RenderEngineImpl::dispatch(std::vector<ScheduledEvent>& events) {
        for (auto& e : events) {
            switch (e.type) {
            case ScheduledEvent::Type::NoteOn:
                voices_.noteOn(e.trackIndex, e.noteIndex, e.pitch, e.velocity, e.durationSeconds, e.frameOffset,
                               renderContext(e.tick));
                break;
            case ScheduledEvent::Type::NoteOff:
                voices_.noteOff(e.trackIndex, e.noteIndex, e.pitch, e.frameOffset);
                break;
            case ScheduledEvent::Type::LoopJump:
                // Nothing from the previous pass may sound after the jump.
                voices_.cutAll(e.frameOffset);
                mixer_.resetEffects();
                break;
            }
        }
        events.clear();
    }

    void RenderEngineImpl::renderSlice(float** outputs, uint32_t channelCount, uint32_t outputOffset, int32_t frames) {
        adoptSnapshot();
        applyCommands();

        auto context = renderContext(scheduler_.currentTick());
        events_.clear();
        scheduler_.advance(frames, config_.sampleRate, events_);
        dispatch(events_);

        voices_.extend(frames, context);
        mixer_.beginBlock(frames);
        voices_.render(frames, mixer_.trackBuffers(), mixer_.trackSignal());
        mixer_.processEffects(frames, context);
        mixer_.mix(outputs, channelCount, outputOffset, frames);
    }

    void RenderEngineImpl::publishObservers() {
        playhead_tick_.store(scheduler_.position(), std::memory_order_release);
        transport_state_.store(scheduler_.state(), std::memory_order_release);

        std::array<uint32_t, kMaxTracks> perTrack{};
        uint32_t total = 0;
        voices_.forEachVoice([&](const LiveVoice& v) {
            total++;
            if (v.trackIndex >= 0 && v.trackIndex < kMaxTracks)
                perTrack[v.trackIndex]++;
        });
        active_voices_.store(total, std::memory_order_release);
        for (size_t t = 0; t < perTrack.size(); t++)
            track_voices_[t].store(perTrack[t], std::memory_order_release);

        auto& stats = voices_.statistics();
        render_failures_.store(stats.renderFailures + mixer_.effectFailures(), std::memory_order_release);
        voice_evictions_.store(stats.evictions, std::memory_order_release);
        underruns_.store(stats.underruns, std::memory_order_release);
        source_render_calls_.store(stats.sourceRenderCalls, std::memory_order_release);
    }

    StatusCode RenderEngineImpl::processAudio(float** outputs, uint32_t channelCount, int32_t frameCount) {
        auto startTime = std::chrono::steady_clock::now();

        if (!outputs || channelCount == 0)
            return StatusCode::INVALID_STATE;
        if (frameCount <= 0)
            return StatusCode::OK;

        for (int32_t offset = 0; offset < frameCount; offset += config_.maxBlockFrames) {
            auto frames = std::min(frameCount - offset, config_.maxBlockFrames);
            renderSlice(outputs, channelCount, static_cast<uint32_t>(offset), frames);
        }
        publishObservers();
        blocks_rendered_.fetch_add(1, std::memory_order_relaxed);

        auto endTime = std::chrono::steady_clock::now();
        auto elapsedMicros = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime).count();
        double availableTimeMicros = static_cast<double>(frameCount) / config_.sampleRate * 1000000.0;
        if (static_cast<double>(elapsedMicros) > availableTimeMicros) {
            timing_violations_.fetch_add(1, std::memory_order_relaxed);
            Logger::global()->logWarning(
                "%s: processed %d frames in %.2f us (available: %.2f us, load: %.1f%%)",
                errorKindName(ErrorKind::TimingViolation),
                frameCount,
                static_cast<double>(elapsedMicros),
                availableTimeMicros,
                static_cast<double>(elapsedMicros) / availableTimeMicros * 100.0);
        }
        return StatusCode::OK;
    }

    // Observers ----------------------------------------------------------------------------

    size_t RenderEngineImpl::activeVoiceCount(cadenza_track_index_t trackIndex) const {
        if (trackIndex < 0 || trackIndex >= kMaxTracks)
            return 0;
        return track_voices_[trackIndex].load(std::memory_order_acquire);
    }

    TrackLevel RenderEngineImpl::trackLevel(cadenza_track_index_t trackIndex) const {
        if (trackIndex < 0 || trackIndex >= kMaxTracks)
            return {};
        return mixer_.level(trackIndex);
    }

    EngineStatistics RenderEngineImpl::statistics() const {
        return EngineStatistics{
            .renderFailures = render_failures_.load(std::memory_order_acquire),
            .timingViolations = timing_violations_.load(std::memory_order_acquire),
            .voiceEvictions = voice_evictions_.load(std::memory_order_acquire),
            .droppedInputEvents = dropped_input_events_.load(std::memory_order_acquire),
            .underruns = underruns_.load(std::memory_order_acquire),
            .sourceRenderCalls = source_render_calls_.load(std::memory_order_acquire),
            .blocksRendered = blocks_rendered_.load(std::memory_order_acquire),
        };
    }

}
