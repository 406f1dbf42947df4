#include <algorithm>
#include <cmath>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    const char* extensionPolicyName(ExtensionPolicy policy) {
        return policy == ExtensionPolicy::RoundRobin ? "round-robin" : "most-urgent";
    }

    static int64_t framesOf(double seconds, double sampleRate) {
        return std::max<int64_t>(0, static_cast<int64_t>(std::llround(seconds * sampleRate)));
    }

    VoiceEngine::VoiceEngine(const VoiceEngineSettings& settings) :
        settings_(settings),
        pre_render_frames_(std::max<int64_t>(1, framesOf(settings.preRenderSeconds, settings.sampleRate))),
        chunk_frames_(std::max<int64_t>(1, framesOf(settings.extensionChunkSeconds, settings.sampleRate))),
        lead_frames_(framesOf(settings.extensionLeadSeconds, settings.sampleRate)),
        release_frames_(std::max<int64_t>(1, framesOf(settings.releaseSeconds, settings.sampleRate))),
        retrigger_release_frames_(std::max<int64_t>(1, framesOf(settings.retriggerReleaseSeconds, settings.sampleRate))) {

        auto voiceCount = static_cast<size_t>(std::max(1, settings.maxVoices));
        // Every buffer is sized up front: the pre-render window plus one chunk covers the largest
        // unread span a voice can hold when it asks for another chunk.
        auto capacity = static_cast<size_t>(std::max(pre_render_frames_, lead_frames_ + settings.maxBlockFrames) + chunk_frames_);
        voices_.resize(voiceCount);
        for (auto& v : voices_)
            v.buffer.resize(capacity);
        candidates_.reserve(voiceCount);
    }

    const ConfiguredProcessor* VoiceEngine::sourceOf(cadenza_track_index_t trackIndex) const {
        if (!tracks_ || trackIndex < 0 || static_cast<size_t>(trackIndex) >= tracks_->size())
            return nullptr;
        auto& source = (*tracks_)[trackIndex].source;
        return source.processor ? &source : nullptr;
    }

    LiveVoice& VoiceEngine::allocate() {
        for (auto& v : voices_)
            if (!v.active())
                return v;

        // Pool exhausted: the quietest releasing voice goes first (least tail left), otherwise the oldest.
        LiveVoice* victim = nullptr;
        for (auto& v : voices_)
            if (v.state == VoiceLifecycle::Releasing && (!victim || v.unread() < victim->unread()))
                victim = &v;
        if (!victim)
            for (auto& v : voices_)
                if (!victim || v.id < victim->id)
                    victim = &v;

        stats_.evictions++;
        Logger::global()->logWarning("%s: polyphony limit %d reached, evicting voice %llu (track %d, pitch %d, %s)",
                                     errorKindName(ErrorKind::ResourceExhaustion), settings_.maxVoices,
                                     static_cast<unsigned long long>(victim->id), victim->trackIndex, victim->pitch,
                                     voiceLifecycleName(victim->state));
        victim->recycle();
        return *victim;
    }

    void VoiceEngine::fail(LiveVoice& voice, const char* reason) {
        stats_.renderFailures++;
        Logger::global()->logError("%s: voice %llu (track %d, pitch %d) stopped: %s",
                                   errorKindName(ErrorKind::RenderFailure), static_cast<unsigned long long>(voice.id),
                                   voice.trackIndex, voice.pitch, reason);
        voice.state = VoiceLifecycle::Finished;
        voice.recycle();
    }

    bool VoiceEngine::renderChunk(LiveVoice& voice, int64_t frames, const RenderContext& context) {
        auto source = sourceOf(voice.trackIndex);
        if (!source) {
            fail(voice, "track has no source processor");
            return false;
        }
        if (voice.freeSpace() < frames)
            voice.compact();
        frames = std::min(frames, voice.freeSpace());
        if (frames <= 0)
            return true;

        NoteContext note{
            .pitch = voice.pitch,
            .velocity = voice.velocity,
            .durationSeconds = voice.durationSeconds,
            .voiceId = voice.id,
            .renderedSamples = voice.writeCursor,
            .state = &voice.processorState,
        };
        auto ctx = context;
        ctx.trackIndex = voice.trackIndex;
        auto out = voice.at(voice.writeCursor);

        StatusCode status;
        try {
            status = source->processor->process(nullptr, out, static_cast<size_t>(frames), source->parameters, &note, ctx);
        } catch (const std::exception& e) {
            fail(voice, e.what());
            return false;
        } catch (...) {
            fail(voice, "non-standard exception thrown by the source processor");
            return false;
        }
        stats_.sourceRenderCalls++;
        voice.renderCalls++;
        if (status != StatusCode::OK) {
            fail(voice, statusCodeName(status));
            return false;
        }
        voice.writeCursor += frames;
        return true;
    }

    LiveVoice* VoiceEngine::noteOn(cadenza_track_index_t trackIndex, int32_t noteIndex, int32_t pitch, int32_t velocity,
                                   double durationSeconds, int32_t frameOffset, const RenderContext& context) {
        if (!sourceOf(trackIndex))
            return nullptr;

        // A repeated pitch on the same track cuts the previous voice short.
        for (auto& v : voices_)
            if (v.active() && v.trackIndex == trackIndex && v.pitch == pitch)
                release(v, frameOffset, retrigger_release_frames_);

        auto& voice = allocate();
        voice.recycle();
        voice.id = next_voice_id_++;
        voice.state = VoiceLifecycle::PreRendering;
        voice.trackIndex = trackIndex;
        voice.noteIndex = noteIndex;
        voice.pitch = std::clamp(pitch, 0, 127);
        voice.velocity = std::clamp(velocity, 0, 127);
        voice.durationSeconds = durationSeconds;
        voice.startDelayFrames = std::max(0, frameOffset);

        if (!renderChunk(voice, pre_render_frames_, context))
            return nullptr;
        voice.state = VoiceLifecycle::Sustaining;
        return &voice;
    }

    size_t VoiceEngine::noteOff(cadenza_track_index_t trackIndex, int32_t noteIndex, int32_t pitch, int32_t frameOffset) {
        size_t released = 0;
        for (auto& v : voices_) {
            if (!v.active() || v.state == VoiceLifecycle::Releasing || v.trackIndex != trackIndex)
                continue;
            bool matches = noteIndex >= 0 ? v.noteIndex == noteIndex : (v.noteIndex < 0 && v.pitch == pitch);
            if (!matches)
                continue;
            release(v, frameOffset, release_frames_);
            released++;
        }
        return released;
    }

    void VoiceEngine::release(LiveVoice& voice, int32_t frameOffset, int64_t releaseFrames) {
        if (!voice.active())
            return;
        auto start = voice.readCursor + std::max(0, frameOffset - voice.startDelayFrames);
        start = std::min(start, voice.writeCursor);
        auto length = std::min(releaseFrames, voice.writeCursor - start);

        // exp(-6t/T): about -52dB at the nominal release time
        for (int64_t i = 0; i < length; i++)
            *voice.at(start + i) *= static_cast<float>(std::exp(-6.0 * static_cast<double>(i) / static_cast<double>(releaseFrames)));

        voice.writeCursor = start + length;
        if (!voice.releaseStartSample || start < *voice.releaseStartSample)
            voice.releaseStartSample = start;
        voice.state = VoiceLifecycle::Releasing;
    }

    void VoiceEngine::cutAll(int32_t frameOffset) {
        for (auto& v : voices_) {
            if (!v.active())
                continue;
            auto end = v.readCursor + std::max(0, frameOffset - v.startDelayFrames);
            v.writeCursor = std::min(v.writeCursor, end);
            if (!v.releaseStartSample)
                v.releaseStartSample = v.writeCursor;
            v.state = VoiceLifecycle::Releasing;
            if (v.unread() <= 0) {
                v.state = VoiceLifecycle::Finished;
                v.recycle();
            }
        }
    }

    void VoiceEngine::clearTracksFrom(cadenza_track_index_t trackCount) {
        for (auto& v : voices_)
            if (v.active() && v.trackIndex >= trackCount)
                v.recycle();
    }

    void VoiceEngine::clearAll() {
        for (auto& v : voices_)
            if (v.state != VoiceLifecycle::Idle)
                v.recycle();
    }

    void VoiceEngine::extend(int32_t frames, const RenderContext& context) {
        candidates_.clear();
        for (int32_t i = 0; i < static_cast<int32_t>(voices_.size()); i++) {
            auto& v = voices_[i];
            if (v.state != VoiceLifecycle::Sustaining)
                continue;
            auto needed = v.readCursor + std::max(0, frames - v.startDelayFrames);
            if (v.writeCursor - needed < lead_frames_ || v.writeCursor < needed)
                candidates_.push_back(i);
        }
        if (candidates_.empty())
            return;

        if (settings_.extensionPolicy == ExtensionPolicy::MostUrgentFirst) {
            std::sort(candidates_.begin(), candidates_.end(), [this](int32_t a, int32_t b) {
                auto& va = voices_[a];
                auto& vb = voices_[b];
                if (va.unread() != vb.unread())
                    return va.unread() < vb.unread();
                return va.id < vb.id;
            });
        } else {
            auto n = voices_.size();
            auto cursor = round_robin_cursor_;
            std::sort(candidates_.begin(), candidates_.end(), [n, cursor](int32_t a, int32_t b) {
                return (a + n - cursor) % n < (b + n - cursor) % n;
            });
        }

        size_t budget = settings_.extensionBudgetPerBlock > 0
            ? static_cast<size_t>(settings_.extensionBudgetPerBlock)
            : candidates_.size();
        auto served = std::min(budget, candidates_.size());
        for (size_t i = 0; i < served; i++) {
            auto& v = voices_[candidates_[i]];
            if (renderChunk(v, chunk_frames_, context))
                stats_.extensionRenders++;
        }
        if (settings_.extensionPolicy == ExtensionPolicy::RoundRobin)
            round_robin_cursor_ = (static_cast<size_t>(candidates_[served - 1]) + 1) % voices_.size();
    }

    void VoiceEngine::render(int32_t frames, std::vector<std::vector<float>>& trackBuffers, std::vector<uint8_t>& trackSignal) {
        for (auto& v : voices_) {
            if (v.state != VoiceLifecycle::Sustaining && v.state != VoiceLifecycle::Releasing)
                continue;
            if (v.trackIndex < 0 || static_cast<size_t>(v.trackIndex) >= trackBuffers.size()) {
                v.recycle();
                continue;
            }

            auto skip = std::min(v.startDelayFrames, frames);
            v.startDelayFrames -= skip;
            auto wanted = static_cast<int64_t>(frames - skip);
            auto available = std::min(wanted, v.unread());
            if (available < wanted && v.state == VoiceLifecycle::Sustaining)
                stats_.underruns++;

            if (available > 0) {
                auto gain = static_cast<float>(v.velocity) / 127.0f;
                auto dst = trackBuffers[v.trackIndex].data() + skip;
                auto src = v.at(v.readCursor);
                for (int64_t i = 0; i < available; i++)
                    dst[i] += src[i] * gain;
                v.readCursor += available;
                trackSignal[v.trackIndex] = 1;
            }

            if (v.state == VoiceLifecycle::Releasing && v.unread() <= 0) {
                v.state = VoiceLifecycle::Finished;
                v.recycle();
            }
        }
    }

    size_t VoiceEngine::activeVoiceCount() const {
        return static_cast<size_t>(std::count_if(voices_.begin(), voices_.end(), [](const LiveVoice& v) { return v.active(); }));
    }

    size_t VoiceEngine::activeVoiceCount(cadenza_track_index_t trackIndex) const {
        return static_cast<size_t>(std::count_if(voices_.begin(), voices_.end(), [trackIndex](const LiveVoice& v) {
            return v.active() && v.trackIndex == trackIndex;
        }));
    }

}
