#include <algorithm>
#include <cmath>
#include <cstring>
#include <numbers>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    const char* clipModeName(ClipMode mode) {
        return mode == ClipMode::Soft ? "soft" : "hard";
    }

    double decibelsToGain(double db) {
        return std::pow(10.0, db / 20.0);
    }

    TrackMixer::TrackMixer(uint32_t maxBlockFrames, ClipMode clipMode, double masterVolumeDb) :
        max_block_frames(maxBlockFrames),
        clip_mode(clipMode),
        master_gain(decibelsToGain(masterVolumeDb)) {
        track_buffers_.resize(kMaxTracks);
        for (auto& b : track_buffers_)
            b.resize(max_block_frames);
        track_signal_.resize(kMaxTracks);
        effect_scratch_.resize(max_block_frames);
    }

    void TrackMixer::bindTracks(const std::vector<ConfiguredTrack>* tracks, size_t trackCount) {
        tracks_ = tracks;
        track_count_ = std::min<size_t>(trackCount, kMaxTracks);
        tail_remaining_.fill(0);
        chain_failing_.fill(0);
    }

    bool TrackMixer::mixerState(cadenza_track_index_t trackIndex, const MixerState& state) {
        if (trackIndex < 0 || trackIndex >= kMaxTracks)
            return false;
        auto s = state;
        s.pan = std::clamp(s.pan, -1.0, 1.0);
        s.midiChannel = std::clamp(s.midiChannel, 0, 15);
        s.noteRangeMin = std::clamp(s.noteRangeMin, 0, 127);
        s.noteRangeMax = std::clamp(s.noteRangeMax, 0, 127);
        mixer_states_[trackIndex] = s;
        return true;
    }

    void TrackMixer::beginBlock(int32_t frames) {
        auto n = static_cast<size_t>(std::min<int32_t>(frames, static_cast<int32_t>(max_block_frames)));
        for (size_t t = 0; t < track_count_; t++)
            std::fill_n(track_buffers_[t].begin(), n, 0.0f);
        std::fill(track_signal_.begin(), track_signal_.end(), 0);
    }

    // Counts a chain failure. Returns true when it starts a new failure run and should be logged.
    bool TrackMixer::markChainFailed(size_t trackIndex) {
        effect_failures_++;
        if (chain_failing_[trackIndex])
            return false;
        chain_failing_[trackIndex] = 1;
        return true;
    }

    bool TrackMixer::runEffectChain(size_t trackIndex, int32_t frames, const RenderContext& context) {
        auto& chain = (*tracks_)[trackIndex].effects;
        auto& bus = track_buffers_[trackIndex];
        auto ctx = context;
        ctx.trackIndex = static_cast<cadenza_track_index_t>(trackIndex);

        for (auto& effect : chain) {
            StatusCode status;
            try {
                status = effect.processor->process(bus.data(), effect_scratch_.data(), static_cast<size_t>(frames),
                                                   effect.parameters, nullptr, ctx);
            } catch (const std::exception& e) {
                if (markChainFailed(trackIndex))
                    Logger::global()->logError("%s: effect %s on track %zu threw: %s", errorKindName(ErrorKind::RenderFailure),
                                               effect.processor->metadata().id.c_str(), trackIndex, e.what());
                return false;
            } catch (...) {
                if (markChainFailed(trackIndex))
                    Logger::global()->logError("%s: effect %s on track %zu threw a non-standard exception",
                                               errorKindName(ErrorKind::RenderFailure), effect.processor->metadata().id.c_str(), trackIndex);
                return false;
            }
            if (status != StatusCode::OK) {
                if (markChainFailed(trackIndex))
                    Logger::global()->logError("%s: effect %s on track %zu returned %s", errorKindName(ErrorKind::RenderFailure),
                                               effect.processor->metadata().id.c_str(), trackIndex, statusCodeName(status));
                return false;
            }
            std::copy_n(effect_scratch_.begin(), frames, bus.begin());
        }
        if (chain_failing_[trackIndex]) {
            chain_failing_[trackIndex] = 0;
            Logger::global()->logInfo("effect chain on track %zu recovered", trackIndex);
        }
        return true;
    }

    bool TrackMixer::chainTail(size_t trackIndex, const RenderContext& context, int64_t& tail) {
        tail = 0;
        for (auto& effect : (*tracks_)[trackIndex].effects) {
            try {
                tail = std::max(tail, effect.processor->tailSamples(effect.parameters, context));
            } catch (const std::exception& e) {
                if (markChainFailed(trackIndex))
                    Logger::global()->logError("%s: tail query of effect %s on track %zu threw: %s", errorKindName(ErrorKind::RenderFailure),
                                               effect.processor->metadata().id.c_str(), trackIndex, e.what());
                return false;
            } catch (...) {
                if (markChainFailed(trackIndex))
                    Logger::global()->logError("%s: tail query of effect %s on track %zu threw a non-standard exception",
                                               errorKindName(ErrorKind::RenderFailure), effect.processor->metadata().id.c_str(), trackIndex);
                return false;
            }
        }
        return true;
    }

    void TrackMixer::processEffects(int32_t frames, const RenderContext& context) {
        if (!tracks_)
            return;
        for (size_t t = 0; t < track_count_ && t < tracks_->size(); t++) {
            auto& chain = (*tracks_)[t].effects;
            if (chain.empty())
                continue;
            if (track_signal_[t]) {
                int64_t tail = 0;
                if (!chainTail(t, context, tail)) {
                    // dry signal passes through
                    tail_remaining_[t] = 0;
                    continue;
                }
                tail_remaining_[t] = tail;
            } else if (tail_remaining_[t] <= 0) {
                continue;
            } else {
                tail_remaining_[t] = std::max<int64_t>(0, tail_remaining_[t] - frames);
            }

            // A failing chain is bypassed for this block; the dry signal passes through.
            if (!runEffectChain(t, frames, context))
                tail_remaining_[t] = 0;
            track_signal_[t] = 1;
        }
    }

    void TrackMixer::mix(float** outputs, uint32_t channelCount, uint32_t outputOffset, int32_t frames) {
        for (uint32_t ch = 0; ch < channelCount; ch++)
            std::memset(outputs[ch] + outputOffset, 0, sizeof(float) * frames);

        bool anySolo = false;
        for (size_t t = 0; t < track_count_; t++)
            anySolo |= mixer_states_[t].soloed;

        for (size_t t = 0; t < track_count_; t++) {
            auto& state = mixer_states_[t];
            auto& bus = track_buffers_[t];
            auto& meter = meters_[t];
            if (state.muted || (anySolo && !state.soloed) || !track_signal_[t]) {
                meter.peak.store(0, std::memory_order_relaxed);
                meter.rms.store(0, std::memory_order_relaxed);
                continue;
            }

            auto gain = static_cast<float>(decibelsToGain(state.volumeDb));
            // constant power: -3dB each side at center
            double angle = (state.pan + 1.0) * std::numbers::pi / 4.0;
            auto left = static_cast<float>(std::cos(angle)) * gain;
            auto right = static_cast<float>(std::sin(angle)) * gain;

            float peak = 0;
            double sumSquares = 0;
            for (int32_t i = 0; i < frames; i++) {
                auto s = bus[i] * gain;
                peak = std::max(peak, std::abs(s));
                sumSquares += static_cast<double>(s) * s;
            }
            meter.peak.store(peak, std::memory_order_relaxed);
            meter.rms.store(frames > 0 ? static_cast<float>(std::sqrt(sumSquares / frames)) : 0.0f, std::memory_order_relaxed);

            if (channelCount == 1) {
                auto dst = outputs[0] + outputOffset;
                for (int32_t i = 0; i < frames; i++)
                    dst[i] += bus[i] * gain;
            } else if (channelCount >= 2) {
                auto dstL = outputs[0] + outputOffset;
                auto dstR = outputs[1] + outputOffset;
                for (int32_t i = 0; i < frames; i++) {
                    dstL[i] += bus[i] * left;
                    dstR[i] += bus[i] * right;
                }
            }
        }

        auto masterGain = static_cast<float>(master_gain);
        for (uint32_t ch = 0; ch < channelCount && ch < 2; ch++) {
            auto buffer = outputs[ch] + outputOffset;
            for (int32_t i = 0; i < frames; i++) {
                auto s = buffer[i] * masterGain;
                buffer[i] = clip_mode == ClipMode::Soft ? std::tanh(s) : std::clamp(s, -1.0f, 1.0f);
            }
        }
    }

    void TrackMixer::resetEffects() {
        tail_remaining_.fill(0);
        if (!tracks_)
            return;
        for (size_t t = 0; t < tracks_->size(); t++) {
            for (auto& effect : (*tracks_)[t].effects) {
                try {
                    effect.processor->reset();
                } catch (const std::exception& e) {
                    effect_failures_++;
                    Logger::global()->logError("%s: reset of effect %s on track %zu threw: %s", errorKindName(ErrorKind::RenderFailure),
                                               effect.processor->metadata().id.c_str(), t, e.what());
                } catch (...) {
                    effect_failures_++;
                    Logger::global()->logError("%s: reset of effect %s on track %zu threw a non-standard exception",
                                               errorKindName(ErrorKind::RenderFailure), effect.processor->metadata().id.c_str(), t);
                }
            }
        }
    }

    TrackLevel TrackMixer::level(cadenza_track_index_t trackIndex) const {
        if (trackIndex < 0 || trackIndex >= kMaxTracks)
            return {};
        return {meters_[trackIndex].peak.load(std::memory_order_relaxed), meters_[trackIndex].rms.load(std::memory_order_relaxed)};
    }

}
