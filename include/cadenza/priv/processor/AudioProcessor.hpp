#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "../common.hpp"
#include "ProcessorMetadata.hpp"

namespace cadenza {

    // Per-voice scratch that a source processor uses to resume synthesis where the
    // previous chunk ended (oscillator phases, filter memory, noise generator seed).
    // The voice owns it; the processor only reads and writes the slots.
    struct VoiceState {
        static constexpr size_t kSlotCount = 8;
        std::array<double, kSlotCount> slots{};
        uint64_t seed{0};
        bool initialized{false};

        void clear() {
            slots.fill(0.0);
            seed = 0;
            initialized = false;
        }
    };

    struct NoteContext {
        int32_t pitch{60};
        int32_t velocity{100};
        // 0 when the length is not known in advance (live input).
        double durationSeconds{0.0};
        uint64_t voiceId{0};
        // Number of samples already rendered for this voice; the first sample of this call is at that index.
        int64_t renderedSamples{0};
        VoiceState* state{nullptr};
    };

    struct RenderContext {
        double sampleRate{48000.0};
        double bpm{kDefaultBpm};
        int32_t ticksPerQuarterNote{kDefaultTicksPerQuarterNote};
        cadenza_tick_t currentTick{0};
        cadenza_track_index_t trackIndex{-1};
    };

    // The contract every source and effect implements.
    //
    // Sources are called with `input == nullptr` and a non-null `note`; effects are called with
    // `frames` samples of input and `note == nullptr`. Either way `output` receives exactly `frames`
    // samples. Sources must not scale by velocity; the voice engine does that when mixing.
    //
    // A processor reports failure by returning a non-OK status or by throwing. The engine isolates
    // the failure to the voice (or the track's effect chain) being rendered.
    class AudioProcessor {
    protected:
        AudioProcessor() = default;

    public:
        virtual ~AudioProcessor() = default;

        virtual const ProcessorMetadata& metadata() const = 0;

        // Called off the render thread before first use and whenever the sample rate changes.
        // Allocate delay lines and similar buffers here.
        virtual void prepare(double sampleRate, int32_t maxBlockFrames) {}

        virtual StatusCode process(const float* input, float* output, size_t frames,
                                   const ParameterValues& parameters,
                                   const NoteContext* note,
                                   const RenderContext& context) = 0;

        // Samples an effect keeps producing after its input went silent.
        virtual int64_t tailSamples(const ParameterValues& parameters, const RenderContext& context) {
            return 0;
        }

        // Drops internal state (delay lines, filter memory). Called on transport stop, seek and loop jumps.
        virtual void reset() {}
    };

    using ProcessorFactory = std::function<std::unique_ptr<AudioProcessor>()>;

}
