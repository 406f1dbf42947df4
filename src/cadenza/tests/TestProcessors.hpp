#pragma once

#include <atomic>
#include <chrono>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <thread>

#include "cadenza/cadenza.hpp"

// Deterministic processors shared by the tests.
namespace cadenza_test {

    using namespace cadenza;

    // Unit sine whose phase lives in the voice state, so chunk seams are continuous.
    class SineSource : public AudioProcessor {
    public:
        static constexpr const char* kId = "TEST_SINE";
        std::atomic<int> calls{0};

        const ProcessorMetadata& metadata() const override {
            static const ProcessorMetadata meta{
                .id = kId,
                .displayName = "Test Sine",
                .category = ProcessorCategory::Source,
                .parameters = {
                    {.name = "frequency", .type = ParameterType::Float, .defaultValue = 440.0, .minValue = 1, .maxValue = 20000, .unit = "Hz"},
                },
            };
            return meta;
        }

        StatusCode process(const float* input, float* output, size_t frames, const ParameterValues& parameters,
                           const NoteContext* note, const RenderContext& context) override {
            calls++;
            auto frequency = parameterAsDouble(parameters, "frequency", 440.0);
            auto& phase = note->state->slots[0];
            auto increment = frequency / context.sampleRate;
            for (size_t i = 0; i < frames; i++) {
                output[i] = static_cast<float>(std::sin(2.0 * std::numbers::pi * phase));
                phase = std::fmod(phase + increment, 1.0);
            }
            return StatusCode::OK;
        }
    };

    // Renders silence until `throwFrom` calls have been made, then throws on every call.
    class ThrowingSource : public AudioProcessor {
    public:
        static constexpr const char* kId = "TEST_THROWING";
        std::atomic<int> calls{0};
        int throwFrom{0};

        const ProcessorMetadata& metadata() const override {
            static const ProcessorMetadata meta{
                .id = kId,
                .displayName = "Test Throwing Source",
                .category = ProcessorCategory::Source,
            };
            return meta;
        }

        StatusCode process(const float* input, float* output, size_t frames, const ParameterValues& parameters,
                           const NoteContext* note, const RenderContext& context) override {
            if (calls++ >= throwFrom)
                throw std::runtime_error("synthesis exploded");
            std::fill_n(output, frames, 0.0f);
            return StatusCode::OK;
        }
    };

    // Takes longer than any reasonable block to render.
    class SlowSource : public AudioProcessor {
    public:
        static constexpr const char* kId = "TEST_SLOW";

        const ProcessorMetadata& metadata() const override {
            static const ProcessorMetadata meta{
                .id = kId,
                .displayName = "Test Slow Source",
                .category = ProcessorCategory::Source,
            };
            return meta;
        }

        StatusCode process(const float* input, float* output, size_t frames, const ParameterValues& parameters,
                           const NoteContext* note, const RenderContext& context) override {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            std::fill_n(output, frames, 0.1f);
            return StatusCode::OK;
        }
    };

    // Pass-through effect with a fixed tail length, counting its calls.
    class FixedTailEffect : public AudioProcessor {
    public:
        static constexpr const char* kId = "TEST_TAIL";
        int calls{0};
        int resets{0};

        const ProcessorMetadata& metadata() const override {
            static const ProcessorMetadata meta{
                .id = kId,
                .displayName = "Test Tail",
                .category = ProcessorCategory::Effect,
                .parameters = {
                    {.name = "tail", .type = ParameterType::Int, .defaultValue = int64_t{128}, .minValue = 0, .maxValue = 1000000},
                },
                .stateful = true,
            };
            return meta;
        }

        StatusCode process(const float* input, float* output, size_t frames, const ParameterValues& parameters,
                           const NoteContext* note, const RenderContext& context) override {
            calls++;
            std::copy_n(input, frames, output);
            return StatusCode::OK;
        }

        int64_t tailSamples(const ParameterValues& parameters, const RenderContext& context) override {
            return parameterAsInt(parameters, "tail", 128);
        }

        void reset() override { resets++; }
    };

    class FailingEffect : public AudioProcessor {
    public:
        static constexpr const char* kId = "TEST_FAILING_EFFECT";

        const ProcessorMetadata& metadata() const override {
            static const ProcessorMetadata meta{
                .id = kId,
                .displayName = "Test Failing Effect",
                .category = ProcessorCategory::Effect,
            };
            return meta;
        }

        StatusCode process(const float* input, float* output, size_t frames, const ParameterValues& parameters,
                           const NoteContext* note, const RenderContext& context) override {
            std::fill_n(output, frames, 0.0f);
            return StatusCode::FAILED_TO_PROCESS;
        }
    };

    // Passes audio through but throws from the hooks selected by its flags.
    class ThrowingHooksEffect : public AudioProcessor {
    public:
        static constexpr const char* kId = "TEST_THROWING_HOOKS";
        bool throwOnTail{false};
        bool throwOnReset{false};
        int calls{0};

        const ProcessorMetadata& metadata() const override {
            static const ProcessorMetadata meta{
                .id = kId,
                .displayName = "Test Throwing Hooks",
                .category = ProcessorCategory::Effect,
                .stateful = true,
            };
            return meta;
        }

        StatusCode process(const float* input, float* output, size_t frames, const ParameterValues& parameters,
                           const NoteContext* note, const RenderContext& context) override {
            calls++;
            std::copy_n(input, frames, output);
            return StatusCode::OK;
        }

        int64_t tailSamples(const ParameterValues& parameters, const RenderContext& context) override {
            if (throwOnTail)
                throw std::runtime_error("tail");
            return 0;
        }

        void reset() override {
            if (throwOnReset)
                throw std::runtime_error("reset");
        }
    };

    // A stateful source whose prepare() always throws.
    class UnpreparableSource : public AudioProcessor {
    public:
        static constexpr const char* kId = "TEST_UNPREPARABLE";

        const ProcessorMetadata& metadata() const override {
            static const ProcessorMetadata meta{
                .id = kId,
                .displayName = "Test Unpreparable Source",
                .category = ProcessorCategory::Source,
                .stateful = true,
            };
            return meta;
        }

        void prepare(double sampleRate, int32_t maxBlockFrames) override {
            throw std::runtime_error("no resources for this sample rate");
        }

        StatusCode process(const float* input, float* output, size_t frames, const ParameterValues& parameters,
                           const NoteContext* note, const RenderContext& context) override {
            std::fill_n(output, frames, 0.0f);
            return StatusCode::OK;
        }
    };

    inline ConfiguredTrack configuredTrack(std::shared_ptr<AudioProcessor> source) {
        ConfiguredTrack track;
        track.source.processor = std::move(source);
        return track;
    }

    inline ScoredNote note(int32_t pitch, cadenza_tick_t start, cadenza_tick_t duration, int32_t velocity = 100) {
        ScoredNote n;
        n.pitch = pitch;
        n.startTick = start;
        n.durationTicks = duration;
        n.onVelocity = velocity;
        return n;
    }

}
