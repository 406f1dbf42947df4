#pragma once

#include <array>
#include <vector>

#include "AudioProcessor.hpp"

namespace cadenza {

    // Two oscillators through a one-pole low-pass, with attack / decay-to-sustain envelope.
    // Oscillator phases and filter memory live in the voice's VoiceState, so consecutive
    // chunks of one voice join without a discontinuity.
    class DualOscillator : public AudioProcessor {
    public:
        static constexpr const char* kId = "DUAL_OSC";

        const ProcessorMetadata& metadata() const override;
        StatusCode process(const float* input, float* output, size_t frames,
                           const ParameterValues& parameters, const NoteContext* note,
                           const RenderContext& context) override;
    };

    class NoiseDrum : public AudioProcessor {
    public:
        static constexpr const char* kId = "NOISE_DRUM";

        const ProcessorMetadata& metadata() const override;
        StatusCode process(const float* input, float* output, size_t frames,
                           const ParameterValues& parameters, const NoteContext* note,
                           const RenderContext& context) override;
    };

    class DelayEffect : public AudioProcessor {
        std::vector<float> line_{};
        size_t write_position_{0};
        double line_sample_rate_{0};
        double tone_memory_{0};

    public:
        static constexpr const char* kId = "DELAY";
        static constexpr double kMaxDelaySeconds = 5.0;

        const ProcessorMetadata& metadata() const override;
        void prepare(double sampleRate, int32_t maxBlockFrames) override;
        StatusCode process(const float* input, float* output, size_t frames,
                           const ParameterValues& parameters, const NoteContext* note,
                           const RenderContext& context) override;
        int64_t tailSamples(const ParameterValues& parameters, const RenderContext& context) override;
        void reset() override;
    };

    class EqualizerEffect : public AudioProcessor {
        double low_memory_{0};
        double high_memory_{0};

    public:
        static constexpr const char* kId = "EQ";

        const ProcessorMetadata& metadata() const override;
        StatusCode process(const float* input, float* output, size_t frames,
                           const ParameterValues& parameters, const NoteContext* note,
                           const RenderContext& context) override;
        void reset() override;
    };

    // Four damped feedback combs summed into two series allpass diffusers.
    class ReverbEffect : public AudioProcessor {
    public:
        static constexpr const char* kId = "REVERB";
        static constexpr size_t kCombCount = 4;
        static constexpr size_t kAllpassCount = 2;
        static constexpr double kMaxSize = 2.0;

    private:
        struct DelayLine {
            std::vector<float> buffer{};
            size_t position{0};
            double filter{0};
        };
        std::array<DelayLine, kCombCount> combs_{};
        std::array<DelayLine, kAllpassCount> allpasses_{};
        double line_sample_rate_{0};

    public:
        const ProcessorMetadata& metadata() const override;
        void prepare(double sampleRate, int32_t maxBlockFrames) override;
        StatusCode process(const float* input, float* output, size_t frames,
                           const ParameterValues& parameters, const NoteContext* note,
                           const RenderContext& context) override;
        int64_t tailSamples(const ParameterValues& parameters, const RenderContext& context) override;
        void reset() override;
    };

    std::vector<ProcessorFactory> builtinProcessorFactories();

}
