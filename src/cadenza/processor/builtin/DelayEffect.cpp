#include <algorithm>
#include <cmath>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    const ProcessorMetadata& DelayEffect::metadata() const {
        static const ProcessorMetadata meta{
            .id = kId,
            .displayName = "Delay",
            .category = ProcessorCategory::Effect,
            .parameters = {
                {.name = "delay_time", .type = ParameterType::Float, .defaultValue = 0.5, .minValue = 0.1, .maxValue = kMaxDelaySeconds, .unit = "s"},
                {.name = "feedback", .type = ParameterType::Float, .defaultValue = 0.5, .minValue = 0, .maxValue = 0.95},
                {.name = "mix", .type = ParameterType::Float, .defaultValue = 0.5, .minValue = 0, .maxValue = 1},
                {.name = "tone", .type = ParameterType::Float, .defaultValue = 0.7, .minValue = 0, .maxValue = 1,
                 .description = "Low-pass on the repeats; 1 leaves them unfiltered"},
                {.name = "pingpong", .type = ParameterType::Bool, .defaultValue = false,
                 .description = "Every other repeat is inverted"},
            },
            .stateful = true,
        };
        return meta;
    }

    void DelayEffect::prepare(double sampleRate, int32_t maxBlockFrames) {
        if (sampleRate == line_sample_rate_ && !line_.empty())
            return;
        line_.assign(static_cast<size_t>(std::ceil(kMaxDelaySeconds * sampleRate)) + 1, 0.0f);
        line_sample_rate_ = sampleRate;
        write_position_ = 0;
        tone_memory_ = 0;
    }

    StatusCode DelayEffect::process(const float* input, float* output, size_t frames,
                                    const ParameterValues& parameters, const NoteContext* note,
                                    const RenderContext& context) {
        if (!input || context.sampleRate <= 0)
            return StatusCode::INVALID_STATE;
        if (line_.empty() || line_sample_rate_ != context.sampleRate) {
            Logger::global()->logDiagnostic("Delay line allocated on the render thread (prepare() was not called)");
            prepare(context.sampleRate, static_cast<int32_t>(frames));
        }

        auto delaySamples = std::clamp<size_t>(
            static_cast<size_t>(parameterAsDouble(parameters, "delay_time", 0.5) * context.sampleRate),
            1, line_.size() - 1);
        auto feedback = std::clamp(parameterAsDouble(parameters, "feedback", 0.5), 0.0, 0.95);
        auto mix = parameterAsDouble(parameters, "mix", 0.5);
        auto tone = parameterAsDouble(parameters, "tone", 0.7);
        double feedbackSign = parameterAsBool(parameters, "pingpong", false) ? -1.0 : 1.0;
        double toneCoefficient = 0.1 + 0.9 * tone;
        auto size = line_.size();

        for (size_t i = 0; i < frames; i++) {
            auto readPosition = (write_position_ + size - delaySamples) % size;
            tone_memory_ += toneCoefficient * (line_[readPosition] - tone_memory_);
            double dry = input[i];
            line_[write_position_] = static_cast<float>(dry + tone_memory_ * feedback * feedbackSign);
            write_position_ = (write_position_ + 1) % size;
            output[i] = static_cast<float>(dry * (1.0 - mix) + tone_memory_ * mix);
        }
        return StatusCode::OK;
    }

    int64_t DelayEffect::tailSamples(const ParameterValues& parameters, const RenderContext& context) {
        auto delay = parameterAsDouble(parameters, "delay_time", 0.5);
        auto feedback = parameterAsDouble(parameters, "feedback", 0.5);
        // repeats needed to fall below -60dB
        double repeats = feedback > 0.0 ? std::min(std::log(0.001) / std::log(feedback), 100.0) : 1.0;
        return static_cast<int64_t>(delay * std::max(repeats, 1.0) * context.sampleRate);
    }

    void DelayEffect::reset() {
        std::fill(line_.begin(), line_.end(), 0.0f);
        write_position_ = 0;
        tone_memory_ = 0;
    }

}
