#include <cmath>
#include <numbers>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    const ProcessorMetadata& EqualizerEffect::metadata() const {
        static const ProcessorMetadata meta{
            .id = kId,
            .displayName = "3-Band EQ",
            .category = ProcessorCategory::Effect,
            .parameters = {
                {.name = "low_gain", .type = ParameterType::Float, .defaultValue = 1.0, .minValue = 0, .maxValue = 2, .unit = "x"},
                {.name = "mid_gain", .type = ParameterType::Float, .defaultValue = 1.0, .minValue = 0, .maxValue = 2, .unit = "x"},
                {.name = "high_gain", .type = ParameterType::Float, .defaultValue = 1.0, .minValue = 0, .maxValue = 2, .unit = "x"},
                {.name = "low_crossover", .type = ParameterType::Float, .defaultValue = 250.0, .minValue = 40, .maxValue = 1000, .unit = "Hz"},
                {.name = "high_crossover", .type = ParameterType::Float, .defaultValue = 4000.0, .minValue = 1000, .maxValue = 16000, .unit = "Hz"},
                {.name = "mix", .type = ParameterType::Float, .defaultValue = 1.0, .minValue = 0, .maxValue = 1},
            },
            .stateful = true,
        };
        return meta;
    }

    StatusCode EqualizerEffect::process(const float* input, float* output, size_t frames,
                                        const ParameterValues& parameters, const NoteContext* note,
                                        const RenderContext& context) {
        if (!input || context.sampleRate <= 0)
            return StatusCode::INVALID_STATE;

        auto lowGain = parameterAsDouble(parameters, "low_gain", 1);
        auto midGain = parameterAsDouble(parameters, "mid_gain", 1);
        auto highGain = parameterAsDouble(parameters, "high_gain", 1);
        auto mix = parameterAsDouble(parameters, "mix", 1);
        auto nyquist = context.sampleRate * 0.5;
        auto coefficient = [&](double cutoff) {
            return 1.0 - std::exp(-2.0 * std::numbers::pi * std::min(cutoff, nyquist * 0.95) / context.sampleRate);
        };
        double lowCoefficient = coefficient(parameterAsDouble(parameters, "low_crossover", 250));
        double highCoefficient = coefficient(parameterAsDouble(parameters, "high_crossover", 4000));

        for (size_t i = 0; i < frames; i++) {
            double x = input[i];
            low_memory_ += lowCoefficient * (x - low_memory_);
            high_memory_ += highCoefficient * (x - high_memory_);
            double low = low_memory_;
            double high = x - high_memory_;
            double mid = x - low - high;
            double y = lowGain * low + midGain * mid + highGain * high;
            output[i] = static_cast<float>(x * (1.0 - mix) + y * mix);
        }
        return StatusCode::OK;
    }

    void EqualizerEffect::reset() {
        low_memory_ = 0;
        high_memory_ = 0;
    }

}
