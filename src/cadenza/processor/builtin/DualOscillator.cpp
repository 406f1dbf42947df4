#include <algorithm>
#include <cmath>
#include <numbers>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    namespace {
        enum Slot {
            PHASE_1,
            PHASE_2,
            FILTER
        };

        enum class Waveform {
            Sine,
            Square,
            Saw,
            Triangle,
            None
        };

        Waveform waveformOf(std::string_view name) {
            if (name == "SINE") return Waveform::Sine;
            if (name == "SQUARE") return Waveform::Square;
            if (name == "SAW") return Waveform::Saw;
            if (name == "TRIANGLE") return Waveform::Triangle;
            return Waveform::None;
        }

        // phase is in cycles, [0, 1)
        double oscillate(Waveform waveform, double phase) {
            switch (waveform) {
                case Waveform::Sine: return std::sin(2.0 * std::numbers::pi * phase);
                case Waveform::Square: return phase < 0.5 ? 1.0 : -1.0;
                case Waveform::Saw: return 2.0 * phase - 1.0;
                case Waveform::Triangle: return 1.0 - 4.0 * std::abs(phase - 0.5);
                case Waveform::None: return 0.0;
            }
            return 0.0;
        }
    }

    const ProcessorMetadata& DualOscillator::metadata() const {
        static const std::vector<std::string> waveforms{"SINE", "SQUARE", "SAW", "TRIANGLE", "NONE"};
        static const ProcessorMetadata meta{
            .id = kId,
            .displayName = "Dual Oscillator",
            .category = ProcessorCategory::Source,
            .parameters = {
                {.name = "osc1_type", .type = ParameterType::Enum, .defaultValue = std::string{"SAW"}, .enumValues = waveforms},
                {.name = "osc2_type", .type = ParameterType::Enum, .defaultValue = std::string{"SINE"}, .enumValues = waveforms},
                {.name = "osc2_interval", .type = ParameterType::Int, .defaultValue = int64_t{0}, .minValue = -24, .maxValue = 24, .unit = "st"},
                {.name = "osc2_detune", .type = ParameterType::Float, .defaultValue = 10.0, .minValue = -50, .maxValue = 50, .unit = "cents"},
                {.name = "osc_mix", .type = ParameterType::Float, .defaultValue = 0.5, .minValue = 0, .maxValue = 1,
                 .description = "0 is oscillator 1 only, 1 is oscillator 2 only"},
                {.name = "filter_cutoff", .type = ParameterType::Float, .defaultValue = 5000.0, .minValue = 50, .maxValue = 12000, .unit = "Hz"},
                {.name = "attack", .type = ParameterType::Float, .defaultValue = 0.01, .minValue = 0.001, .maxValue = 2, .unit = "s"},
                {.name = "length", .type = ParameterType::Float, .defaultValue = 0.5, .minValue = 0.01, .maxValue = 5, .unit = "s",
                 .description = "Decay time from the attack peak down to the sustain level"},
                {.name = "sustain", .type = ParameterType::Float, .defaultValue = 0.6, .minValue = 0, .maxValue = 1},
                {.name = "gain", .type = ParameterType::Float, .defaultValue = 0.7, .minValue = 0, .maxValue = 1},
                {.name = "root_note", .type = ParameterType::Int, .defaultValue = int64_t{60}, .minValue = 0, .maxValue = 127},
                {.name = "transpose", .type = ParameterType::Int, .defaultValue = int64_t{0}, .minValue = -24, .maxValue = 24, .unit = "st"},
            },
        };
        return meta;
    }

    StatusCode DualOscillator::process(const float* input, float* output, size_t frames,
                                       const ParameterValues& parameters, const NoteContext* note,
                                       const RenderContext& context) {
        if (!note || !note->state || context.sampleRate <= 0)
            return StatusCode::INVALID_STATE;

        auto osc1 = waveformOf(parameterAsString(parameters, "osc1_type", "SAW"));
        auto osc2 = waveformOf(parameterAsString(parameters, "osc2_type", "SINE"));
        auto interval = parameterAsDouble(parameters, "osc2_interval", 0);
        auto detune = parameterAsDouble(parameters, "osc2_detune", 10);
        auto mix = parameterAsDouble(parameters, "osc_mix", 0.5);
        auto cutoff = parameterAsDouble(parameters, "filter_cutoff", 5000);
        auto attack = parameterAsDouble(parameters, "attack", 0.01);
        auto decay = parameterAsDouble(parameters, "length", 0.5);
        auto sustain = parameterAsDouble(parameters, "sustain", 0.6);
        auto gain = parameterAsDouble(parameters, "gain", 0.7);
        auto root = parameterAsDouble(parameters, "root_note", 60);
        auto transpose = parameterAsDouble(parameters, "transpose", 0);

        auto sr = context.sampleRate;
        double freq1 = 261.63 * std::pow(2.0, (note->pitch - root + transpose) / 12.0);
        double freq2 = freq1 * std::pow(2.0, (interval + detune / 100.0) / 12.0);
        double alpha = 1.0 - std::exp(-2.0 * std::numbers::pi * std::min(cutoff, sr * 0.45) / sr);

        auto& slots = note->state->slots;
        if (!note->state->initialized) {
            slots[PHASE_1] = 0;
            slots[PHASE_2] = 0;
            slots[FILTER] = 0;
            note->state->initialized = true;
        }
        double phase1 = slots[PHASE_1];
        double phase2 = slots[PHASE_2];
        double filtered = slots[FILTER];

        for (size_t i = 0; i < frames; i++) {
            double t = static_cast<double>(note->renderedSamples + static_cast<int64_t>(i)) / sr;
            double env = t < attack
                ? t / attack
                : sustain + (1.0 - sustain) * std::exp(-5.0 * (t - attack) / decay);

            double raw = (1.0 - mix) * oscillate(osc1, phase1) + mix * oscillate(osc2, phase2);
            filtered += alpha * (raw - filtered);
            output[i] = static_cast<float>(gain * env * filtered);

            phase1 += freq1 / sr;
            phase1 -= std::floor(phase1);
            phase2 += freq2 / sr;
            phase2 -= std::floor(phase2);
        }

        slots[PHASE_1] = phase1;
        slots[PHASE_2] = phase2;
        slots[FILTER] = filtered;
        return StatusCode::OK;
    }

}
