#include <algorithm>
#include <cmath>
#include <numbers>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    namespace {
        enum Slot {
            SWEEP_PHASE,
            COLOR_MEMORY,
            BAND_LOW,
            BAND_HIGH,
            HPF_INPUT,
            HPF_OUTPUT
        };

        // xorshift64*, mapped to [-1, 1)
        double nextNoise(uint64_t& seed) {
            seed ^= seed >> 12;
            seed ^= seed << 25;
            seed ^= seed >> 27;
            auto v = seed * 0x2545F4914F6CDD1DULL;
            return static_cast<double>(v >> 11) * (2.0 / 9007199254740992.0) - 1.0;
        }

        double onePoleCoefficient(double cutoff, double sampleRate) {
            return 1.0 - std::exp(-2.0 * std::numbers::pi * cutoff / sampleRate);
        }

        // Decay below -120dB counts as silence.
        constexpr double kSilenceLevel = 1e-6;
    }

    const ProcessorMetadata& NoiseDrum::metadata() const {
        static const ProcessorMetadata meta{
            .id = kId,
            .displayName = "Noise Drum",
            .category = ProcessorCategory::Source,
            .parameters = {
                {.name = "type", .type = ParameterType::Enum, .defaultValue = std::string{"DRUM"}, .enumValues = {"DRUM", "HI-HAT"},
                 .description = "DRUM is a pitched kick/tom, HI-HAT is high-passed noise"},
                {.name = "color", .type = ParameterType::Enum, .defaultValue = std::string{"WHITE"}, .enumValues = {"WHITE", "PINK", "BROWN"}},
                {.name = "pitch_hpf", .type = ParameterType::Float, .defaultValue = 60.0, .minValue = 20, .maxValue = 200, .unit = "Hz"},
                {.name = "length", .type = ParameterType::Float, .defaultValue = 0.3, .minValue = 0.05, .maxValue = 2, .unit = "s"},
                {.name = "gain", .type = ParameterType::Float, .defaultValue = 0.8, .minValue = 0, .maxValue = 1},
                {.name = "root_note", .type = ParameterType::Int, .defaultValue = int64_t{60}, .minValue = 0, .maxValue = 127},
                {.name = "transpose", .type = ParameterType::Int, .defaultValue = int64_t{0}, .minValue = -24, .maxValue = 24, .unit = "st"},
            },
        };
        return meta;
    }

    StatusCode NoiseDrum::process(const float* input, float* output, size_t frames,
                                  const ParameterValues& parameters, const NoteContext* note,
                                  const RenderContext& context) {
        if (!note || !note->state || context.sampleRate <= 0)
            return StatusCode::INVALID_STATE;

        bool hihat = parameterAsString(parameters, "type", "DRUM") == "HI-HAT";
        auto color = parameterAsString(parameters, "color", "WHITE");
        auto length = parameterAsDouble(parameters, "length", 0.3);
        auto gain = parameterAsDouble(parameters, "gain", 0.8);
        auto root = parameterAsDouble(parameters, "root_note", 60);
        auto transpose = parameterAsDouble(parameters, "transpose", 0);
        auto sr = context.sampleRate;
        auto nyquist = sr * 0.5;

        double pitch = parameterAsDouble(parameters, "pitch_hpf", 60) * std::pow(2.0, (note->pitch - root + transpose) / 12.0);
        double decayRate = hihat ? 12.0 : 6.0;

        auto& state = *note->state;
        auto& slots = state.slots;
        if (!state.initialized) {
            slots.fill(0.0);
            state.seed = (0x9E3779B97F4A7C15ULL ^ (note->voiceId * 0xBF58476D1CE4E5B9ULL) ^ static_cast<uint64_t>(note->pitch)) | 1;
            state.initialized = true;
        }

        double pinkCoefficient = onePoleCoefficient(std::min(2000.0, nyquist * 0.9), sr);
        double bandLowCoefficient = onePoleCoefficient(std::max(20.0, pitch * 0.5), sr);
        double bandHighCoefficient = onePoleCoefficient(std::min(nyquist * 0.95, pitch * 4.0), sr);
        double hpfCutoff = std::min(nyquist * 0.95, std::max(500.0, pitch));
        double hpfRc = 1.0 / (2.0 * std::numbers::pi * hpfCutoff);
        double hpfCoefficient = hpfRc / (hpfRc + 1.0 / sr);
        double sweepStart = pitch * 4.0;
        double sweepEnd = std::max(20.0, pitch);

        for (size_t i = 0; i < frames; i++) {
            double t = static_cast<double>(note->renderedSamples + static_cast<int64_t>(i)) / sr;
            double env = std::exp(-decayRate * t / length);
            if (env < kSilenceLevel) {
                output[i] = 0;
                continue;
            }

            double noise = nextNoise(state.seed);
            if (color == "PINK") {
                slots[COLOR_MEMORY] += pinkCoefficient * (noise - slots[COLOR_MEMORY]);
                noise = slots[COLOR_MEMORY] * 3.0;
            } else if (color == "BROWN") {
                slots[COLOR_MEMORY] = slots[COLOR_MEMORY] * 0.995 + noise * 0.05;
                noise = slots[COLOR_MEMORY];
            }

            double sample;
            if (hihat) {
                double hp = hpfCoefficient * (slots[HPF_OUTPUT] + noise - slots[HPF_INPUT]);
                slots[HPF_INPUT] = noise;
                slots[HPF_OUTPUT] = hp;
                sample = hp;
            } else {
                slots[BAND_LOW] += bandLowCoefficient * (noise - slots[BAND_LOW]);
                slots[BAND_HIGH] += bandHighCoefficient * (noise - slots[BAND_HIGH]);
                double band = slots[BAND_HIGH] - slots[BAND_LOW];

                double freq = sweepEnd + (sweepStart - sweepEnd) * std::exp(-8.0 * t / length);
                slots[SWEEP_PHASE] += freq / sr;
                slots[SWEEP_PHASE] -= std::floor(slots[SWEEP_PHASE]);
                sample = band * 0.7 + std::sin(2.0 * std::numbers::pi * slots[SWEEP_PHASE]) * 0.3;
            }
            output[i] = static_cast<float>(std::clamp(sample * env * gain, -1.0, 1.0));
        }
        return StatusCode::OK;
    }

}
