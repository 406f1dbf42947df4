#include <algorithm>
#include <cmath>

#include "cadenza/cadenza.hpp"

namespace cadenza {

    namespace {
        // seconds at size 1.0
        constexpr std::array<double, ReverbEffect::kCombCount> kCombSeconds{0.029, 0.037, 0.043, 0.047};
        constexpr std::array<double, ReverbEffect::kAllpassCount> kAllpassSeconds{0.005, 0.0017};
        constexpr double kAllpassGain = 0.5;

        double combFeedback(double decay) {
            return 0.7 + 0.28 * std::clamp(decay, 0.0, 1.0);
        }

        size_t delaySamples(double seconds, double sampleRate, size_t capacity) {
            return std::clamp<size_t>(static_cast<size_t>(seconds * sampleRate), 1, capacity - 1);
        }
    }

    const ProcessorMetadata& ReverbEffect::metadata() const {
        static const ProcessorMetadata meta{
            .id = kId,
            .displayName = "Reverb",
            .category = ProcessorCategory::Effect,
            .parameters = {
                {.name = "mix", .type = ParameterType::Float, .defaultValue = 0.2, .minValue = 0, .maxValue = 1},
                {.name = "size", .type = ParameterType::Float, .defaultValue = 1.0, .minValue = 0.1, .maxValue = kMaxSize,
                 .unit = "x", .description = "Scales the comb delay times"},
                {.name = "decay", .type = ParameterType::Float, .defaultValue = 0.6, .minValue = 0, .maxValue = 1},
                {.name = "damping", .type = ParameterType::Float, .defaultValue = 0.3, .minValue = 0, .maxValue = 1,
                 .description = "High-frequency loss in the feedback path; 0 keeps it bright"},
            },
            .stateful = true,
        };
        return meta;
    }

    void ReverbEffect::prepare(double sampleRate, int32_t maxBlockFrames) {
        if (sampleRate == line_sample_rate_ && !combs_[0].buffer.empty())
            return;
        for (size_t i = 0; i < kCombCount; i++)
            combs_[i].buffer.assign(static_cast<size_t>(std::ceil(kCombSeconds[i] * kMaxSize * sampleRate)) + 1, 0.0f);
        for (size_t i = 0; i < kAllpassCount; i++)
            allpasses_[i].buffer.assign(static_cast<size_t>(std::ceil(kAllpassSeconds[i] * sampleRate)) + 1, 0.0f);
        line_sample_rate_ = sampleRate;
        reset();
    }

    StatusCode ReverbEffect::process(const float* input, float* output, size_t frames,
                                     const ParameterValues& parameters, const NoteContext* note,
                                     const RenderContext& context) {
        if (!input || context.sampleRate <= 0)
            return StatusCode::INVALID_STATE;
        if (combs_[0].buffer.empty() || line_sample_rate_ != context.sampleRate) {
            Logger::global()->logDiagnostic("Reverb lines allocated on the render thread (prepare() was not called)");
            prepare(context.sampleRate, static_cast<int32_t>(frames));
        }

        auto mix = parameterAsDouble(parameters, "mix", 0.2);
        auto size = std::clamp(parameterAsDouble(parameters, "size", 1.0), 0.1, kMaxSize);
        auto feedback = combFeedback(parameterAsDouble(parameters, "decay", 0.6));
        auto damping = std::clamp(parameterAsDouble(parameters, "damping", 0.3), 0.0, 1.0);

        std::array<size_t, kCombCount> combDelay;
        for (size_t c = 0; c < kCombCount; c++)
            combDelay[c] = delaySamples(kCombSeconds[c] * size, context.sampleRate, combs_[c].buffer.size());
        std::array<size_t, kAllpassCount> allpassDelay;
        for (size_t a = 0; a < kAllpassCount; a++)
            allpassDelay[a] = delaySamples(kAllpassSeconds[a], context.sampleRate, allpasses_[a].buffer.size());

        for (size_t i = 0; i < frames; i++) {
            double dry = input[i];
            double wet = 0;
            for (size_t c = 0; c < kCombCount; c++) {
                auto& line = combs_[c];
                auto n = line.buffer.size();
                double delayed = line.buffer[(line.position + n - combDelay[c]) % n];
                line.filter = delayed * (1.0 - damping) + line.filter * damping;
                line.buffer[line.position] = static_cast<float>(dry + line.filter * feedback);
                line.position = (line.position + 1) % n;
                wet += delayed;
            }
            wet /= static_cast<double>(kCombCount);

            for (size_t a = 0; a < kAllpassCount; a++) {
                auto& line = allpasses_[a];
                auto n = line.buffer.size();
                double delayed = line.buffer[(line.position + n - allpassDelay[a]) % n];
                double stored = wet + delayed * kAllpassGain;
                line.buffer[line.position] = static_cast<float>(stored);
                line.position = (line.position + 1) % n;
                wet = delayed - stored * kAllpassGain;
            }
            output[i] = static_cast<float>(dry * (1.0 - mix) + wet * mix);
        }
        return StatusCode::OK;
    }

    int64_t ReverbEffect::tailSamples(const ParameterValues& parameters, const RenderContext& context) {
        auto size = std::clamp(parameterAsDouble(parameters, "size", 1.0), 0.1, kMaxSize);
        auto feedback = combFeedback(parameterAsDouble(parameters, "decay", 0.6));
        // passes through the longest comb until it is below -60dB
        double passes = std::log(0.001) / std::log(feedback);
        double seconds = kCombSeconds.back() * size * passes + kAllpassSeconds[0] + kAllpassSeconds[1];
        return static_cast<int64_t>(std::ceil(seconds * context.sampleRate));
    }

    void ReverbEffect::reset() {
        for (auto& line : combs_) {
            std::fill(line.buffer.begin(), line.buffer.end(), 0.0f);
            line.position = 0;
            line.filter = 0;
        }
        for (auto& line : allpasses_) {
            std::fill(line.buffer.begin(), line.buffer.end(), 0.0f);
            line.position = 0;
            line.filter = 0;
        }
    }

}
