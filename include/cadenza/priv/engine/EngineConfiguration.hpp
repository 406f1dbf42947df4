#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "../common.hpp"
#include "../mixer/TrackMixer.hpp"
#include "../voice/VoiceEngine.hpp"

namespace cadenza {

    struct EngineConfiguration {
        double sampleRate{48000.0};
        int32_t maxBlockFrames{1024};
        uint32_t outputChannels{2};
        int32_t maxVoices{64};
        double preRenderSeconds{2.0};
        double extensionChunkSeconds{1.0};
        double extensionLeadSeconds{0.5};
        int32_t extensionBudgetPerBlock{8};
        ExtensionPolicy extensionPolicy{ExtensionPolicy::MostUrgentFirst};
        double releaseSeconds{0.3};
        double retriggerReleaseSeconds{0.05};
        uint32_t inputQueueCapacity{1024};
        ClipMode clipMode{ClipMode::Hard};
        double masterVolumeDb{0.0};

        // Empty when usable, otherwise a description of the first invalid setting.
        std::string validate() const;
        VoiceEngineSettings voiceSettings() const;

        // JSON keys are snake_case versions of the members. Missing keys keep their defaults.
        std::string toJson() const;
    };

    struct EngineConfigurationResult {
        bool success{false};
        StatusCode status{StatusCode::OK};
        std::string error{};
        EngineConfiguration configuration{};
    };

    class EngineConfigurationReader {
    public:
        static EngineConfigurationResult parse(std::string_view json);
        static EngineConfigurationResult read(const std::filesystem::path& file);
    };

    class EngineConfigurationWriter {
    public:
        static bool write(const EngineConfiguration& configuration, const std::filesystem::path& file);
    };

}
